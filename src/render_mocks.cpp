#include "render_mocks.hpp"

#include "source_text.hpp"

#include <cctype>
#include <fmt/core.h>
#include <string>
#include <utility>

namespace makemock::render {
namespace {

bool is_space(char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

void skip_spaces(std::string_view &text) {
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
}

std::size_t identifier_length(std::string_view text, bool allow_scope) {
    std::size_t len = 0;
    while (len < text.size() && (is_identifier_char(text[len]) || (allow_scope && text[len] == ':'))) {
        ++len;
    }
    return len;
}

// Length of a balanced `<...>` group at the start of `text`, 0 if unbalanced.
std::size_t template_args_length(std::string_view text) {
    int depth = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '<') {
            ++depth;
        } else if (text[i] == '>') {
            --depth;
            if (depth == 0) {
                return i + 1;
            }
        }
    }
    return 0;
}

std::string join(const std::vector<std::string> &parts) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i != 0)
            out += ", ";
        out += parts[i];
    }
    return out;
}

} // namespace

std::string format_mock_method(const MethodSignature &method) {
    return fmt::format("MOCK_METHOD({}, {}, {}, ({}));", method.return_type, method.name, method.parameters, method.qualifiers);
}

std::vector<std::string> split_parameters(std::string_view parameters) {
    std::string_view inner = trim_view(parameters);
    if (!inner.empty() && inner.front() == '(') {
        inner.remove_prefix(1);
    }
    if (!inner.empty() && inner.back() == ')') {
        inner.remove_suffix(1);
    }

    std::vector<std::string> parts;
    std::string              current;
    int                      depth = 0;
    for (const char ch : inner) {
        switch (ch) {
        case '<':
        case '(':
        case '[':
            ++depth;
            current.push_back(ch);
            break;
        case '>':
        case ')':
        case ']':
            if (depth > 0) {
                --depth;
            }
            current.push_back(ch);
            break;
        case ',':
            if (depth == 0) {
                parts.push_back(std::move(current));
                current.clear();
                break;
            }
            [[fallthrough]];
        default: current.push_back(ch); break;
        }
    }
    parts.push_back(std::move(current));
    return parts;
}

std::optional<DelegatedParam> parse_parameter(std::string_view parameter) {
    std::string_view       cursor = trim_view(parameter);
    const std::string_view whole  = cursor;

    if (cursor.substr(0, 5) == "const" && cursor.size() > 5 && is_space(cursor[5])) {
        cursor.remove_prefix(5);
        skip_spaces(cursor);
    }

    const std::size_t token = identifier_length(cursor, true);
    if (token == 0) {
        return std::nullopt;
    }
    cursor.remove_prefix(token);
    if (!cursor.empty() && cursor.front() == '<') {
        const std::size_t args = template_args_length(cursor);
        if (args == 0) {
            return std::nullopt;
        }
        cursor.remove_prefix(args);
    }

    std::string_view after_type = cursor;
    skip_spaces(after_type);
    if (!after_type.empty() && (after_type.front() == '*' || after_type.front() == '&')) {
        while (!after_type.empty() && (after_type.front() == '*' || after_type.front() == '&')) {
            after_type.remove_prefix(1);
        }
        cursor = after_type;
    }

    DelegatedParam param;
    param.type = std::string(whole.substr(0, whole.size() - cursor.size()));
    if (param.type == "void") {
        return std::nullopt;
    }

    skip_spaces(cursor);
    const std::size_t name = identifier_length(cursor, false);
    param.name             = std::string(cursor.substr(0, name));
    cursor.remove_prefix(name);

    skip_spaces(cursor);
    if (!cursor.empty() && cursor.front() == '=') {
        cursor.remove_prefix(1);
        skip_spaces(cursor);
        if (cursor.empty() || cursor.front() != '0') {
            return std::nullopt;
        }
        cursor.remove_prefix(1);
        skip_spaces(cursor);
    }
    if (!cursor.empty()) {
        return std::nullopt;
    }
    return param;
}

std::string format_default_delegation(const MethodSignature &method) {
    std::vector<std::string> placeholders;
    std::vector<std::string> typed_params;
    std::vector<std::string> names;

    const auto parts = split_parameters(method.parameters);
    for (std::size_t index = 0; index < parts.size(); ++index) {
        auto param = parse_parameter(parts[index]);
        if (!param) {
            continue;
        }
        std::string name = param->name.empty() ? fmt::format("p{}", index) : std::move(param->name);
        typed_params.push_back(fmt::format("{} {}", param->type, name));
        names.push_back(std::move(name));
        placeholders.emplace_back("_");
    }

    return fmt::format("ON_CALL(*this, {0}({1})).WillByDefault(Invoke([]({2}) {{ return real->{0}({3}); }}));", method.name,
                       join(placeholders), join(typed_params), join(names));
}

} // namespace makemock::render

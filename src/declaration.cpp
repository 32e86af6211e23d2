// Implementation of the lexical declaration classifier

#include "declaration.hpp"

#include "source_text.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace makemock {
namespace {

bool is_space(char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

bool is_decoration(char ch) { return ch == '*' || ch == '&'; }

bool is_return_type_char(char ch) {
    return is_identifier_char(ch) || is_space(ch) || is_decoration(ch) || ch == ':' || ch == '<' || ch == '>' || ch == ',';
}

void skip_spaces(std::string_view &text) {
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
}

// Consume `word` when it starts `text` as a whole identifier.
bool consume_word(std::string_view &text, std::string_view word) {
    if (text.substr(0, word.size()) != word) {
        return false;
    }
    if (text.size() > word.size() && is_identifier_char(text[word.size()])) {
        return false;
    }
    text.remove_prefix(word.size());
    return true;
}

// `public:`, `protected:` and `private:` labels in front of a declaration.
bool consume_access_label(std::string_view &text) {
    for (std::string_view label : std::array{std::string_view("public"), std::string_view("protected"), std::string_view("private")}) {
        std::string_view cursor = text;
        if (!consume_word(cursor, label)) {
            continue;
        }
        skip_spaces(cursor);
        if (cursor.empty() || cursor.front() != ':' || (cursor.size() > 1 && cursor[1] == ':')) {
            return false;
        }
        cursor.remove_prefix(1);
        text = cursor;
        return true;
    }
    return false;
}

// `[[nodiscard]]` style attribute groups.
bool consume_attribute(std::string_view &text) {
    if (text.substr(0, 2) != "[[") {
        return false;
    }
    const std::size_t end = text.find("]]", 2);
    if (end == std::string_view::npos) {
        return false;
    }
    text.remove_prefix(end + 2);
    return true;
}

bool has_qualifier(const std::vector<std::string> &qualifiers, std::string_view word) {
    return std::find(qualifiers.begin(), qualifiers.end(), word) != qualifiers.end();
}

std::string strip_default_values(std::string_view inner) {
    std::string out;
    out.reserve(inner.size());
    for (std::size_t i = 0; i < inner.size(); ++i) {
        if (inner[i] != '=') {
            out.push_back(inner[i]);
            continue;
        }
        while (!out.empty() && out.back() == ' ') {
            out.pop_back();
        }
        while (i + 1 < inner.size() && inner[i + 1] != ',') {
            ++i;
        }
    }
    return out;
}

} // namespace

void for_each_statement(std::string_view text, const std::function<void(std::string_view)> &visit) {
    std::size_t start = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        if (ch == ';' || ch == '{' || ch == '}') {
            visit(text.substr(start, i - start));
            start = i + 1;
        }
    }
    visit(text.substr(start));
}

std::optional<Declarator> match_declarator(std::string_view statement) {
    std::string_view cursor = statement;
    skip_spaces(cursor);
    while (consume_access_label(cursor) || consume_attribute(cursor)) {
        skip_spaces(cursor);
    }

    Declarator decl;
    if (consume_word(cursor, "virtual")) {
        decl.is_virtual = true;
        skip_spaces(cursor);
    }

    const std::size_t open = cursor.find('(');
    if (open == std::string_view::npos) {
        return std::nullopt;
    }
    const std::string_view head = cursor.substr(0, open);

    std::size_t name_start = head.size();
    while (name_start > 0 && is_identifier_char(head[name_start - 1])) {
        --name_start;
    }
    if (name_start == head.size()) {
        return std::nullopt;
    }

    std::size_t type_end = name_start;
    while (type_end > 0 && (is_space(head[type_end - 1]) || is_decoration(head[type_end - 1]))) {
        --type_end;
    }
    if (type_end == name_start || type_end == 0) {
        return std::nullopt;
    }

    const std::string_view return_type = trim_view(head.substr(0, name_start));
    if (!std::all_of(return_type.begin(), return_type.end(), is_return_type_char)) {
        return std::nullopt;
    }

    const std::size_t close = cursor.find(')', open);
    if (close == std::string_view::npos) {
        return std::nullopt;
    }

    decl.return_type = std::string(return_type);
    decl.name        = std::string(head.substr(name_start));
    decl.parameters  = std::string(cursor.substr(open, close - open + 1));

    std::string_view trailer = cursor.substr(close + 1);
    while (true) {
        skip_spaces(trailer);
        std::size_t len = 0;
        while (len < trailer.size() && is_identifier_char(trailer[len])) {
            ++len;
        }
        if (len == 0) {
            break;
        }
        decl.qualifiers.emplace_back(trailer.substr(0, len));
        trailer.remove_prefix(len);
    }
    return decl;
}

std::optional<MethodSignature> classify(const Declarator &declarator) {
    const bool has_override = has_qualifier(declarator.qualifiers, "override");
    if (!declarator.is_virtual && !has_override) {
        return std::nullopt;
    }
    if (has_qualifier(declarator.qualifiers, "final")) {
        return std::nullopt;
    }

    std::vector<std::string> qualifiers;
    for (const auto &q : declarator.qualifiers) {
        if (!has_qualifier(qualifiers, q)) {
            qualifiers.push_back(q);
        }
    }
    if (!has_override) {
        qualifiers.emplace_back("override");
    }

    std::string joined;
    for (std::size_t i = 0; i < qualifiers.size(); ++i) {
        if (i != 0)
            joined += ", ";
        joined += qualifiers[i];
    }

    return MethodSignature{
        .return_type = declarator.return_type,
        .name        = declarator.name,
        .parameters  = normalize_parameters(declarator.parameters),
        .qualifiers  = std::move(joined),
    };
}

std::string normalize_parameters(std::string_view raw) {
    std::string_view trimmed = trim_view(raw);
    if (!trimmed.empty() && trimmed.front() == '(') {
        trimmed.remove_prefix(1);
    }
    if (!trimmed.empty() && trimmed.back() == ')') {
        trimmed.remove_suffix(1);
    }
    const std::string inner = strip_default_values(collapse_whitespace(trimmed));
    return "(" + std::string(trim_view(inner)) + ")";
}

std::vector<MethodSignature> extract_signatures(std::string_view text) {
    std::vector<MethodSignature> signatures;
    for_each_statement(text, [&](std::string_view statement) {
        const auto declarator = match_declarator(statement);
        if (!declarator) {
            return;
        }
        if (auto signature = classify(*declarator)) {
            signatures.push_back(std::move(*signature));
        }
    });
    return signatures;
}

} // namespace makemock

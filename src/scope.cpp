// Implementation of class scoping

#include "scope.hpp"

#include "source_text.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace makemock {
namespace {

enum class ScanPhase { Searching, AwaitingBrace, Collecting };

// Transient view of the target class body for one select_scope call.
struct ScopeWindow {
    ScanPhase phase    = ScanPhase::Searching;
    int       baseline = 0; // depth inside the class body
};

bool is_enum_class(std::string_view line, std::size_t keyword_pos) {
    const std::string_view before = trim_view(line.substr(0, keyword_pos));
    if (before.size() < 4 || before.substr(before.size() - 4) != "enum") {
        return false;
    }
    return before.size() == 4 || !is_identifier_char(before[before.size() - 5]);
}

std::string_view trim_right(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

// Offset of the `class`/`struct` keyword that directly names the identifier at
// `name_pos` (attribute groups may sit in between), or npos. Template
// parameters (`<class T`, `, class U`) and `enum class` do not count.
std::size_t class_keyword_before(std::string_view line, std::size_t name_pos) {
    std::string_view before = trim_right(line.substr(0, name_pos));
    while (before.size() >= 2 && before.substr(before.size() - 2) == "]]") {
        const std::size_t open = before.rfind("[[");
        if (open == std::string_view::npos) {
            return std::string_view::npos;
        }
        before = trim_right(before.substr(0, open));
    }

    std::size_t start = before.size();
    while (start > 0 && is_identifier_char(before[start - 1])) {
        --start;
    }
    const std::string_view keyword = before.substr(start);
    if (keyword != "class" && keyword != "struct") {
        return std::string_view::npos;
    }
    const std::string_view lead = trim_right(before.substr(0, start));
    if (!lead.empty() && (lead.back() == '<' || lead.back() == ',')) {
        return std::string_view::npos;
    }
    if (is_enum_class(line, start)) {
        return std::string_view::npos;
    }
    return start;
}

} // namespace

void BraceCounter::process(std::string_view fragment) {
    depth_ += static_cast<int>(std::count(fragment.begin(), fragment.end(), '{'));
    depth_ -= static_cast<int>(std::count(fragment.begin(), fragment.end(), '}'));
}

std::size_t find_class_header(std::string_view line, std::string_view class_name) {
    const std::string_view trimmed = trim_view(line);
    if (line.find('{') == std::string_view::npos && !trimmed.empty() && trimmed.back() == ';') {
        return std::string_view::npos;
    }
    std::size_t offset = 0;
    while (offset < line.size()) {
        const std::size_t found = find_word(line.substr(offset), class_name);
        if (found == std::string_view::npos) {
            break;
        }
        const std::size_t name_pos = offset + found;
        const std::size_t keyword  = class_keyword_before(line, name_pos);
        if (keyword != std::string_view::npos) {
            return keyword;
        }
        offset = name_pos + class_name.size();
    }
    return std::string_view::npos;
}

std::string select_scope(std::string_view full_text, const std::optional<std::string> &target_class) {
    return select_class_scope(full_text, target_class).text;
}

ScopeSelection select_class_scope(std::string_view full_text, const std::optional<std::string> &target_class) {
    if (!target_class) {
        return ScopeSelection{.text = std::string(full_text), .class_found = false};
    }

    BraceCounter counter;
    ScopeWindow  window;
    std::string  collected;

    for (std::string_view line : split_lines(full_text)) {
        std::string_view rest = line;

        if (window.phase == ScanPhase::Searching) {
            const std::size_t header = find_class_header(line, *target_class);
            if (header == std::string_view::npos) {
                counter.process(line);
                continue;
            }
            counter.process(line.substr(0, header));
            window.baseline = counter.depth() + 1;
            window.phase    = ScanPhase::AwaitingBrace;
            rest            = line.substr(header);
        }

        if (window.phase == ScanPhase::AwaitingBrace) {
            // Base clauses may continue on the following lines.
            const std::size_t brace = rest.find('{');
            if (brace == std::string_view::npos) {
                counter.process(rest);
                continue;
            }
            counter.process(rest.substr(0, brace + 1));
            window.phase = ScanPhase::Collecting;
            rest         = rest.substr(brace + 1);
        }

        for (const char ch : rest) {
            counter.process(std::string_view(&ch, 1));
            if (counter.depth() < window.baseline) {
                return ScopeSelection{.text = std::move(collected), .class_found = true};
            }
            collected.push_back(ch);
        }
        collected.push_back('\n');
    }
    return ScopeSelection{.text = std::move(collected), .class_found = window.phase != ScanPhase::Searching};
}

} // namespace makemock

// Implementation of lexical helpers

#include "source_text.hpp"

#include <cctype>

namespace makemock {

bool is_identifier_char(char ch) { return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_'; }

std::string_view trim_view(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

std::string collapse_whitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool in_space = false;
    for (const char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            if (!in_space) {
                out.push_back(' ');
            }
            in_space = true;
            continue;
        }
        in_space = false;
        out.push_back(ch);
    }
    return out;
}

std::size_t find_word(std::string_view text, std::string_view word) {
    if (word.empty()) {
        return std::string_view::npos;
    }
    std::size_t pos = 0;
    while ((pos = text.find(word, pos)) != std::string_view::npos) {
        const std::size_t end      = pos + word.size();
        const bool        left_ok  = pos == 0 || !is_identifier_char(text[pos - 1]);
        const bool        right_ok = end >= text.size() || !is_identifier_char(text[end]);
        if (left_ok && right_ok) {
            return pos;
        }
        ++pos;
    }
    return std::string_view::npos;
}

bool contains_word(std::string_view text, std::string_view word) { return find_word(text, word) != std::string_view::npos; }

std::string strip_comments_and_directives(std::string_view source) {
    enum class State { Code, LineComment, BlockComment, String, Char, Directive };

    std::string out;
    out.reserve(source.size());
    State state      = State::Code;
    bool  escape     = false;
    bool  line_start = true; // only whitespace seen since the last newline

    for (std::size_t i = 0; i < source.size(); ++i) {
        const char ch   = source[i];
        const char next = i + 1 < source.size() ? source[i + 1] : '\0';

        switch (state) {
        case State::Code:
            if (ch == '/' && next == '/') {
                state = State::LineComment;
                ++i;
                out += "  ";
                continue;
            }
            if (ch == '/' && next == '*') {
                state = State::BlockComment;
                ++i;
                out += "  ";
                continue;
            }
            if (ch == '#' && line_start) {
                state = State::Directive;
                out.push_back(' ');
                continue;
            }
            if (ch == '"') {
                state = State::String;
            } else if (ch == '\'') {
                state = State::Char;
            }
            out.push_back(ch);
            break;
        case State::LineComment:
            if (ch == '\n') {
                state = State::Code;
                out.push_back('\n');
            } else {
                out.push_back(' ');
            }
            break;
        case State::BlockComment:
            if (ch == '*' && next == '/') {
                state = State::Code;
                ++i;
                out += "  ";
            } else {
                out.push_back(ch == '\n' ? '\n' : ' ');
            }
            break;
        case State::String:
        case State::Char:
            out.push_back(ch);
            if (escape) {
                escape = false;
            } else if (ch == '\\') {
                escape = true;
            } else if ((state == State::String && ch == '"') || (state == State::Char && ch == '\'') || ch == '\n') {
                state = State::Code;
            }
            break;
        case State::Directive:
            // Backslash-newline continues the directive onto the next line.
            if (ch == '\\' && next == '\n') {
                out += " \n";
                ++i;
            } else if (ch == '\n') {
                state = State::Code;
                out.push_back('\n');
            } else {
                out.push_back(' ');
            }
            break;
        }

        if (ch == '\n') {
            line_start = true;
        } else if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
            line_start = false;
        }
    }
    return out;
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t                   start = 0;
    while (start < text.size()) {
        const std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

} // namespace makemock

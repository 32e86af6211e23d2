// Lexical helpers shared by scoping and declaration matching. No AST involved.
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace makemock {

bool is_identifier_char(char ch);

std::string_view trim_view(std::string_view text);

// Collapse every whitespace run into a single space.
std::string collapse_whitespace(std::string_view text);

// True when `word` occurs in `text` delimited by non-identifier characters.
bool contains_word(std::string_view text, std::string_view word);

// Offset of the first whole-word occurrence of `word`, npos when absent.
std::size_t find_word(std::string_view text, std::string_view word);

// Replace comments with whitespace and blank out preprocessor directive lines.
// Line breaks are kept so line-oriented scanning sees the same line count.
// String and character literals are copied untouched.
std::string strip_comments_and_directives(std::string_view source);

// Split on '\n'; a trailing newline does not produce an extra empty line.
std::vector<std::string_view> split_lines(std::string_view text);

} // namespace makemock

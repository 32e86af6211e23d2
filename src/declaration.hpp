// Lexical declaration classifier: statement splitting, declarator matching and
// the mocking policy. No Clang dependencies.
#pragma once

#include "model.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace makemock {

// Visit every statement of `text` in source order. Statements end at each
// ';', '{' or '}', so an inline body is cut at its first brace and only the
// declarator in front of it is seen.
void for_each_statement(std::string_view text, const std::function<void(std::string_view)> &visit);

// Match one statement against the declarator grammar:
//   [access labels] [virtual] return-type sep name(params) [qualifier words] ...
// where return-type is made of word characters, "::", "<>", ',', whitespace,
// '&' and '*', sep is whitespace and/or '&'/'*', and params end at the first
// ')'. Anything after the qualifier words is ignored.
std::optional<Declarator> match_declarator(std::string_view statement);

// Apply the mocking policy: keep virtual or override declarations, drop
// final ones, and make sure `override` is listed exactly once.
std::optional<MethodSignature> classify(const Declarator &declarator);

// Collapse whitespace, drop space just inside the parentheses and remove
// every `= <default>` clause up to the next ',' or the closing ')'.
std::string normalize_parameters(std::string_view raw);

// All accepted signatures of `text` in source order.
std::vector<MethodSignature> extract_signatures(std::string_view text);

} // namespace makemock

// Formatting of accepted signatures into googlemock statements.
#pragma once

#include "model.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace makemock::render {

// MOCK_METHOD(<return_type>, <name>, <parameters>, (<qualifiers>));
std::string format_mock_method(const MethodSignature &method);

// Parameter recovered from a normalized parameter list for delegation.
struct DelegatedParam {
    std::string type; // as written, e.g. "const char *"
    std::string name; // empty when the declaration left it unnamed
};

// Split a parameter list on top-level commas after removing the outer
// parentheses. Commas nested in <>, () or [] do not split.
std::vector<std::string> split_parameters(std::string_view parameters);

// Match `[const] type[<...>] [*&...] [name] [= 0]`; nullopt when the text
// does not fit (including an empty parameter and a lone `void`).
std::optional<DelegatedParam> parse_parameter(std::string_view parameter);

// ON_CALL(*this, <name>(_, ...)).WillByDefault(Invoke([](<params>) { return real-><name>(<args>); }));
// Parameters that do not parse are left out, but still take up their
// position when synthesizing `p<index>` names.
std::string format_default_delegation(const MethodSignature &method);

} // namespace makemock::render

// Shared model types for makemock
//
// These types are passed among scoping, classification and rendering
// components to describe accepted declarations and the run configuration.
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace makemock {

// Raw declarator match before the mocking policy is applied.
// - is_virtual: leading `virtual` keyword present
// - parameters: the parenthesized text as written (first `)` closes it)
// - qualifiers: trailing words in source order (const, override, final, ...)
struct Declarator {
    bool                     is_virtual = false;
    std::string              return_type;
    std::string              name;
    std::string              parameters;
    std::vector<std::string> qualifiers;
};

// Accepted, normalized method signature. Only built for declarations that
// are virtual or override and are not final.
struct MethodSignature {
    std::string return_type;
    std::string name;
    std::string parameters; // e.g. "(int x, int y)", defaults stripped
    std::string qualifiers; // e.g. "const, override"
};

// Options consumed by the generator entry point.
// - input_path: header to read, "-" for stdin
// - output_path: file to write, "-" for stdout
// - target_class: restrict extraction to this class body when set
// - template_path: optional output template; built-in used when empty
// - delegate: also emit ON_CALL default delegation statements
// - indent: spaces prefixed to every generated line
struct GeneratorOptions {
    std::string                input_path;
    std::string                output_path = "-";
    std::optional<std::string> target_class;
    std::string                template_path;
    bool                       delegate = false;
    unsigned                   indent   = 0;
    bool                       verbose  = false;
};

} // namespace makemock

// Template-based emission of generated mock methods.
#pragma once

#include "model.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace makemock {

// Placeholders understood in output templates.
inline constexpr std::string_view kMockMethodsPlaceholder       = "{{MOCK_METHODS}}";
inline constexpr std::string_view kDefaultDelegationPlaceholder = "{{DEFAULT_DELEGATIONS}}";
inline constexpr std::string_view kClassNamePlaceholder         = "{{CLASS_NAME}}";

void replace_all(std::string &inout, std::string_view needle, std::string_view replacement);

// Returns nullopt when the file cannot be opened; an empty file is a valid
// (empty) template.
std::optional<std::string> read_template_file(const std::filesystem::path &path);

// Substitute the rendered signatures into `template_text`. Without a
// `template_text` the built-in template is used: the newline-joined
// MOCK_METHOD lines, followed by the ON_CALL lines when delegation is on.
std::string render_output(const std::vector<MethodSignature> &methods, const GeneratorOptions &options,
                          std::optional<std::string_view> template_text = std::nullopt);

// Run the whole pipeline over `source`: comment cleanup, class scoping,
// declaration classification and rendering (loading options.template_path
// when set).
std::string make_mock(std::string_view source, const GeneratorOptions &options);

// Write `content` to options.output_path ("-" is stdout).
// Returns 0 on success, 2 when the output cannot be opened, 1 on write errors.
int emit(const GeneratorOptions &options, std::string_view content);

} // namespace makemock

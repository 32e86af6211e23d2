// Implementation of template-based emission

#include "emit.hpp"

#include "declaration.hpp"
#include "log.hpp"
#include "render_mocks.hpp"
#include "scope.hpp"
#include "source_text.hpp"

#include <fstream>
#include <iterator>
#include <optional>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/raw_ostream.h>
#include <string>
#include <system_error>

namespace makemock {
namespace {

std::string join_lines(const std::vector<std::string> &lines, unsigned indent) {
    const std::string prefix(indent, ' ');
    std::string       out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i != 0)
            out += '\n';
        out += prefix;
        out += lines[i];
    }
    return out;
}

} // namespace

void replace_all(std::string &inout, std::string_view needle, std::string_view replacement) {
    const std::string target{needle};
    const std::string substitute{replacement};
    std::size_t       pos = 0;
    while ((pos = inout.find(target, pos)) != std::string::npos) {
        inout.replace(pos, target.size(), substitute);
        pos += substitute.size();
    }
}

std::optional<std::string> read_template_file(const std::filesystem::path &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file)
        return std::nullopt;
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::string render_output(const std::vector<MethodSignature> &methods, const GeneratorOptions &options,
                          std::optional<std::string_view> template_text) {
    std::vector<std::string> mock_lines;
    std::vector<std::string> delegation_lines;
    mock_lines.reserve(methods.size());
    for (const auto &method : methods) {
        mock_lines.push_back(render::format_mock_method(method));
        if (options.delegate) {
            delegation_lines.push_back(render::format_default_delegation(method));
        }
    }

    std::string output;
    if (template_text) {
        output = std::string(*template_text);
    } else {
        output = std::string(kMockMethodsPlaceholder);
        if (!delegation_lines.empty()) {
            output += '\n';
            output += kDefaultDelegationPlaceholder;
        }
    }

    replace_all(output, kMockMethodsPlaceholder, join_lines(mock_lines, options.indent));
    replace_all(output, kDefaultDelegationPlaceholder, join_lines(delegation_lines, options.indent));
    replace_all(output, kClassNamePlaceholder, options.target_class.value_or(std::string{}));
    return output;
}

std::string make_mock(std::string_view source, const GeneratorOptions &options) {
    const std::string    cleaned = strip_comments_and_directives(source);
    const ScopeSelection scoped  = select_class_scope(cleaned, options.target_class);
    if (options.target_class && !scoped.class_found) {
        log_note("makemock: class '{}' not found in '{}'\n", *options.target_class, options.input_path);
    }

    const auto methods = extract_signatures(scoped.text);
    log_note("makemock: {} method(s) to mock\n", methods.size());

    std::optional<std::string> template_content;
    if (!options.template_path.empty()) {
        template_content = read_template_file(options.template_path);
        if (!template_content) {
            log_err("makemock: failed to load template file '{}', using built-in template.\n", options.template_path);
        }
    }
    if (template_content) {
        return render_output(methods, options, std::string_view(*template_content));
    }
    return render_output(methods, options);
}

int emit(const GeneratorOptions &options, std::string_view content) {
    std::error_code      ec;
    llvm::raw_fd_ostream out(options.output_path, ec, llvm::sys::fs::OF_Text);
    if (ec) {
        log_err("Error: Invalid value for \"-o\" / \"--output\": Could not open file: {}: {}\n", options.output_path, ec.message());
        return 2;
    }
    out.write(content.data(), content.size());
    out.flush();
    if (out.has_error()) {
        log_err("makemock: failed to write output file '{}': {}\n", options.output_path, out.error().message());
        out.clear_error();
        return 1;
    }
    return 0;
}

} // namespace makemock

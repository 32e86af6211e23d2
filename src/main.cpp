#include "emit.hpp"
#include "log.hpp"
#include "model.hpp"

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/ErrorOr.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/raw_ostream.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

using makemock::GeneratorOptions;
using makemock::log_err;

#ifndef MAKEMOCK_VERSION_STR
#define MAKEMOCK_VERSION_STR "0.0.0"
#endif

namespace {

constexpr int kUsageError = 2;

constexpr std::string_view kUsageLine = "Usage: makemock [options] <INPUT>\nTry 'makemock --help' for help.\n\n";

std::optional<GeneratorOptions> parse_arguments(int argc, const char **argv) {
    static llvm::cl::OptionCategory   category{"makemock"};
    static llvm::cl::opt<std::string> input_option{llvm::cl::Positional, llvm::cl::desc("<INPUT>"), llvm::cl::init(""),
                                                   llvm::cl::cat(category)};
    static llvm::cl::opt<std::string> output_option{"output", llvm::cl::desc("output file"), llvm::cl::value_desc("path"),
                                                    llvm::cl::init("-"), llvm::cl::cat(category)};
    static llvm::cl::alias            output_alias{"o", llvm::cl::desc("Alias for --output"), llvm::cl::aliasopt(output_option)};
    static llvm::cl::opt<std::string> class_option{"target-class", llvm::cl::desc("target class name"), llvm::cl::value_desc("name"),
                                                   llvm::cl::init(""), llvm::cl::cat(category)};
    static llvm::cl::alias            class_alias{"c", llvm::cl::desc("Alias for --target-class"), llvm::cl::aliasopt(class_option)};
    static llvm::cl::opt<std::string> template_option{"template", llvm::cl::desc("Path to the template file used for the output"),
                                                      llvm::cl::value_desc("path"), llvm::cl::init(""), llvm::cl::cat(category)};
    static llvm::cl::alias            template_alias{"t", llvm::cl::desc("Alias for --template"), llvm::cl::aliasopt(template_option)};
    static llvm::cl::opt<bool> delegate_option{"delegate", llvm::cl::desc("Also emit ON_CALL statements delegating to `real`"),
                                               llvm::cl::init(false), llvm::cl::cat(category)};
    static llvm::cl::alias     delegate_alias{"d", llvm::cl::desc("Alias for --delegate"), llvm::cl::aliasopt(delegate_option)};
    static llvm::cl::opt<unsigned> indent_option{"indent", llvm::cl::desc("Spaces in front of every generated line"),
                                                 llvm::cl::init(0), llvm::cl::cat(category)};
    static llvm::cl::opt<bool> verbose_option{"verbose", llvm::cl::desc("Report a missing target class and the method count"),
                                              llvm::cl::init(false), llvm::cl::cat(category)};
    static llvm::cl::alias     verbose_alias{"v", llvm::cl::desc("Alias for --verbose"), llvm::cl::aliasopt(verbose_option)};

    llvm::cl::HideUnrelatedOptions(category);
    llvm::cl::SetVersionPrinter([](llvm::raw_ostream &os) { os << "makemock " << MAKEMOCK_VERSION_STR << '\n'; });

    std::string              parse_errors;
    llvm::raw_string_ostream errors_stream{parse_errors};
    const bool               parsed = llvm::cl::ParseCommandLineOptions(
        argc, argv,
        "Process a C++ header file and generate googlemock MOCK_METHOD lines for its virtual methods.\n\n"
        "This tool is regex-like and does not handle all C++, notably operators.\n",
        &errors_stream);
    errors_stream.flush();
    if (!parsed) {
        makemock::log_err_raw(kUsageLine);
        log_err("Error: {}", parse_errors);
        return std::nullopt;
    }

    if (input_option.getValue().empty()) {
        makemock::log_err_raw(kUsageLine);
        log_err("Error: Missing argument \"INPUT\".\n");
        return std::nullopt;
    }

    GeneratorOptions opts;
    opts.input_path  = input_option.getValue();
    opts.output_path = output_option.getValue().empty() ? std::string("-") : output_option.getValue();
    if (!class_option.getValue().empty()) {
        opts.target_class = class_option.getValue();
    }
    opts.template_path = template_option.getValue();
    opts.delegate      = delegate_option.getValue();
    opts.indent        = indent_option.getValue();
    opts.verbose       = verbose_option.getValue();
    return opts;
}

} // namespace

int main(int argc, const char **argv) {
    const auto options = parse_arguments(argc, argv);
    if (!options) {
        return kUsageError;
    }
    makemock::set_verbose(options->verbose);

    llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> buffer = llvm::MemoryBuffer::getFileOrSTDIN(options->input_path, /*IsText=*/true);
    if (!buffer) {
        makemock::log_err_raw(kUsageLine);
        log_err("Error: Invalid value for \"INPUT\": Could not open file: {}: {}\n", options->input_path, buffer.getError().message());
        return kUsageError;
    }

    const std::string_view source{(*buffer)->getBufferStart(), (*buffer)->getBufferSize()};
    const std::string      generated = makemock::make_mock(source, *options);
    return makemock::emit(*options, generated);
}

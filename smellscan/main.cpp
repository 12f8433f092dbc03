#include "cli/run.hpp"
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/InitLLVM.h>
#include <llvm/Support/raw_ostream.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

using namespace llvm;

using smellscan::cli::OutputFormat;

namespace {

enum class FailOn { None, Low, Medium, High };

} // namespace

// Command line options
static cl::OptionCategory SmellscanCategory("Smellscan Options");

static cl::list<std::string> InputPaths(
    cl::Positional,
    cl::desc("<file or directory>..."),
    cl::OneOrMore,
    cl::cat(SmellscanCategory));

static cl::opt<std::string> Language(
    "language",
    cl::desc("Specify the programming language instead of detecting it from the extension"),
    cl::value_desc("lang"),
    cl::cat(SmellscanCategory));

static cl::opt<OutputFormat> Format(
    "format",
    cl::desc("Output format"),
    cl::values(
        clEnumValN(OutputFormat::Text, "text", "Human readable report"),
        clEnumValN(OutputFormat::Json, "json", "Machine readable report")),
    cl::init(OutputFormat::Text),
    cl::cat(SmellscanCategory));

static cl::list<std::string> IgnorePatterns(
    "ignore",
    cl::desc("Patterns to ignore (can be specified multiple times)"),
    cl::cat(SmellscanCategory));

static cl::opt<bool> Recursive(
    "recursive",
    cl::desc("Recursively analyze directories (default: true)"),
    cl::init(true),
    cl::cat(SmellscanCategory));

static cl::opt<int> MaxLines(
    "max-lines",
    cl::desc("Long method threshold in lines (default: 50)"),
    cl::init(50),
    cl::cat(SmellscanCategory));

static cl::opt<int> MaxLinesHigh(
    "max-lines-high",
    cl::desc("Line count above which a long method is high severity (default: 100)"),
    cl::init(100),
    cl::cat(SmellscanCategory));

static cl::opt<int> MaxParams(
    "max-params",
    cl::desc("Parameter count threshold (default: 5)"),
    cl::init(5),
    cl::cat(SmellscanCategory));

static cl::opt<int> MaxParamsHigh(
    "max-params-high",
    cl::desc("Parameter count above which the finding is high severity (default: 7)"),
    cl::init(7),
    cl::cat(SmellscanCategory));

static cl::opt<int> MaxDepth(
    "max-depth",
    cl::desc("Control-flow nesting depth threshold (default: 4)"),
    cl::init(4),
    cl::cat(SmellscanCategory));

static cl::opt<int> MaxDepthHigh(
    "max-depth-high",
    cl::desc("Nesting depth above which the finding is high severity (default: 5)"),
    cl::init(5),
    cl::cat(SmellscanCategory));

static cl::opt<bool> IsolateNestedScopes(
    "isolate-nested-scopes",
    cl::desc("Do not count nested function and class bodies toward the enclosing function's depth"),
    cl::init(false),
    cl::cat(SmellscanCategory));

static cl::opt<FailOn> FailOnSeverity(
    "fail-on",
    cl::desc("Exit with status 2 when a finding of this severity or higher exists"),
    cl::values(
        clEnumValN(FailOn::None, "none", "Never fail on findings"),
        clEnumValN(FailOn::Low, "low", "Any finding"),
        clEnumValN(FailOn::Medium, "medium", "Medium or high findings"),
        clEnumValN(FailOn::High, "high", "High findings only")),
    cl::init(FailOn::None),
    cl::cat(SmellscanCategory));

static cl::opt<bool> Verbose(
    "verbose",
    cl::desc("Enable verbose output"),
    cl::init(false),
    cl::cat(SmellscanCategory));

static smellscan::cli::RunSettings settings_from_options() {
    using smellscan::detection::Severity;

    smellscan::cli::RunSettings settings;
    settings.paths.assign(InputPaths.begin(), InputPaths.end());

    settings.detectors.long_method = {MaxLines.getValue(), MaxLinesHigh.getValue()};
    settings.detectors.too_many_parameters = {MaxParams.getValue(), MaxParamsHigh.getValue()};
    settings.detectors.deep_nesting = {MaxDepth.getValue(), MaxDepthHigh.getValue()};
    settings.detectors.nesting.isolate_nested_scopes = IsolateNestedScopes.getValue();

    settings.analysis.language = Language.getValue();
    settings.analysis.recursive = Recursive.getValue();
    settings.analysis.ignore_patterns.assign(IgnorePatterns.begin(), IgnorePatterns.end());

    settings.format = Format.getValue();
    switch (FailOnSeverity.getValue()) {
    case FailOn::None:
        break;
    case FailOn::Low:
        settings.fail_on = Severity::Low;
        break;
    case FailOn::Medium:
        settings.fail_on = Severity::Medium;
        break;
    case FailOn::High:
        settings.fail_on = Severity::High;
        break;
    }
    return settings;
}

int main(int argc, char **argv) {
    InitLLVM X(argc, argv);

    // Parse command line options
    cl::HideUnrelatedOptions(SmellscanCategory);
    cl::ParseCommandLineOptions(argc, argv, "Smellscan - Structural Code Smell Detector\n");

    // Logs go to stderr so the report on stdout stays parseable
    auto logger = spdlog::stderr_color_mt("smellscan");
    spdlog::set_default_logger(logger);
    if (Verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }

    return smellscan::cli::run(settings_from_options(), outs());
}

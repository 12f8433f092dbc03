#include "run.hpp"
#include "parser/parser_registry.hpp"
#include "report/formatter.hpp"
#include <exception>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace smellscan::cli {

int exit_code(const std::vector<analysis::FileReport> &reports,
              std::optional<detection::Severity> fail_on) {
    if (fail_on && report::exceeds_gate(reports, *fail_on)) {
        return kExitGateFailed;
    }
    return kExitOk;
}

int run(const RunSettings &settings, llvm::raw_ostream &out) {
    try {
        analysis::Analyzer analyzer(settings.detectors);
        analyzer.set_options(settings.analysis);

        spdlog::debug("Supported languages: {}",
                      fmt::join(parser::ParserRegistry::builtin().languages(), ", "));

        const auto reports = analyzer.analyze_paths(settings.paths);

        if (settings.format == OutputFormat::Json) {
            report::write_json(reports, out);
        } else {
            report::write_text(reports, out);
        }
        out.flush();

        return exit_code(reports, settings.fail_on);
    } catch (const config::ConfigurationError& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return kExitError;
    } catch (const std::exception& e) {
        spdlog::error("An error occurred: {}", e.what());
        return kExitError;
    }
}

} // namespace smellscan::cli

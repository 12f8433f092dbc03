#ifndef SMELLSCAN_CLI_RUN_HPP
#define SMELLSCAN_CLI_RUN_HPP

#pragma once

#include "analysis/analyzer.hpp"
#include "config/detector_config.hpp"
#include "detection/finding.hpp"
#include <optional>
#include <string>
#include <vector>
#include <llvm/Support/raw_ostream.h>

namespace smellscan::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitError = 1;
inline constexpr int kExitGateFailed = 2;

enum class OutputFormat { Text, Json };

// Everything one invocation needs, as parsed from the command line
struct RunSettings {
    std::vector<std::string> paths;
    config::DetectorConfig detectors;
    config::AnalysisOptions analysis;
    OutputFormat format{OutputFormat::Text};
    // Lowest severity that fails the run; unset never fails on findings
    std::optional<detection::Severity> fail_on;
};

// Status for a finished analysis: kExitGateFailed when a finding reaches
// fail_on, kExitOk otherwise. Files that failed to analyze do not count.
int exit_code(const std::vector<analysis::FileReport> &reports,
              std::optional<detection::Severity> fail_on);

// Validates the settings, analyzes every path and writes the report to out.
// Returns the process exit status; configuration and runtime errors are
// logged and give kExitError.
int run(const RunSettings &settings, llvm::raw_ostream &out);

} // namespace smellscan::cli

#endif // SMELLSCAN_CLI_RUN_HPP

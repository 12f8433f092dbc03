// analyzer.hpp
#ifndef SMELLSCAN_ANALYSIS_ANALYZER_HPP
#define SMELLSCAN_ANALYSIS_ANALYZER_HPP

#pragma once

#include "config/detector_config.hpp"
#include "detection/detection_engine.hpp"
#include "detection/finding.hpp"
#include "tree/syntax_node.hpp"
#include "utils/filesystem.hpp"
#include <optional>
#include <string>
#include <vector>

namespace smellscan::analysis {

struct FileReport {
    std::string file_path;
    std::string language;
    std::vector<detection::Finding> findings;
    // Set when the file could not be analyzed; findings are then empty
    std::optional<std::string> error;

    bool ok() const { return !error.has_value(); }
};

class Analyzer {
public:
    explicit Analyzer(detection::DetectionEngine engine);
    explicit Analyzer(const config::DetectorConfig &config = {});

    // Pure analysis of an already parsed tree
    std::vector<detection::Finding> analyze(const tree::SyntaxTree &tree) const;

    // Analysis methods. A failing file is reported, never thrown.
    FileReport analyze_file(const std::string &file_path) const;
    FileReport analyze_source(const std::string &content, const std::string &file_path) const;
    std::vector<FileReport> analyze_directory(const std::string &directory_path, bool recursive = true) const;
    std::vector<FileReport> analyze_paths(const std::vector<std::string> &paths) const;

    // Configuration
    void set_options(const config::AnalysisOptions &options);
    void set_language(const std::string &language) { options_.language = language; }
    void set_recursive(bool recursive) { options_.recursive = recursive; }
    void set_ignore_patterns(const std::vector<std::string> &patterns);

    const detection::DetectionEngine& engine() const { return engine_; }

private:
    bool should_analyze_file(const std::string &file_path) const;

    config::AnalysisOptions options_;
    utils::PathFilter ignore_filter_;
    detection::DetectionEngine engine_;
};

} // namespace smellscan::analysis

#endif // SMELLSCAN_ANALYSIS_ANALYZER_HPP

#include "analyzer.hpp"
#include "parser/parser_registry.hpp"
#include "utils/filesystem.hpp"
#include <filesystem>
#include <spdlog/spdlog.h>
#include <utility>

namespace smellscan::analysis {

namespace {

FileReport failed(const std::string &file_path, std::string language, std::string message) {
    spdlog::error("Failed to analyze file {}: {}", file_path, message);
    FileReport report;
    report.file_path = file_path;
    report.language = std::move(language);
    report.error = std::move(message);
    return report;
}

} // namespace

Analyzer::Analyzer(detection::DetectionEngine engine)
    : engine_(std::move(engine))
{
}

Analyzer::Analyzer(const config::DetectorConfig &config)
    : Analyzer(detection::make_default_engine(config))
{
}

void Analyzer::set_options(const config::AnalysisOptions &options) {
    options_ = options;
    ignore_filter_ = utils::PathFilter(options_.ignore_patterns);
}

void Analyzer::set_ignore_patterns(const std::vector<std::string> &patterns) {
    options_.ignore_patterns = patterns;
    ignore_filter_ = utils::PathFilter(patterns);
}

std::vector<detection::Finding> Analyzer::analyze(const tree::SyntaxTree &tree) const {
    return engine_.analyze(tree);
}

FileReport Analyzer::analyze_file(const std::string& file_path) const {
    spdlog::info("Analyzing file: {}", file_path);

    std::string content;
    try {
        content = utils::read_file_content(file_path);
    } catch (const std::exception& e) {
        return failed(file_path, "", e.what());
    }

    return analyze_source(content, file_path);
}

FileReport Analyzer::analyze_source(const std::string &content, const std::string &file_path) const {
    const auto& registry = parser::ParserRegistry::builtin();

    std::string lang = options_.language;
    if (lang.empty()) {
        lang = registry.language_for_file(file_path).value_or("");
        if (lang.empty()) {
            return failed(file_path, "", "Could not detect language");
        }
        spdlog::debug("Language detected: {} for file: {}", lang, file_path);
    } else if (!registry.supports(lang)) {
        return failed(file_path, lang, "Unsupported language: " + lang);
    }

    FileReport report;
    report.file_path = file_path;
    report.language = lang;

    if (content.empty()) {
        spdlog::debug("Empty file content for: {}", file_path);
        return report;
    }

    try {
        auto syntax_tree = registry.parse(parser::ParserContext{content, file_path}, lang);
        report.findings = engine_.analyze(syntax_tree);
    } catch (const parser::ParseError& e) {
        return failed(file_path, lang, e.what());
    }

    return report;
}

std::vector<FileReport> Analyzer::analyze_directory(
    const std::string& directory_path,
    bool recursive
) const {
    std::vector<FileReport> results;

    for (const auto& file : utils::list_files(directory_path, recursive)) {
        if (should_analyze_file(file)) {
            results.push_back(analyze_file(file));
        }
    }

    spdlog::info("Analyzed {} files in {}", results.size(), directory_path);
    return results;
}

std::vector<FileReport> Analyzer::analyze_paths(const std::vector<std::string> &paths) const {
    std::vector<FileReport> results;

    for (const auto& path : paths) {
        std::error_code ec;
        if (std::filesystem::is_directory(path, ec)) {
            try {
                auto dir_results = analyze_directory(path, options_.recursive);
                results.insert(results.end(),
                               std::make_move_iterator(dir_results.begin()),
                               std::make_move_iterator(dir_results.end()));
            } catch (const std::runtime_error& e) {
                results.push_back(failed(path, "", e.what()));
            }
        } else {
            // Named files skip the extension filter; --language may cover them
            results.push_back(analyze_file(path));
        }
    }

    return results;
}

bool Analyzer::should_analyze_file(const std::string& file_path) const {
    if (const auto* pattern = ignore_filter_.excluded_by(file_path)) {
        spdlog::debug("Ignoring {} (matches '{}')", file_path, *pattern);
        return false;
    }
    return parser::ParserRegistry::builtin().language_for_file(file_path).has_value();
}

} // namespace smellscan::analysis

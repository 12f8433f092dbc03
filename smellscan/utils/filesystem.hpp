#ifndef SMELLSCAN_UTILS_FILESYSTEM_HPP
#define SMELLSCAN_UTILS_FILESYSTEM_HPP

#pragma once

#include <regex>
#include <string>
#include <vector>

namespace smellscan::utils {

// Whole file as raw bytes. Throws std::runtime_error if unreadable.
std::string read_file_content(const std::string &file_path);

// Regular files under a directory, sorted by path. Only an unreadable root
// throws (std::runtime_error); subdirectories that cannot be opened are
// logged and skipped.
std::vector<std::string> list_files(const std::string &directory_path, bool recursive = false);

// Ignore patterns compiled once. A pattern that is not a valid regex
// matches as a plain substring.
class PathFilter {
public:
    PathFilter() = default;
    explicit PathFilter(const std::vector<std::string> &patterns);

    // Pattern that excludes the path, or nullptr
    const std::string* excluded_by(const std::string &path) const;
    bool empty() const { return rules_.empty(); }

private:
    struct Rule {
        std::string pattern;
        bool literal{false};
        std::regex regex;
    };

    std::vector<Rule> rules_;
};

} // namespace smellscan::utils

#endif // SMELLSCAN_UTILS_FILESYSTEM_HPP

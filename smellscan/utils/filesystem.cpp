#include "filesystem.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <spdlog/spdlog.h>

namespace smellscan::utils {

namespace fs = std::filesystem;

std::string read_file_content(const std::string &file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + file_path);
    }

    std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + file_path);
    }
    return content;
}

std::vector<std::string> list_files(const std::string &directory_path, bool recursive) {
    std::vector<std::string> files;
    std::vector<fs::path> directories{fs::path(directory_path)};
    bool at_root = true;

    while (!directories.empty()) {
        const fs::path directory = std::move(directories.back());
        directories.pop_back();

        std::error_code ec;
        fs::directory_iterator it(directory, ec);
        if (ec) {
            if (at_root) {
                throw std::runtime_error("Failed to list files in directory: " + directory_path +
                                         " (" + ec.message() + ")");
            }
            spdlog::warn("Skipping unreadable directory {}: {}", directory.string(), ec.message());
            continue;
        }
        at_root = false;

        const fs::directory_iterator end{};
        for (; it != end; it.increment(ec)) {
            const fs::directory_entry &entry = *it;
            std::error_code status_ec;

            // Symlinked directories are not followed, so links cannot loop
            if (entry.is_symlink(status_ec) && entry.is_directory(status_ec)) {
                continue;
            }
            if (entry.is_directory(status_ec)) {
                if (recursive) {
                    directories.push_back(entry.path());
                }
            } else if (entry.is_regular_file(status_ec)) {
                files.push_back(entry.path().string());
            }
        }
        if (ec) {
            spdlog::warn("Listing of {} stopped early: {}", directory.string(), ec.message());
        }
    }

    // Directory iteration order is unspecified
    std::sort(files.begin(), files.end());
    return files;
}

PathFilter::PathFilter(const std::vector<std::string> &patterns) {
    rules_.reserve(patterns.size());
    for (const auto &pattern : patterns) {
        Rule rule;
        rule.pattern = pattern;
        try {
            rule.regex = std::regex(pattern);
        } catch (const std::regex_error &e) {
            spdlog::warn("Ignore pattern '{}' is not a valid regex ({}); matching it literally",
                         pattern, e.what());
            rule.literal = true;
        }
        rules_.push_back(std::move(rule));
    }
}

const std::string* PathFilter::excluded_by(const std::string &path) const {
    for (const auto &rule : rules_) {
        const bool matched = rule.literal
            ? path.find(rule.pattern) != std::string::npos
            : std::regex_search(path, rule.regex);
        if (matched) {
            return &rule.pattern;
        }
    }
    return nullptr;
}

} // namespace smellscan::utils

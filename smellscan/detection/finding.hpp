#ifndef SMELLSCAN_DETECTION_FINDING_HPP
#define SMELLSCAN_DETECTION_FINDING_HPP

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace smellscan::detection {

enum class Severity { Low, Medium, High };

std::string_view to_string(Severity severity);
std::optional<Severity> parse_severity(std::string_view text);

// Tags of the built-in detectors. Additional detectors bring their own.
namespace smell_types {
inline constexpr std::string_view kLongMethod = "long_method";
inline constexpr std::string_view kTooManyParameters = "too_many_parameters";
inline constexpr std::string_view kDeepNesting = "deep_nesting";
} // namespace smell_types

struct Location {
    size_t line;   // 1-based
    size_t column; // 0-based
};

struct Finding {
    std::string smell_type;
    Severity severity;
    Location location;
    std::string subject_name;
    std::string message;
    // Measured metric and the threshold it was compared with
    std::map<std::string, size_t> details;
};

bool operator==(const Location &lhs, const Location &rhs);
bool operator==(const Finding &lhs, const Finding &rhs);
bool operator!=(const Finding &lhs, const Finding &rhs);

} // namespace smellscan::detection

#endif // SMELLSCAN_DETECTION_FINDING_HPP

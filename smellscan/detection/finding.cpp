#include "finding.hpp"

namespace smellscan::detection {

std::string_view to_string(Severity severity) {
    switch (severity) {
    case Severity::Low:
        return "low";
    case Severity::Medium:
        return "medium";
    case Severity::High:
        return "high";
    }
    return "unknown";
}

std::optional<Severity> parse_severity(std::string_view text) {
    if (text == "low") return Severity::Low;
    if (text == "medium") return Severity::Medium;
    if (text == "high") return Severity::High;
    return std::nullopt;
}

bool operator==(const Location &lhs, const Location &rhs) {
    return lhs.line == rhs.line && lhs.column == rhs.column;
}

bool operator==(const Finding &lhs, const Finding &rhs) {
    return lhs.smell_type == rhs.smell_type &&
           lhs.severity == rhs.severity &&
           lhs.location == rhs.location &&
           lhs.subject_name == rhs.subject_name &&
           lhs.message == rhs.message &&
           lhs.details == rhs.details;
}

bool operator!=(const Finding &lhs, const Finding &rhs) {
    return !(lhs == rhs);
}

} // namespace smellscan::detection

#include "detector.hpp"
#include "tree/query.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace smellscan::detection {

std::optional<Severity> classify(size_t measured, const config::ThresholdPolicy &policy) {
    if (measured <= policy.threshold) {
        return std::nullopt;
    }
    return measured > policy.high_ceiling ? Severity::High : Severity::Medium;
}

std::optional<Finding> ThresholdDetector::make_finding(const tree::Node &definition,
                                                       size_t measured,
                                                       const std::string &metric_name,
                                                       std::string message) const {
    auto severity = classify(measured, policy_);
    if (!severity) {
        return std::nullopt;
    }

    Finding finding{
        std::string(smell_type()),
        *severity,
        {definition.start.row + 1, definition.start.column},
        tree::name_of(definition),
        std::move(message),
        {{metric_name, measured}, {"threshold", policy_.threshold}}
    };

    spdlog::debug("{} in {} at line {}: {} = {}",
                  finding.smell_type, finding.subject_name,
                  finding.location.line, metric_name, measured);
    return finding;
}

std::optional<Finding> LongMethodDetector::detect(const tree::Node &definition) const {
    const size_t line_count = metrics::line_span(definition);
    return make_finding(definition, line_count, "line_count",
        fmt::format("Function is {} lines long (threshold: {})", line_count, policy().threshold));
}

std::optional<Finding> TooManyParametersDetector::detect(const tree::Node &definition) const {
    const size_t param_count = metrics::parameter_count(definition);
    return make_finding(definition, param_count, "param_count",
        fmt::format("Function has {} parameters (threshold: {})", param_count, policy().threshold));
}

std::optional<Finding> DeepNestingDetector::detect(const tree::Node &definition) const {
    const size_t depth = metrics::max_nesting_depth(definition, options_);
    return make_finding(definition, depth, "nesting_depth",
        fmt::format("Function has nesting depth of {} (threshold: {})", depth, policy().threshold));
}

} // namespace smellscan::detection

#ifndef SMELLSCAN_CONFIG_DETECTOR_CONFIG_HPP
#define SMELLSCAN_CONFIG_DETECTOR_CONFIG_HPP

#pragma once

#include "metrics/structural_metrics.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace smellscan::config {

class ConfigurationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// A finding needs measured > threshold. It is high severity when
// measured > high_ceiling and medium otherwise.
struct ThresholdPolicy {
    size_t threshold;
    size_t high_ceiling;
};

// Values as the user typed them; signed so misuse can be reported
struct RawThreshold {
    long long threshold;
    long long high_ceiling;
};

struct DetectorConfig {
    RawThreshold long_method{50, 100};
    RawThreshold too_many_parameters{5, 7};
    RawThreshold deep_nesting{4, 5};
    metrics::NestingOptions nesting;

    // Throws ConfigurationError naming the first invalid detector setting
    void validate() const;

    ThresholdPolicy long_method_policy() const;
    ThresholdPolicy too_many_parameters_policy() const;
    ThresholdPolicy deep_nesting_policy() const;
};

struct AnalysisOptions {
    std::string language;
    bool recursive{true};
    std::vector<std::string> ignore_patterns;
};

ThresholdPolicy to_policy(const RawThreshold &raw, const std::string &detector_name);

} // namespace smellscan::config

#endif // SMELLSCAN_CONFIG_DETECTOR_CONFIG_HPP

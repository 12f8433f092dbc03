#ifndef SMELLSCAN_DETECTION_DETECTOR_HPP
#define SMELLSCAN_DETECTION_DETECTOR_HPP

#pragma once

#include "config/detector_config.hpp"
#include "detection/finding.hpp"
#include "metrics/structural_metrics.hpp"
#include "tree/syntax_node.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace smellscan::detection {

// Severity for a measured value, or nothing when it does not exceed the
// threshold. Equality never produces a finding.
std::optional<Severity> classify(size_t measured, const config::ThresholdPolicy &policy);

class Detector {
public:
    virtual ~Detector() = default;

    virtual std::string_view smell_type() const = 0;

    // Zero or one finding for a single definition node. Must not keep
    // references to the node past the call.
    virtual std::optional<Finding> detect(const tree::Node &definition) const = 0;
};

// Shared plumbing for detectors that compare one metric to a threshold
class ThresholdDetector : public Detector {
public:
    explicit ThresholdDetector(config::ThresholdPolicy policy) : policy_(policy) {}

    const config::ThresholdPolicy& policy() const { return policy_; }

protected:
    std::optional<Finding> make_finding(const tree::Node &definition,
                                        size_t measured,
                                        const std::string &metric_name,
                                        std::string message) const;

private:
    config::ThresholdPolicy policy_;
};

class LongMethodDetector : public ThresholdDetector {
public:
    explicit LongMethodDetector(config::ThresholdPolicy policy = {50, 100})
        : ThresholdDetector(policy) {}

    std::string_view smell_type() const override { return smell_types::kLongMethod; }
    std::optional<Finding> detect(const tree::Node &definition) const override;
};

class TooManyParametersDetector : public ThresholdDetector {
public:
    explicit TooManyParametersDetector(config::ThresholdPolicy policy = {5, 7})
        : ThresholdDetector(policy) {}

    std::string_view smell_type() const override { return smell_types::kTooManyParameters; }
    std::optional<Finding> detect(const tree::Node &definition) const override;
};

class DeepNestingDetector : public ThresholdDetector {
public:
    explicit DeepNestingDetector(config::ThresholdPolicy policy = {4, 5},
                                 metrics::NestingOptions options = {})
        : ThresholdDetector(policy), options_(options) {}

    std::string_view smell_type() const override { return smell_types::kDeepNesting; }
    std::optional<Finding> detect(const tree::Node &definition) const override;

private:
    metrics::NestingOptions options_;
};

} // namespace smellscan::detection

#endif // SMELLSCAN_DETECTION_DETECTOR_HPP

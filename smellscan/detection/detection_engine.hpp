#ifndef SMELLSCAN_DETECTION_DETECTION_ENGINE_HPP
#define SMELLSCAN_DETECTION_DETECTION_ENGINE_HPP

#pragma once

#include "config/detector_config.hpp"
#include "detection/detector.hpp"
#include "detection/finding.hpp"
#include "tree/syntax_node.hpp"
#include <memory>
#include <string>
#include <vector>

namespace smellscan::detection {

// Runs every registered detector over every function definition of a tree.
// Holds no per-analysis state, so one engine may serve many trees.
class DetectionEngine {
public:
    DetectionEngine() = default;
    DetectionEngine(const DetectionEngine&) = delete;
    DetectionEngine& operator=(const DetectionEngine&) = delete;
    DetectionEngine(DetectionEngine&&) = default;
    DetectionEngine& operator=(DetectionEngine&&) = default;

    // Detectors run in registration order
    void register_detector(std::unique_ptr<Detector> detector);

    std::vector<Finding> analyze(const tree::Node &root) const;
    std::vector<Finding> analyze(const tree::SyntaxTree &tree) const;

    std::vector<std::string> get_detector_names() const;
    size_t detector_count() const { return detectors_.size(); }

private:
    std::vector<std::unique_ptr<Detector>> detectors_;
};

// long_method, too_many_parameters, deep_nesting. Validates the config first.
DetectionEngine make_default_engine(const config::DetectorConfig &config = {});

} // namespace smellscan::detection

#endif // SMELLSCAN_DETECTION_DETECTION_ENGINE_HPP

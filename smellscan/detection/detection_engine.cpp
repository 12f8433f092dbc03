#include "detection_engine.hpp"
#include "tree/query.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace smellscan::detection {

void DetectionEngine::register_detector(std::unique_ptr<Detector> detector) {
    if (!detector) {
        throw std::invalid_argument("Attempting to register null detector");
    }
    spdlog::debug("Registered detector: {}", detector->smell_type());
    detectors_.push_back(std::move(detector));
}

std::vector<Finding> DetectionEngine::analyze(const tree::Node &root) const {
    std::vector<Finding> findings;

    auto functions = tree::find_definitions(root, tree::NodeKind::FunctionDefinition);
    spdlog::debug("Running {} detectors over {} functions", detectors_.size(), functions.size());

    for (const auto* function : functions) {
        for (const auto& detector : detectors_) {
            if (auto finding = detector->detect(*function)) {
                findings.push_back(std::move(*finding));
            }
        }
    }

    return findings;
}

std::vector<Finding> DetectionEngine::analyze(const tree::SyntaxTree &tree) const {
    auto findings = analyze(tree.root);
    spdlog::debug("Found {} code smells in {}", findings.size(), tree.file_path);
    return findings;
}

std::vector<std::string> DetectionEngine::get_detector_names() const {
    std::vector<std::string> names;
    names.reserve(detectors_.size());
    for (const auto& detector : detectors_) {
        names.emplace_back(detector->smell_type());
    }
    return names;
}

DetectionEngine make_default_engine(const config::DetectorConfig &config) {
    config.validate();

    DetectionEngine engine;
    engine.register_detector(std::make_unique<LongMethodDetector>(config.long_method_policy()));
    engine.register_detector(std::make_unique<TooManyParametersDetector>(config.too_many_parameters_policy()));
    engine.register_detector(std::make_unique<DeepNestingDetector>(config.deep_nesting_policy(), config.nesting));
    return engine;
}

} // namespace smellscan::detection

#include "detector_config.hpp"
#include <spdlog/spdlog.h>

namespace smellscan::config {

ThresholdPolicy to_policy(const RawThreshold &raw, const std::string &detector_name) {
    if (raw.threshold < 0) {
        throw ConfigurationError("Threshold for " + detector_name +
                                 " must not be negative (got " +
                                 std::to_string(raw.threshold) + ")");
    }
    if (raw.high_ceiling < 0) {
        throw ConfigurationError("High severity ceiling for " + detector_name +
                                 " must not be negative (got " +
                                 std::to_string(raw.high_ceiling) + ")");
    }
    if (raw.high_ceiling < raw.threshold) {
        throw ConfigurationError("High severity ceiling for " + detector_name + " (" +
                                 std::to_string(raw.high_ceiling) +
                                 ") is below its threshold (" +
                                 std::to_string(raw.threshold) + ")");
    }
    return {static_cast<size_t>(raw.threshold), static_cast<size_t>(raw.high_ceiling)};
}

void DetectorConfig::validate() const {
    long_method_policy();
    too_many_parameters_policy();
    deep_nesting_policy();
    spdlog::debug("Detector configuration: long_method={}/{} too_many_parameters={}/{} deep_nesting={}/{} isolate_nested_scopes={}",
                  long_method.threshold, long_method.high_ceiling,
                  too_many_parameters.threshold, too_many_parameters.high_ceiling,
                  deep_nesting.threshold, deep_nesting.high_ceiling,
                  nesting.isolate_nested_scopes);
}

ThresholdPolicy DetectorConfig::long_method_policy() const {
    return to_policy(long_method, "long_method");
}

ThresholdPolicy DetectorConfig::too_many_parameters_policy() const {
    return to_policy(too_many_parameters, "too_many_parameters");
}

ThresholdPolicy DetectorConfig::deep_nesting_policy() const {
    return to_policy(deep_nesting, "deep_nesting");
}

} // namespace smellscan::config

#include "detection/detection_engine.hpp"

#include "test_support/tree_builder.hpp"
#include "tree/query.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using smellscan::config::DetectorConfig;
using smellscan::detection::DetectionEngine;
using smellscan::detection::Detector;
using smellscan::detection::Finding;
using smellscan::detection::make_default_engine;
using smellscan::detection::Severity;
using smellscan::testing::Class;
using smellscan::testing::Function;
using smellscan::testing::Module;
using smellscan::testing::NestedIfs;
using smellscan::testing::PlainParameters;
using smellscan::tree::Node;

// Flags every function whose name starts with "tmp"
class TemporaryNameDetector : public Detector {
public:
  std::string_view smell_type() const override { return "temporary_name"; }

  std::optional<Finding> detect(const Node &definition) const override {
    const auto name = smellscan::tree::name_of(definition);
    if (name.rfind("tmp", 0) != 0) {
      return std::nullopt;
    }
    return Finding{"temporary_name", Severity::Low,
                   {definition.start.row + 1, definition.start.column},
                   name, "Temporary name", {}};
  }
};

std::vector<std::pair<std::string, std::string>>
Summaries(const std::vector<Finding> &findings) {
  std::vector<std::pair<std::string, std::string>> result;
  for (const auto &finding : findings) {
    result.emplace_back(finding.subject_name, finding.smell_type);
  }
  return result;
}

// A function with every smell plus a clean one, a method and a nested helper
Node SmellyModule() {
  return Module({
      Function("everything", PlainParameters(8), {NestedIfs(6)}, 0, 119),
      Function("clean", PlainParameters(1), {}, 121, 125),
      Class("Report",
            {Function("render", PlainParameters(6),
                      {Function("tmp_helper", PlainParameters(0),
                                {NestedIfs(5)}, 140, 150)},
                      130, 160)},
            128, 160),
  });
}

TEST(DetectionEngineTest, EmptyTreeYieldsNoFindings) {
  const auto engine = make_default_engine();
  EXPECT_TRUE(engine.analyze(Module({})).empty());
}

TEST(DetectionEngineTest, RegistersDefaultDetectorsInCanonicalOrder) {
  const auto engine = make_default_engine();
  EXPECT_EQ((std::vector<std::string>{"long_method", "too_many_parameters",
                                      "deep_nesting"}),
            engine.get_detector_names());
}

TEST(DetectionEngineTest, OrdersByDefinitionThenDetector) {
  const auto engine = make_default_engine();
  const auto findings = engine.analyze(SmellyModule());

  const std::vector<std::pair<std::string, std::string>> expected{
      {"everything", "long_method"},
      {"everything", "too_many_parameters"},
      {"everything", "deep_nesting"},
      {"render", "too_many_parameters"},
      {"render", "deep_nesting"},
      {"tmp_helper", "deep_nesting"},
  };
  EXPECT_EQ(expected, Summaries(findings));
}

TEST(DetectionEngineTest, NestedDefinitionsCountTowardEnclosingDepth) {
  const auto engine = make_default_engine();
  const auto findings = engine.analyze(SmellyModule());

  ASSERT_EQ(6u, findings.size());
  EXPECT_EQ("render", findings[4].subject_name);
  EXPECT_EQ(5u, findings[4].details.at("nesting_depth"));
}

TEST(DetectionEngineTest, IsolatedScopesDropTheInheritedDepth) {
  DetectorConfig config;
  config.nesting.isolate_nested_scopes = true;
  const auto engine = make_default_engine(config);

  const std::vector<std::pair<std::string, std::string>> expected{
      {"everything", "long_method"},
      {"everything", "too_many_parameters"},
      {"everything", "deep_nesting"},
      {"render", "too_many_parameters"},
      {"tmp_helper", "deep_nesting"},
  };
  EXPECT_EQ(expected, Summaries(engine.analyze(SmellyModule())));
}

TEST(DetectionEngineTest, AdditionalDetectorsRunAfterTheDefaults) {
  auto engine = make_default_engine();
  engine.register_detector(std::make_unique<TemporaryNameDetector>());

  const auto findings = engine.analyze(SmellyModule());

  ASSERT_EQ(7u, findings.size());
  EXPECT_EQ("tmp_helper", findings.back().subject_name);
  EXPECT_EQ("temporary_name", findings.back().smell_type);
  EXPECT_EQ(Severity::Low, findings.back().severity);
  EXPECT_EQ("deep_nesting", findings[5].smell_type);
}

TEST(DetectionEngineTest, RejectsNullDetector) {
  DetectionEngine engine;
  EXPECT_THROW(engine.register_detector(nullptr), std::invalid_argument);
  EXPECT_EQ(0u, engine.detector_count());
}

TEST(DetectionEngineTest, InvalidConfigurationFailsBeforeAnalysis) {
  DetectorConfig config;
  config.deep_nesting = {-4, 5};
  EXPECT_THROW(make_default_engine(config),
               smellscan::config::ConfigurationError);
}

TEST(DetectionEngineTest, RepeatedAnalysisIsIdentical) {
  const auto engine = make_default_engine();
  const Node root = SmellyModule();

  const auto first = engine.analyze(root);
  const auto second = engine.analyze(root);
  EXPECT_EQ(first, second);
}

TEST(DetectionEngineTest, RaisingThresholdsOnlyRemovesFindings) {
  const Node root = SmellyModule();
  const auto baseline = make_default_engine().analyze(root);

  DetectorConfig relaxed;
  relaxed.long_method = {200, 300};
  relaxed.deep_nesting = {5, 5};
  const auto fewer = make_default_engine(relaxed).analyze(root);

  EXPECT_LT(fewer.size(), baseline.size());
  for (const auto &finding : fewer) {
    bool present = false;
    for (const auto &original : baseline) {
      if (original.subject_name == finding.subject_name &&
          original.smell_type == finding.smell_type) {
        present = true;
      }
    }
    EXPECT_TRUE(present) << finding.subject_name << " " << finding.smell_type;
  }
  for (const auto &finding : fewer) {
    EXPECT_NE("long_method", finding.smell_type);
  }
}

TEST(DetectionEngineTest, DetectorOrderDoesNotChangeTheFindingSet) {
  const Node root = SmellyModule();
  const DetectorConfig config;

  DetectionEngine reversed;
  reversed.register_detector(
      std::make_unique<smellscan::detection::DeepNestingDetector>(
          config.deep_nesting_policy()));
  reversed.register_detector(
      std::make_unique<smellscan::detection::TooManyParametersDetector>(
          config.too_many_parameters_policy()));
  reversed.register_detector(
      std::make_unique<smellscan::detection::LongMethodDetector>(
          config.long_method_policy()));

  auto canonical = Summaries(make_default_engine().analyze(root));
  auto shuffled = Summaries(reversed.analyze(root));
  EXPECT_NE(canonical, shuffled);

  std::sort(canonical.begin(), canonical.end());
  std::sort(shuffled.begin(), shuffled.end());
  EXPECT_EQ(canonical, shuffled);
}

} // namespace

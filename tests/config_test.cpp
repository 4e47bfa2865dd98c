#include "config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

namespace process_miner {
namespace {

using nlohmann::json;

TEST(ConfigTest, EmptyObjectKeepsDefaults) {
  auto [config, err] = ConfigLoader::FromJson(json::object());
  ASSERT_EQ(err, nullptr);
  EXPECT_EQ(config.idealFlow, DefaultIdealFlow());
  EXPECT_EQ(config.idealFlow.size(), 5u);
  EXPECT_EQ(config.topActivities, 10u);
  EXPECT_EQ(config.conformance.extraActivitySlack, 2);
  EXPECT_EQ(config.conformance.missingActivitySlack, 1);
  EXPECT_DOUBLE_EQ(config.conformance.orderViolationPenalty, 0.1);
  EXPECT_DOUBLE_EQ(config.conformance.conformingThreshold, 0.8);
  EXPECT_DOUBLE_EQ(config.conformance.partialThreshold, 0.5);
  EXPECT_EQ(config.bottlenecks.topN, 8u);
  EXPECT_EQ(config.anomalyMode, AnomalyMode::None);
}

TEST(ConfigTest, OverridesNestedKeys) {
  auto doc = json::parse(R"({
    "ideal_flow": ["Open", "Work", "Close"],
    "top_activities": 4,
    "conformance": {"order_violation_penalty": 0.2, "partial_threshold": 0.4},
    "bottlenecks": {"top_n": 3, "overload_workload": 25},
    "anomalies": {"mode": "random", "random_rate": 0.25, "seed": 7}
  })");
  auto [config, err] = ConfigLoader::FromJson(doc);
  ASSERT_EQ(err, nullptr);
  EXPECT_EQ(config.idealFlow,
            (std::vector<std::string>{"Open", "Work", "Close"}));
  EXPECT_EQ(config.topActivities, 4u);
  EXPECT_DOUBLE_EQ(config.conformance.orderViolationPenalty, 0.2);
  EXPECT_DOUBLE_EQ(config.conformance.partialThreshold, 0.4);
  EXPECT_DOUBLE_EQ(config.conformance.conformingThreshold, 0.8);
  EXPECT_EQ(config.bottlenecks.topN, 3u);
  EXPECT_EQ(config.bottlenecks.overloadWorkload, 25);
  EXPECT_EQ(config.anomalyMode, AnomalyMode::Random);
  EXPECT_DOUBLE_EQ(config.randomErrorRate, 0.25);
  EXPECT_EQ(config.randomSeed, 7u);
}

TEST(ConfigTest, RejectsUnknownAnomalyMode) {
  auto [config, err] =
      ConfigLoader::FromJson(json::parse(R"({"anomalies": {"mode": "chaos"}})"));
  ASSERT_NE(err, nullptr);
  std::shared_ptr<errors::ContractError> contract;
  ASSERT_TRUE(errors::As(err, &contract));
  EXPECT_EQ(contract->Field(), "anomalies.mode");
}

TEST(ConfigTest, RejectsWrongTypes) {
  auto [c1, err1] = ConfigLoader::FromJson(json::parse(R"({"ideal_flow": 3})"));
  EXPECT_NE(err1, nullptr);

  auto [c2, err2] = ConfigLoader::FromJson(
      json::parse(R"({"conformance": {"conforming_threshold": "high"}})"));
  EXPECT_NE(err2, nullptr);

  auto [c3, err3] = ConfigLoader::FromJson(json::array());
  EXPECT_NE(err3, nullptr);
}

TEST(ConfigTest, ValidateCollectsEveryProblem) {
  AnalyzerConfig config;
  config.idealFlow = {"A", "B", "A"};
  config.conformance.partialThreshold = 0.9;
  config.randomErrorRate = 1.5;
  config.anomalyMode = AnomalyMode::Reported;

  error err = ConfigLoader::Validate(config);
  ASSERT_NE(err, nullptr);
  EXPECT_EQ(err->GetJoined().size(), 4u);
  EXPECT_NE(err->What().find("repeats position 0"), std::string::npos);
  EXPECT_NE(err->What().find("anomalies.reported_file"), std::string::npos);
}

TEST(ConfigTest, DefaultsAreValid) {
  EXPECT_EQ(ConfigLoader::Validate(AnalyzerConfig()), nullptr);
}

TEST(ConfigTest, ToJsonCanBeLoadedBack) {
  AnalyzerConfig config;
  config.idealFlow = {"One", "Two"};
  config.bottlenecks.slowTransitionHours = 4.5;
  config.anomalyMode = AnomalyMode::Reported;
  config.reportedAnomaliesFile = "errors.json";

  auto doc = ConfigLoader::ToJson(config);
  EXPECT_EQ(doc["anomalies"]["mode"], "reported");
  EXPECT_EQ(doc["ideal_flow"].size(), 2u);

  auto [loaded, err] = ConfigLoader::FromJson(doc);
  ASSERT_EQ(err, nullptr);
  EXPECT_EQ(loaded.idealFlow, config.idealFlow);
  EXPECT_DOUBLE_EQ(loaded.bottlenecks.slowTransitionHours, 4.5);
  EXPECT_EQ(loaded.reportedAnomaliesFile, "errors.json");
}

TEST(ConfigTest, LoadReadsFileAndReportsPath) {
  const std::string path = ::testing::TempDir() + "process_miner_config.json";
  {
    std::ofstream out(path);
    out << R"({"top_activities": 3})";
  }
  auto [config, err] = ConfigLoader::Load(path);
  ASSERT_EQ(err, nullptr);
  EXPECT_EQ(config.topActivities, 3u);

  {
    std::ofstream out(path, std::ios::trunc);
    out << R"({"ideal_flow": []})";
  }
  auto [bad, badErr] = ConfigLoader::Load(path);
  ASSERT_NE(badErr, nullptr);
  EXPECT_NE(badErr->What().find(path), std::string::npos);
  std::remove(path.c_str());

  auto [missing, missingErr] = ConfigLoader::Load(path);
  EXPECT_NE(missingErr, nullptr);
}

}  // namespace
}  // namespace process_miner

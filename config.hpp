#pragma once

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "bottleneck_analyzer.hpp"
#include "conformance_checker.hpp"
#include "ports/errors/errors.hpp"

namespace process_miner {

enum class AnomalyMode : int {
  None = 0,      // no errors reported
  Random = 1,    // synthetic demo signal
  Reported = 2,  // counts read from reportedAnomaliesFile
};

std::string_view ToString(AnomalyMode mode);

// Start Process -> Review Application -> Analyze Data -> Make Decision ->
// Complete Process.
std::vector<std::string> DefaultIdealFlow();

struct AnalyzerConfig {
  std::vector<std::string> idealFlow = DefaultIdealFlow();
  ConformanceConfig conformance;
  BottleneckConfig bottlenecks;
  size_t topActivities = 10;

  AnomalyMode anomalyMode = AnomalyMode::None;
  double randomErrorRate = 0.1;
  uint32_t randomSeed = 42;
  std::string reportedAnomaliesFile;
};

class ConfigLoader {
 public:
  // Every key is optional; missing keys keep their defaults.
  static std::tuple<AnalyzerConfig, error> Load(const std::string& path);

  static std::tuple<AnalyzerConfig, error> FromJson(const nlohmann::json& doc);

  static nlohmann::json ToJson(const AnalyzerConfig& config);

  // Checks ranges and the ideal flow.
  static error Validate(const AnalyzerConfig& config);
};

}  // namespace process_miner

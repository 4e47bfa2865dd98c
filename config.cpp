#include "config.hpp"

#include <fstream>

namespace process_miner {

namespace {

std::tuple<AnomalyMode, error> parseAnomalyMode(const std::string& text) {
  if (text == "none") return {AnomalyMode::None, nullptr};
  if (text == "random") return {AnomalyMode::Random, nullptr};
  if (text == "reported") return {AnomalyMode::Reported, nullptr};
  return {AnomalyMode::None,
          errors::Contract("config", "anomalies.mode",
                           "must be none, random or reported (got '" + text +
                               "')")};
}

}  // namespace

std::string_view ToString(AnomalyMode mode) {
  switch (mode) {
    case AnomalyMode::None:
      return "none";
    case AnomalyMode::Random:
      return "random";
    case AnomalyMode::Reported:
      return "reported";
  }
  return "unknown";
}

std::vector<std::string> DefaultIdealFlow() {
  return {"Start Process", "Review Application", "Analyze Data",
          "Make Decision", "Complete Process"};
}

std::tuple<AnalyzerConfig, error> ConfigLoader::Load(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return {AnalyzerConfig(), errors::New("failed to open config file: " + path)};
  }

  nlohmann::json doc;
  try {
    file >> doc;
  } catch (const nlohmann::json::parse_error& e) {
    return {AnalyzerConfig(), errors::Errorf("config {}: {}", path, e.what())};
  }

  auto [config, err] = FromJson(doc);
  if (err) {
    return {AnalyzerConfig(), errors::Wrap(err, "config " + path)};
  }
  return {config, nullptr};
}

std::tuple<AnalyzerConfig, error> ConfigLoader::FromJson(
    const nlohmann::json& doc) {
  if (!doc.is_object()) {
    return {AnalyzerConfig(), errors::New("expected a JSON object")};
  }

  AnalyzerConfig config;
  try {
    config.idealFlow = doc.value("ideal_flow", config.idealFlow);
    config.topActivities = doc.value("top_activities", config.topActivities);

    if (doc.contains("conformance")) {
      const auto& c = doc.at("conformance");
      auto& out = config.conformance;
      out.extraActivitySlack =
          c.value("extra_activity_slack", out.extraActivitySlack);
      out.missingActivitySlack =
          c.value("missing_activity_slack", out.missingActivitySlack);
      out.orderViolationPenalty =
          c.value("order_violation_penalty", out.orderViolationPenalty);
      out.conformingThreshold =
          c.value("conforming_threshold", out.conformingThreshold);
      out.partialThreshold = c.value("partial_threshold", out.partialThreshold);
    }

    if (doc.contains("bottlenecks")) {
      const auto& b = doc.at("bottlenecks");
      auto& out = config.bottlenecks;
      out.topN = b.value("top_n", out.topN);
      out.slowTransitionHours =
          b.value("slow_transition_hours", out.slowTransitionHours);
      out.overloadWorkload = b.value("overload_workload", out.overloadWorkload);
      out.qualityErrorRate = b.value("quality_error_rate", out.qualityErrorRate);
      out.variableTransitionHours =
          b.value("variable_transition_hours", out.variableTransitionHours);
    }

    if (doc.contains("anomalies")) {
      const auto& a = doc.at("anomalies");
      auto [mode, err] =
          parseAnomalyMode(a.value("mode", std::string(ToString(config.anomalyMode))));
      if (err) {
        return {AnalyzerConfig(), err};
      }
      config.anomalyMode = mode;
      config.randomErrorRate = a.value("random_rate", config.randomErrorRate);
      config.randomSeed = a.value("seed", config.randomSeed);
      config.reportedAnomaliesFile =
          a.value("reported_file", config.reportedAnomaliesFile);
    }
  } catch (const nlohmann::json::exception& e) {
    return {AnalyzerConfig(), errors::New(e.what())};
  }

  if (auto err = Validate(config)) {
    return {AnalyzerConfig(), err};
  }
  return {config, nullptr};
}

nlohmann::json ConfigLoader::ToJson(const AnalyzerConfig& config) {
  const auto& c = config.conformance;
  const auto& b = config.bottlenecks;
  return {
      {"ideal_flow", config.idealFlow},
      {"top_activities", config.topActivities},
      {"conformance",
       {{"extra_activity_slack", c.extraActivitySlack},
        {"missing_activity_slack", c.missingActivitySlack},
        {"order_violation_penalty", c.orderViolationPenalty},
        {"conforming_threshold", c.conformingThreshold},
        {"partial_threshold", c.partialThreshold}}},
      {"bottlenecks",
       {{"top_n", b.topN},
        {"slow_transition_hours", b.slowTransitionHours},
        {"overload_workload", b.overloadWorkload},
        {"quality_error_rate", b.qualityErrorRate},
        {"variable_transition_hours", b.variableTransitionHours}}},
      {"anomalies",
       {{"mode", std::string(ToString(config.anomalyMode))},
        {"random_rate", config.randomErrorRate},
        {"seed", config.randomSeed},
        {"reported_file", config.reportedAnomaliesFile}}},
  };
}

error ConfigLoader::Validate(const AnalyzerConfig& config) {
  std::vector<error> problems;
  problems.push_back(ConformanceChecker::ValidateIdealFlow(config.idealFlow));

  const auto& c = config.conformance;
  if (c.extraActivitySlack < 0 || c.missingActivitySlack < 0) {
    problems.push_back(
        errors::Contract("config", "conformance slack", "must not be negative"));
  }
  if (c.orderViolationPenalty < 0.0) {
    problems.push_back(errors::Contract(
        "config", "conformance.order_violation_penalty", "must not be negative"));
  }
  if (c.partialThreshold < 0.0 || c.conformingThreshold > 1.0 ||
      c.partialThreshold > c.conformingThreshold) {
    problems.push_back(errors::Contract(
        "config", "conformance thresholds",
        "must satisfy 0 <= partial_threshold <= conforming_threshold <= 1"));
  }
  if (config.randomErrorRate < 0.0 || config.randomErrorRate > 1.0) {
    problems.push_back(errors::Contract("config", "anomalies.random_rate",
                                        "must be within [0, 1]"));
  }
  if (config.anomalyMode == AnomalyMode::Reported &&
      config.reportedAnomaliesFile.empty()) {
    problems.push_back(errors::Contract("config", "anomalies.reported_file",
                                        "is required in reported mode"));
  }
  return errors::Join(std::move(problems));
}

}  // namespace process_miner

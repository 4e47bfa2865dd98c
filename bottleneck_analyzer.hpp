#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "anomaly_source.hpp"
#include "event_log.hpp"

namespace process_miner {

// Durations are in hours.
struct BottleneckEntry {
  std::string transition;  // "from → to"
  double avgDuration = 0.0;
  double maxDuration = 0.0;
  int64_t occurrences = 0;
  double variability = 0.0;  // population standard deviation

  bool operator==(const BottleneckEntry&) const = default;
};

struct ResourceProfile {
  std::string resource;
  int64_t workload = 0;
  int64_t errors = 0;
  double errorRate = 0.0;  // percent, 0..100

  bool operator==(const ResourceProfile&) const = default;
};

enum class Severity : int { Low = 0, Medium = 1, High = 2 };

std::string_view ToString(Severity severity);

struct IssueCategory {
  std::string category;
  int64_t count = 0;
  Severity severity = Severity::Low;

  bool operator==(const IssueCategory&) const = default;
};

struct BottleneckConfig {
  size_t topN = 8;
  double slowTransitionHours = 2.0;
  int64_t overloadWorkload = 10;
  double qualityErrorRate = 5.0;
  double variableTransitionHours = 1.0;
};

struct BottleneckReport {
  std::vector<BottleneckEntry> all;      // ordered by transition
  std::vector<BottleneckEntry> ranked;   // top-N by avgDuration desc
  std::vector<ResourceProfile> resources;  // errorRate desc, then name
  std::vector<IssueCategory> issues;

  bool operator==(const BottleneckReport&) const = default;
};

class BottleneckAnalyzer {
 public:
  static BottleneckReport Analyze(
      const CasesView& cases, AnomalySource& anomalies,
      const BottleneckConfig& config = BottleneckConfig());

  static std::string TransitionKey(const std::string& from,
                                   const std::string& to);

  static BottleneckEntry Summarize(const std::string& transition,
                                   const std::vector<double>& durations);

  static std::vector<IssueCategory> Categorize(
      const std::vector<BottleneckEntry>& ranked,
      const std::vector<ResourceProfile>& resources,
      const BottleneckConfig& config);
};

}  // namespace process_miner

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "event_log.hpp"
#include "ports/errors/errors.hpp"

namespace process_miner {

enum class ConformanceStatus : int {
  Conforming = 0,
  PartiallyConforming = 1,
  NonConforming = 2
};

std::string_view ToString(ConformanceStatus status);

// Deviation labels as they appear in results and in the tally.
inline constexpr std::string_view kExtraActivities = "Extra activities detected";
inline constexpr std::string_view kMissingActivities = "Missing activities";
inline constexpr std::string_view kWrongOrder = "Wrong activity order";

struct ConformanceConfig {
  // "Extra activities" when a case is longer than ideal + extraActivitySlack.
  int extraActivitySlack = 2;
  // "Missing activities" when a case is shorter than ideal - missingActivitySlack.
  int missingActivitySlack = 1;
  // Subtracted from coverage once per adjacent inversion.
  double orderViolationPenalty = 0.1;
  double conformingThreshold = 0.8;
  double partialThreshold = 0.5;
};

struct ConformanceResult {
  std::string caseId;
  ConformanceStatus status = ConformanceStatus::NonConforming;
  int score = 0;  // 0..100
  std::vector<std::string> deviations;
  double coverage = 0.0;
  int64_t orderViolations = 0;

  bool operator==(const ConformanceResult&) const = default;
};

struct ConformanceReport {
  std::vector<ConformanceResult> cases;  // ordered by case id
  std::map<std::string, int64_t> deviationTally;  // label -> cases
  int64_t conformingCases = 0;
  int64_t partiallyConformingCases = 0;
  int64_t nonConformingCases = 0;
  int64_t totalCases = 0;
  int overallConformance = 0;  // % of conforming cases

  bool operator==(const ConformanceReport&) const = default;
};

class ConformanceChecker {
 public:
  // The ideal flow must be non-empty with distinct, non-empty labels.
  static error ValidateIdealFlow(const std::vector<std::string>& idealFlow);

  static std::tuple<ConformanceReport, error> Check(
      const CasesView& cases, const std::vector<std::string>& idealFlow,
      const ConformanceConfig& config = ConformanceConfig());

 private:
  using PositionIndex = std::unordered_map<std::string, int64_t>;

  static ConformanceResult checkCase(const std::string& caseId,
                                     const Case& events,
                                     const PositionIndex& positions,
                                     int64_t idealLength,
                                     const ConformanceConfig& config);
};

}  // namespace process_miner

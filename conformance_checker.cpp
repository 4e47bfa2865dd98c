#include "conformance_checker.hpp"

#include <algorithm>
#include <cmath>

namespace process_miner {

std::string_view ToString(ConformanceStatus status) {
  switch (status) {
    case ConformanceStatus::Conforming:
      return "conforming";
    case ConformanceStatus::PartiallyConforming:
      return "partially-conforming";
    case ConformanceStatus::NonConforming:
      return "non-conforming";
  }
  return "unknown";
}

error ConformanceChecker::ValidateIdealFlow(
    const std::vector<std::string>& idealFlow) {
  if (idealFlow.empty()) {
    return errors::Contract("ideal flow", "labels", "must not be empty");
  }

  std::vector<error> violations;
  PositionIndex seen;
  for (size_t i = 0; i < idealFlow.size(); ++i) {
    const auto& label = idealFlow[i];
    std::string subject = "ideal flow[" + std::to_string(i) + "]";
    if (label.empty()) {
      violations.push_back(errors::Contract(subject, "label", "is empty"));
      continue;
    }
    auto [it, inserted] = seen.emplace(label, static_cast<int64_t>(i));
    if (!inserted) {
      violations.push_back(errors::Contract(
          subject, "label",
          "'" + label + "' repeats position " + std::to_string(it->second)));
    }
  }
  return errors::Join(std::move(violations));
}

std::tuple<ConformanceReport, error> ConformanceChecker::Check(
    const CasesView& cases, const std::vector<std::string>& idealFlow,
    const ConformanceConfig& config) {
  if (auto err = ValidateIdealFlow(idealFlow)) {
    return {ConformanceReport(), err};
  }

  PositionIndex positions;
  for (size_t i = 0; i < idealFlow.size(); ++i) {
    positions.emplace(idealFlow[i], static_cast<int64_t>(i));
  }
  const auto idealLength = static_cast<int64_t>(idealFlow.size());

  ConformanceReport report;
  report.cases.reserve(cases.size());
  for (const auto& [caseId, events] : cases) {
    auto result = checkCase(caseId, events, positions, idealLength, config);

    switch (result.status) {
      case ConformanceStatus::Conforming:
        report.conformingCases++;
        break;
      case ConformanceStatus::PartiallyConforming:
        report.partiallyConformingCases++;
        break;
      case ConformanceStatus::NonConforming:
        report.nonConformingCases++;
        break;
    }
    // Each label appears at most once per case.
    for (const auto& deviation : result.deviations) {
      report.deviationTally[deviation]++;
    }
    report.cases.push_back(std::move(result));
  }

  report.totalCases = static_cast<int64_t>(report.cases.size());
  if (report.totalCases > 0) {
    report.overallConformance = static_cast<int>(
        std::lround(static_cast<double>(report.conformingCases) /
                    static_cast<double>(report.totalCases) * 100.0));
  }
  return {report, nullptr};
}

ConformanceResult ConformanceChecker::checkCase(
    const std::string& caseId, const Case& events,
    const PositionIndex& positions, int64_t idealLength,
    const ConformanceConfig& config) {
  ConformanceResult result;
  result.caseId = caseId;

  const auto actualLength = static_cast<int64_t>(events.size());

  // Repeated activities each count toward coverage.
  int64_t covered = 0;
  std::vector<int64_t> indices;
  indices.reserve(events.size());
  for (const auto& event : events) {
    auto it = positions.find(event.activity);
    if (it == positions.end()) {
      indices.push_back(-1);
    } else {
      indices.push_back(it->second);
      covered++;
    }
  }
  result.coverage =
      static_cast<double>(covered) / static_cast<double>(idealLength);

  if (actualLength > idealLength + config.extraActivitySlack) {
    result.deviations.emplace_back(kExtraActivities);
  }
  if (actualLength < idealLength - config.missingActivitySlack) {
    result.deviations.emplace_back(kMissingActivities);
  }

  for (size_t i = 1; i < indices.size(); ++i) {
    int64_t prevIdx = indices[i - 1];
    int64_t currIdx = indices[i];
    if (prevIdx >= 0 && currIdx >= 0 && currIdx < prevIdx) {
      result.orderViolations++;
    }
  }
  if (result.orderViolations > 0) {
    result.deviations.emplace_back(kWrongOrder);
  }

  double score = result.coverage - config.orderViolationPenalty *
                                       static_cast<double>(result.orderViolations);
  score = std::clamp(score, 0.0, 1.0);

  if (score >= config.conformingThreshold && result.deviations.empty()) {
    result.status = ConformanceStatus::Conforming;
  } else if (score >= config.partialThreshold) {
    result.status = ConformanceStatus::PartiallyConforming;
  } else {
    result.status = ConformanceStatus::NonConforming;
  }
  result.score = static_cast<int>(std::lround(score * 100.0));
  return result;
}

}  // namespace process_miner

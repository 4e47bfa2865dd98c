#include "bottleneck_analyzer.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace process_miner {

std::string_view ToString(Severity severity) {
  switch (severity) {
    case Severity::Low:
      return "low";
    case Severity::Medium:
      return "medium";
    case Severity::High:
      return "high";
  }
  return "unknown";
}

std::string BottleneckAnalyzer::TransitionKey(const std::string& from,
                                              const std::string& to) {
  return from + " → " + to;
}

BottleneckEntry BottleneckAnalyzer::Summarize(
    const std::string& transition, const std::vector<double>& durations) {
  BottleneckEntry entry;
  entry.transition = transition;
  entry.occurrences = static_cast<int64_t>(durations.size());
  if (durations.empty()) {
    return entry;
  }

  double sum = 0.0;
  for (double d : durations) {
    sum += d;
    entry.maxDuration = std::max(entry.maxDuration, d);
  }
  entry.avgDuration = sum / static_cast<double>(durations.size());

  double squares = 0.0;
  for (double d : durations) {
    squares += (d - entry.avgDuration) * (d - entry.avgDuration);
  }
  entry.variability = std::sqrt(squares / static_cast<double>(durations.size()));
  return entry;
}

BottleneckReport BottleneckAnalyzer::Analyze(const CasesView& cases,
                                             AnomalySource& anomalies,
                                             const BottleneckConfig& config) {
  std::map<std::string, std::vector<double>> transitionDurations;
  std::map<std::string, int64_t> workload;

  for (const auto& [caseId, events] : cases) {
    for (size_t i = 0; i < events.size(); ++i) {
      workload[events[i].resource]++;
      if (i == 0) continue;
      transitionDurations[TransitionKey(events[i - 1].activity,
                                        events[i].activity)]
          .push_back(EventLog::HoursBetween(events[i - 1], events[i]));
    }
  }

  BottleneckReport report;
  report.all.reserve(transitionDurations.size());
  for (const auto& [transition, durations] : transitionDurations) {
    report.all.push_back(Summarize(transition, durations));
  }

  report.ranked = report.all;
  std::stable_sort(report.ranked.begin(), report.ranked.end(),
                   [](const BottleneckEntry& a, const BottleneckEntry& b) {
                     return a.avgDuration > b.avgDuration;
                   });
  if (report.ranked.size() > config.topN) {
    report.ranked.resize(config.topN);
  }

  const ResourceErrors reported = anomalies.ErrorsByResource(cases);
  report.resources.reserve(workload.size());
  for (const auto& [resource, count] : workload) {
    ResourceProfile profile;
    profile.resource = resource;
    profile.workload = count;
    auto it = reported.find(resource);
    profile.errors = (it == reported.end()) ? 0 : it->second;
    if (profile.workload > 0) {
      // External feeds may report more errors than work items.
      profile.errorRate = std::min(
          100.0, static_cast<double>(profile.errors) /
                     static_cast<double>(profile.workload) * 100.0);
    }
    report.resources.push_back(std::move(profile));
  }
  std::stable_sort(report.resources.begin(), report.resources.end(),
                   [](const ResourceProfile& a, const ResourceProfile& b) {
                     return a.errorRate > b.errorRate;
                   });

  report.issues = Categorize(report.ranked, report.resources, config);
  return report;
}

std::vector<IssueCategory> BottleneckAnalyzer::Categorize(
    const std::vector<BottleneckEntry>& ranked,
    const std::vector<ResourceProfile>& resources,
    const BottleneckConfig& config) {
  auto slow = std::count_if(ranked.begin(), ranked.end(), [&](const auto& b) {
    return b.avgDuration > config.slowTransitionHours;
  });
  auto overloaded =
      std::count_if(resources.begin(), resources.end(), [&](const auto& r) {
        return r.workload > config.overloadWorkload;
      });
  auto faulty =
      std::count_if(resources.begin(), resources.end(), [&](const auto& r) {
        return r.errorRate > config.qualityErrorRate;
      });
  auto variable = std::count_if(ranked.begin(), ranked.end(), [&](const auto& b) {
    return b.variability > config.variableTransitionHours;
  });

  return {
      {"Process Bottlenecks", static_cast<int64_t>(slow), Severity::High},
      {"Resource Overload", static_cast<int64_t>(overloaded), Severity::Medium},
      {"Quality Issues", static_cast<int64_t>(faulty), Severity::High},
      {"Timing Variability", static_cast<int64_t>(variable), Severity::Low},
  };
}

}  // namespace process_miner

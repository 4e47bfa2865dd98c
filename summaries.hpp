#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "event_log.hpp"

namespace process_miner {

struct ActivityCount {
  std::string activity;
  int64_t count = 0;

  bool operator==(const ActivityCount&) const = default;
};

struct DailyCases {
  std::string date;  // YYYY-MM-DD, UTC
  int64_t cases = 0;

  bool operator==(const DailyCases&) const = default;
};

struct Summaries {
  int64_t totalCases = 0;
  int64_t totalEvents = 0;
  int64_t uniqueResources = 0;
  int64_t uniqueActivities = 0;
  std::vector<ActivityCount> activityFrequency;  // count desc, then label
  std::vector<DailyCases> casesPerDay;           // date asc

  bool operator==(const Summaries&) const = default;
};

class SummaryBuilder {
 public:
  static Summaries Summarize(const std::vector<Event>& events,
                             size_t topActivities = 10);
};

}  // namespace process_miner

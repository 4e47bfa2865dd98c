#include "summaries.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <unordered_set>

namespace process_miner {

Summaries SummaryBuilder::Summarize(const std::vector<Event>& events,
                                    size_t topActivities) {
  std::unordered_set<std::string> caseIds;
  std::unordered_set<std::string> resources;
  std::map<std::string, int64_t> activityCount;
  // A case counts once per day no matter how many events it has that day.
  std::map<std::string, std::set<std::string>> casesByDay;

  for (const auto& event : events) {
    caseIds.insert(event.caseId);
    resources.insert(event.resource);
    activityCount[event.activity]++;
    casesByDay[EventLog::FormatDate(event.timestampMs)].insert(event.caseId);
  }

  Summaries summaries;
  summaries.totalCases = static_cast<int64_t>(caseIds.size());
  summaries.totalEvents = static_cast<int64_t>(events.size());
  summaries.uniqueResources = static_cast<int64_t>(resources.size());
  summaries.uniqueActivities = static_cast<int64_t>(activityCount.size());

  for (const auto& [activity, count] : activityCount) {
    summaries.activityFrequency.push_back({activity, count});
  }
  std::stable_sort(summaries.activityFrequency.begin(),
                   summaries.activityFrequency.end(),
                   [](const ActivityCount& a, const ActivityCount& b) {
                     return a.count > b.count;
                   });
  if (summaries.activityFrequency.size() > topActivities) {
    summaries.activityFrequency.resize(topActivities);
  }

  for (const auto& [date, ids] : casesByDay) {
    summaries.casesPerDay.push_back({date, static_cast<int64_t>(ids.size())});
  }
  return summaries;
}

}  // namespace process_miner

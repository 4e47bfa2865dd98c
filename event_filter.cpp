#include "event_filter.hpp"

#include <algorithm>
#include <iterator>

namespace process_miner {

bool EventFilter::IsEmpty() const {
  return !fromMs && !toMs && activity.empty() && resource.empty();
}

bool EventFilter::Matches(const Event& event) const {
  if (fromMs && event.timestampMs < *fromMs) return false;
  if (toMs && event.timestampMs > *toMs) return false;
  if (!activity.empty() && event.activity.find(activity) == std::string::npos) {
    return false;
  }
  if (!resource.empty() && event.resource.find(resource) == std::string::npos) {
    return false;
  }
  return true;
}

std::vector<Event> EventFilter::Apply(const std::vector<Event>& events) const {
  if (IsEmpty()) return events;

  std::vector<Event> kept;
  std::copy_if(events.begin(), events.end(), std::back_inserter(kept),
               [this](const Event& event) { return Matches(event); });
  return kept;
}

}  // namespace process_miner

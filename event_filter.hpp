#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "event_log.hpp"

namespace process_miner {

// Date range plus substring filters over activity and resource. Unset
// bounds and empty substrings match everything.
struct EventFilter {
  std::optional<int64_t> fromMs;  // inclusive
  std::optional<int64_t> toMs;    // inclusive
  std::string activity;
  std::string resource;

  bool IsEmpty() const;
  bool Matches(const Event& event) const;

  // Keeps matching events in input order.
  std::vector<Event> Apply(const std::vector<Event>& events) const;
};

}  // namespace process_miner

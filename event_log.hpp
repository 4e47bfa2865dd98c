#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <tuple>
#include <vector>

#include "ports/errors/errors.hpp"

namespace process_miner {

constexpr double kMsPerHour = 3'600'000.0;

// One row of the process log. Timestamps are UTC milliseconds since epoch.
struct Event {
  std::string caseId;
  std::string activity;
  int64_t timestampMs = 0;
  std::string resource;

  bool operator==(const Event&) const = default;
};

// Events of one case, ascending by timestamp.
using Case = std::vector<Event>;

// case_id -> ordered case. Shared read-only by every analysis.
using CasesView = std::map<std::string, Case>;

class EventLog {
 public:
  // Groups events by case id and stable-sorts each group by timestamp, so
  // events with equal timestamps keep their input order.
  static CasesView GroupAndSort(const std::vector<Event>& events);

  // Reports every event with an empty case_id, activity or resource. All
  // violations are joined into one error; nullptr when the log is clean.
  static error Validate(const std::vector<Event>& events);

  // Validate + GroupAndSort.
  static std::tuple<CasesView, error> Build(const std::vector<Event>& events);

  // Absolute gap between two events in hours.
  static double HoursBetween(const Event& from, const Event& to);

  static std::tuple<int64_t, error> ParseTimestamp(const std::string& text);

  // "YYYY-MM-DD" (UTC).
  static std::string FormatDate(int64_t timestampMs);

  // "YYYY-MM-DDTHH:MM:SS.mmmZ".
  static std::string FormatTimestamp(int64_t timestampMs);

  static size_t CountEvents(const CasesView& cases);
};

}  // namespace process_miner

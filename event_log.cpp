#include "event_log.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace process_miner {

namespace {

bool readNumber(const std::string& text, size_t& pos, size_t width, int& out) {
  if (pos + width > text.size()) return false;
  int value = 0;
  for (size_t i = 0; i < width; ++i) {
    char c = text[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    value = value * 10 + (c - '0');
  }
  pos += width;
  out = value;
  return true;
}

bool expect(const std::string& text, size_t& pos, char c) {
  if (pos >= text.size() || text[pos] != c) return false;
  ++pos;
  return true;
}

bool isEpochMillis(const std::string& text) {
  if (text.empty()) return false;
  size_t start = (text[0] == '-') ? 1 : 0;
  if (start == text.size()) return false;
  return std::all_of(text.begin() + start, text.end(), [](char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
  });
}

std::string trim(const std::string& text) {
  auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return "";
  auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

std::tm toUtc(int64_t timestampMs) {
  int64_t sec = timestampMs / 1000;
  if (timestampMs % 1000 < 0) --sec;
  std::time_t t = static_cast<std::time_t>(sec);
  std::tm tm_buf{};
#ifdef _WIN32
  gmtime_s(&tm_buf, &t);
#else
  gmtime_r(&t, &tm_buf);
#endif
  return tm_buf;
}

}  // namespace

CasesView EventLog::GroupAndSort(const std::vector<Event>& events) {
  CasesView cases;
  for (const auto& event : events) {
    cases[event.caseId].push_back(event);
  }
  for (auto& [caseId, caseEvents] : cases) {
    std::stable_sort(caseEvents.begin(), caseEvents.end(),
                     [](const Event& a, const Event& b) {
                       return a.timestampMs < b.timestampMs;
                     });
  }
  return cases;
}

error EventLog::Validate(const std::vector<Event>& events) {
  std::vector<error> violations;
  for (size_t i = 0; i < events.size(); ++i) {
    const auto& event = events[i];
    std::string subject = "event #" + std::to_string(i);
    if (event.caseId.empty()) {
      violations.push_back(errors::Contract(subject, "case_id", "is empty"));
    }
    if (event.activity.empty()) {
      violations.push_back(errors::Contract(subject, "activity", "is empty"));
    }
    if (event.resource.empty()) {
      violations.push_back(errors::Contract(subject, "resource", "is empty"));
    }
  }
  return errors::Join(std::move(violations));
}

std::tuple<CasesView, error> EventLog::Build(const std::vector<Event>& events) {
  if (auto err = Validate(events)) {
    return {CasesView(), errors::Wrap(err, "invalid event log")};
  }
  return {GroupAndSort(events), nullptr};
}

double EventLog::HoursBetween(const Event& from, const Event& to) {
  int64_t diff = to.timestampMs - from.timestampMs;
  return static_cast<double>(diff < 0 ? -diff : diff) / kMsPerHour;
}

std::tuple<int64_t, error> EventLog::ParseTimestamp(const std::string& raw) {
  const std::string text = trim(raw);
  if (text.empty()) {
    return {0, errors::New("empty timestamp")};
  }

  if (isEpochMillis(text)) {
    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || end != text.c_str() + text.size()) {
      return {0, errors::New("epoch timestamp out of range: " + text)};
    }
    return {static_cast<int64_t>(parsed), nullptr};
  }

  std::tm tm = {};
  size_t pos = 0;
  int year = 0, month = 0, day = 0;
  if (!readNumber(text, pos, 4, year) || !expect(text, pos, '-') ||
      !readNumber(text, pos, 2, month) || !expect(text, pos, '-') ||
      !readNumber(text, pos, 2, day)) {
    return {0, errors::New("unrecognized timestamp: " + text)};
  }

  int hour = 0, minute = 0, second = 0, millis = 0;
  int offsetMinutes = 0;
  if (pos < text.size()) {
    if (text[pos] != 'T' && text[pos] != ' ') {
      return {0, errors::New("unrecognized timestamp: " + text)};
    }
    ++pos;
    if (!readNumber(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !readNumber(text, pos, 2, minute)) {
      return {0, errors::New("unrecognized timestamp: " + text)};
    }
    if (pos < text.size() && text[pos] == ':') {
      ++pos;
      if (!readNumber(text, pos, 2, second)) {
        return {0, errors::New("unrecognized timestamp: " + text)};
      }
      if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() &&
               std::isdigit(static_cast<unsigned char>(text[pos]))) {
          // Sub-millisecond digits are truncated.
          if (digits < 3) millis = millis * 10 + (text[pos] - '0');
          ++digits;
          ++pos;
        }
        if (digits == 0) {
          return {0, errors::New("unrecognized timestamp: " + text)};
        }
        for (; digits < 3; ++digits) millis *= 10;
      }
    }
    if (pos < text.size()) {
      char zone = text[pos];
      if (zone == 'Z') {
        ++pos;
      } else if (zone == '+' || zone == '-') {
        ++pos;
        int offHour = 0, offMinute = 0;
        if (!readNumber(text, pos, 2, offHour)) {
          return {0, errors::New("unrecognized timestamp: " + text)};
        }
        expect(text, pos, ':');
        if (!readNumber(text, pos, 2, offMinute)) {
          return {0, errors::New("unrecognized timestamp: " + text)};
        }
        offsetMinutes = (offHour * 60 + offMinute) * (zone == '-' ? -1 : 1);
      }
    }
    if (pos != text.size()) {
      return {0, errors::New("unrecognized timestamp: " + text)};
    }
  }

  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
      minute > 59 || second > 60) {
    return {0, errors::New("timestamp field out of range: " + text)};
  }

  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;

#if defined(_WIN32)
  const std::time_t seconds = _mkgmtime(&tm);
#else
  const std::time_t seconds = timegm(&tm);
#endif
  if (seconds == static_cast<std::time_t>(-1) && year != 1969) {
    return {0, errors::New("timestamp not representable: " + text)};
  }

  int64_t ms = static_cast<int64_t>(seconds) * 1000 + millis;
  ms -= static_cast<int64_t>(offsetMinutes) * 60 * 1000;
  return {ms, nullptr};
}

std::string EventLog::FormatDate(int64_t timestampMs) {
  std::tm tm_buf = toUtc(timestampMs);
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d");
  return oss.str();
}

std::string EventLog::FormatTimestamp(int64_t timestampMs) {
  std::tm tm_buf = toUtc(timestampMs);
  int64_t msRemainder = timestampMs % 1000;
  if (msRemainder < 0) msRemainder += 1000;

  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << "." << std::setfill('0')
      << std::setw(3) << msRemainder << "Z";
  return oss.str();
}

size_t EventLog::CountEvents(const CasesView& cases) {
  size_t total = 0;
  for (const auto& [caseId, caseEvents] : cases) {
    total += caseEvents.size();
  }
  return total;
}

}  // namespace process_miner

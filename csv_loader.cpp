#include "csv_loader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <kvalog/kvalog.hpp>
#include <optional>
#include <sstream>

namespace process_miner {

namespace {

std::string clean(std::string value) {
  value.erase(std::remove(value.begin(), value.end(), '"'), value.end());
  auto first = value.find_first_not_of(" \t\r");
  if (first == std::string::npos) return "";
  auto last = value.find_last_not_of(" \t\r");
  return value.substr(first, last - first + 1);
}

std::string lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

}  // namespace

std::tuple<std::vector<Event>, error> CsvLoader::Load(
    const std::string& csvFile) {
  std::ifstream file(csvFile);
  if (!file.is_open()) {
    return {std::vector<Event>(),
            errors::New("failed to open CSV file: " + csvFile)};
  }
  return Parse(file, csvFile);
}

std::tuple<std::vector<Event>, error> CsvLoader::Parse(
    std::istream& in, const std::string& source) {
  auto logger = kvalog::CreateLogger("process_miner", "csv_loader");

  std::string line;
  if (!std::getline(in, line) || clean(line).empty()) {
    return {std::vector<Event>(), errors::New("CSV is empty: " + source)};
  }

  auto [layout, err] = parseHeader(line);
  if (err) {
    return {std::vector<Event>(), errors::Wrap(err, source)};
  }

  std::vector<Event> events;
  size_t lineNumber = 1;
  size_t skipped = 0;

  while (std::getline(in, line)) {
    ++lineNumber;
    if (clean(line).empty()) continue;

    auto fields = splitRow(line);
    if (fields.size() != layout.columns) {
      ++skipped;
      logger.Warning(source + ":" + std::to_string(lineNumber) + " has " +
                     std::to_string(fields.size()) + " columns, expected " +
                     std::to_string(layout.columns) + "; row skipped");
      continue;
    }

    Event event;
    event.caseId = fields[layout.caseId];
    event.activity = fields[layout.activity];
    event.resource = fields[layout.resource];

    auto [timestampMs, tsErr] =
        EventLog::ParseTimestamp(fields[layout.timestamp]);
    if (tsErr) {
      return {std::vector<Event>(),
              errors::Wrapf(tsErr, "{}:{}", source, lineNumber)};
    }
    event.timestampMs = timestampMs;

    events.push_back(std::move(event));
  }

  if (events.empty()) {
    return {std::vector<Event>(),
            errors::New("no valid data rows found in " + source)};
  }

  std::ostringstream msg;
  msg << "csv_loaded source=" << source << " events=" << events.size()
      << " skipped=" << skipped;
  logger.Info(msg.str());
  return {events, nullptr};
}

std::tuple<CsvLoader::ColumnLayout, error> CsvLoader::parseHeader(
    const std::string& line) {
  auto headers = splitRow(line);
  for (auto& header : headers) {
    header = lower(header);
  }

  auto find = [&](const std::string& name) -> std::optional<size_t> {
    auto it = std::find(headers.begin(), headers.end(), name);
    if (it == headers.end()) return std::nullopt;
    return static_cast<size_t>(it - headers.begin());
  };

  ColumnLayout layout;
  layout.columns = headers.size();

  std::vector<std::string> missing;
  auto require = [&](const std::string& name, size_t& slot) {
    if (auto index = find(name)) {
      slot = *index;
    } else {
      missing.push_back(name);
    }
  };
  require("case_id", layout.caseId);
  require("activity", layout.activity);
  require("timestamp", layout.timestamp);
  require("resource", layout.resource);

  if (!missing.empty()) {
    std::string joined;
    for (size_t i = 0; i < missing.size(); ++i) {
      if (i > 0) joined += ", ";
      joined += missing[i];
    }
    return {ColumnLayout(),
            errors::Contract("CSV header", "columns", "missing " + joined)};
  }
  return {layout, nullptr};
}

std::vector<std::string> CsvLoader::splitRow(const std::string& raw) {
  std::string line = raw;
  if (!line.empty() && line.back() == '\r') line.pop_back();

  std::vector<std::string> fields;
  std::string token;
  std::stringstream ss(line);
  while (std::getline(ss, token, ',')) {
    fields.push_back(clean(token));
  }
  if (!line.empty() && line.back() == ',') {
    fields.emplace_back();
  }
  return fields;
}

}  // namespace process_miner

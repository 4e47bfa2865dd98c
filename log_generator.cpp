// log_generator.cpp
#include "log_generator.hpp"

#include "conformance_checker.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <utility>

namespace process_miner {

// ─────────────────────────────────────────────────────────────────────────────
// Constructor / factory
// ─────────────────────────────────────────────────────────────────────────────

LogGenerator::LogGenerator(const GeneratorConfig& cfg)
    : config(cfg),
      logger(kvalog::CreateLogger("process_miner", "log_generator")),
      rng(cfg.seed),
      uniformDist(0.0, 1.0),
      currentTimeMs(cfg.startTimeMs != 0
                        ? cfg.startTimeMs
                        : std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::system_clock::now().time_since_epoch())
                              .count()),
      casesGenerated(0),
      deviatingCases(0),
      firstJsonEntry(true) {}

std::tuple<std::shared_ptr<LogGenerator>, error> LogGenerator::Create(
    const GeneratorConfig& cfg) {
  if (auto err = Validate(cfg)) {
    return {nullptr, errors::Wrap(err, "invalid generator config")};
  }
  auto gen = std::shared_ptr<LogGenerator>(new LogGenerator(cfg));
  if (auto err = gen->initializeFiles()) {
    return {nullptr, err};
  }
  return {gen, nullptr};
}

error LogGenerator::Validate(const GeneratorConfig& cfg) {
  std::vector<error> problems;
  if (cfg.totalCases < 0) {
    problems.push_back(
        errors::Contract("generator", "total_cases", "must not be negative"));
  }
  problems.push_back(ConformanceChecker::ValidateIdealFlow(cfg.idealFlow));
  if (cfg.resources.empty()) {
    problems.push_back(
        errors::Contract("generator", "resources", "must not be empty"));
  }
  if (cfg.minGapHours < 0.0 || cfg.maxGapHours < cfg.minGapHours) {
    problems.push_back(errors::Contract(
        "generator", "gap hours", "must satisfy 0 <= min <= max"));
  }

  // Rows are written unquoted.
  auto checkLabel = [&](const std::string& what, const std::string& label) {
    if (label.find_first_of(",\"\n") != std::string::npos) {
      problems.push_back(errors::Contract("generator", what,
                                          "'" + label +
                                              "' contains a CSV delimiter"));
    }
  };
  for (const auto& activity : cfg.idealFlow) checkLabel("activity", activity);
  for (const auto& resource : cfg.resources) checkLabel("resource", resource);
  checkLabel("rework activity", cfg.reworkActivity);

  return errors::Join(std::move(problems));
}

// ─────────────────────────────────────────────────────────────────────────────
// Public interface
// ─────────────────────────────────────────────────────────────────────────────

error LogGenerator::Generate() {
  const int64_t baseTimeMs = currentTimeMs;
  for (int c = 0; c < config.totalCases; ++c) {
    std::ostringstream caseId;
    caseId << "CASE-" << std::setfill('0') << std::setw(5) << (c + 1);

    currentTimeMs = baseTimeMs + static_cast<int64_t>(
                                     randomDouble(0.0, config.caseStartSpreadHours) *
                                     kMsPerHour);
    for (const auto& event : GenerateCase(caseId.str())) {
      writeJsonEvent(event);
      bufferCsvEvent(event);
    }
    if (!jsonFile || !csvFile) {
      return errors::New("write failed while generating " + caseId.str());
    }
  }
  return nullptr;
}

error LogGenerator::Finalize() {
  {
    std::lock_guard<std::mutex> lock(fileMutex);

    for (const auto& event : csvBuffer) {
      csvFile << event.caseId << "," << event.activity << ","
              << EventLog::FormatTimestamp(event.timestampMs) << ","
              << event.resource << "\n";
    }
    csvBuffer.clear();

    jsonFile << "\n]\n";
    jsonFile.flush();
    csvFile.flush();
    if (!jsonFile || !csvFile) {
      return errors::New("failed to flush generated log files");
    }
  }

  std::ostringstream msg;
  msg << "generation_finished cases=" << casesGenerated
      << " deviating=" << deviatingCases;
  logger.Info(msg.str());
  logger.Flush();
  return nullptr;
}

std::vector<Event> LogGenerator::GenerateCase(const std::string& caseId) {
  bool deviated = false;
  auto activities = plannedActivities(deviated);

  std::vector<Event> events;
  events.reserve(activities.size());
  for (size_t i = 0; i < activities.size(); ++i) {
    if (i > 0) {
      currentTimeMs += static_cast<int64_t>(
          randomDouble(config.minGapHours, config.maxGapHours) * kMsPerHour);
    }
    Event event;
    event.caseId = caseId;
    event.activity = activities[i];
    event.timestampMs = currentTimeMs;
    event.resource = config.resources[static_cast<size_t>(
        randomInt(0, static_cast<int>(config.resources.size()) - 1))];
    events.push_back(std::move(event));
  }

  ++casesGenerated;
  if (deviated) {
    ++deviatingCases;
    logger.Warning("case_deviates case_id=" + caseId +
                   " events=" + std::to_string(events.size()));
  }
  return events;
}

// ─────────────────────────────────────────────────────────────────────────────
// Initialization
// ─────────────────────────────────────────────────────────────────────────────

error LogGenerator::initializeFiles() {
  jsonFile.open(config.outputJsonFile, std::ios::out | std::ios::trunc);
  if (!jsonFile.is_open()) {
    return errors::New("failed to open JSON output file: " +
                       config.outputJsonFile);
  }

  csvFile.open(config.outputCsvFile, std::ios::out | std::ios::trunc);
  if (!csvFile.is_open()) {
    return errors::New("failed to open CSV output file: " +
                       config.outputCsvFile);
  }

  jsonFile << "[\n";
  csvFile << "case_id,activity,timestamp,resource\n";
  return nullptr;
}

// ─────────────────────────────────────────────────────────────────────────────
// Case shaping
// ─────────────────────────────────────────────────────────────────────────────

std::vector<std::string> LogGenerator::plannedActivities(bool& deviated) {
  std::vector<std::string> activities = config.idealFlow;
  deviated = false;

  // The first and last steps are never skipped.
  if (activities.size() > 2 && chance(config.skipProbability)) {
    int victim = randomInt(1, static_cast<int>(activities.size()) - 2);
    activities.erase(activities.begin() + victim);
    deviated = true;
  }

  if (activities.size() > 1 && chance(config.swapProbability)) {
    int left = randomInt(0, static_cast<int>(activities.size()) - 2);
    std::swap(activities[left], activities[left + 1]);
    deviated = true;
  }

  if (activities.size() > 1 && chance(config.reworkProbability)) {
    int at = randomInt(1, static_cast<int>(activities.size()) - 1);
    // Rework: ask for more information, then redo the preceding step.
    std::string redo = activities[at - 1];
    activities.insert(activities.begin() + at, {config.reworkActivity, redo});
    deviated = true;
  }
  return activities;
}

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

void LogGenerator::writeJsonEvent(const Event& event) {
  nlohmann::json entry = {{"case_id", event.caseId},
                          {"activity", event.activity},
                          {"timestamp", EventLog::FormatTimestamp(event.timestampMs)},
                          {"resource", event.resource}};

  std::lock_guard<std::mutex> lock(fileMutex);
  if (!firstJsonEntry) {
    jsonFile << ",\n";
  }
  firstJsonEntry = false;
  jsonFile << entry.dump(2);
}

void LogGenerator::bufferCsvEvent(const Event& event) {
  std::lock_guard<std::mutex> lock(fileMutex);
  csvBuffer.push_back(event);
}

double LogGenerator::randomDouble(double min, double max) {
  return min + (max - min) * uniformDist(rng);
}

int LogGenerator::randomInt(int min, int max) {
  std::uniform_int_distribution<int> dist(min, max);
  return dist(rng);
}

bool LogGenerator::chance(double probability) {
  return uniformDist(rng) < probability;
}

}  // namespace process_miner

// log_generator.hpp
#pragma once

#include <cstdint>
#include <fstream>
#include <kvalog/kvalog.hpp>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <random>
#include <string>
#include <tuple>
#include <vector>

#include "config.hpp"
#include "event_log.hpp"
#include "ports/errors/errors.hpp"

namespace process_miner {

struct GeneratorConfig {
  int totalCases = 50;
  std::vector<std::string> idealFlow = DefaultIdealFlow();
  std::vector<std::string> resources = {"alice", "bob", "carol", "dave",
                                        "erin"};
  std::string reworkActivity = "Request Additional Info";

  // Per-case deviation probabilities.
  double skipProbability = 0.1;
  double swapProbability = 0.1;
  double reworkProbability = 0.15;

  double minGapHours = 0.5;
  double maxGapHours = 6.0;
  double caseStartSpreadHours = 72.0;

  int64_t startTimeMs = 0;  // 0: now
  uint32_t seed = 42;
  std::string outputCsvFile = "process_log.csv";
  std::string outputJsonFile = "process_log.json";
};

// Writes a synthetic process log: cases that follow the ideal flow with
// random skipped steps, swapped neighbours and rework loops.
class LogGenerator {
 private:
  GeneratorConfig config;
  kvalog::Logger logger;
  std::ofstream jsonFile;
  std::ofstream csvFile;
  std::mt19937 rng;
  std::uniform_real_distribution<> uniformDist;
  int64_t currentTimeMs;
  int casesGenerated;
  int deviatingCases;
  bool firstJsonEntry;
  std::vector<Event> csvBuffer;
  std::mutex fileMutex;

  explicit LogGenerator(const GeneratorConfig& cfg);

 public:
  static std::tuple<std::shared_ptr<LogGenerator>, error> Create(
      const GeneratorConfig& cfg);

  static error Validate(const GeneratorConfig& cfg);

  error Generate();

  error Finalize();

  // Events of one case; exposed for tests.
  std::vector<Event> GenerateCase(const std::string& caseId);

 private:
  error initializeFiles();

  std::vector<std::string> plannedActivities(bool& deviated);

  void writeJsonEvent(const Event& event);
  void bufferCsvEvent(const Event& event);

  double randomDouble(double min, double max);
  int randomInt(int min, int max);
  bool chance(double probability);
};

}  // namespace process_miner

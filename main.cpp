#include <cstdlib>
#include <iostream>
#include <string>

#include "log_generator.hpp"

namespace {

void printUsage(const char* program) {
  std::cout << "Usage: " << program << " [options]\n\n"
            << "Options:\n"
            << "  --cases <n>     Number of cases (default: 50)\n"
            << "  --seed <n>      Random seed (default: 42)\n"
            << "  --csv <file>    CSV output (default: process_log.csv)\n"
            << "  --json <file>   JSON output (default: process_log.json)\n"
            << "  -h, --help      Show this help message\n";
}

bool parseCount(const std::string& value, long long& out) {
  char* end = nullptr;
  const long long parsed = std::strtoll(value.c_str(), &end, 10);
  if (end == value.c_str() || *end != '\0' || parsed < 0) {
    return false;
  }
  out = parsed;
  return true;
}

bool parseArguments(int argc, char** argv,
                    process_miner::GeneratorConfig& config,
                    std::string& error) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      std::exit(0);
    }
    if (i + 1 >= argc) {
      error = "Missing value for " + arg;
      return false;
    }
    const std::string value = argv[++i];

    if (arg == "--cases" || arg == "--seed") {
      long long parsed = 0;
      if (!parseCount(value, parsed)) {
        error = "Invalid value for " + arg + ": " + value;
        return false;
      }
      if (arg == "--cases") {
        config.totalCases = static_cast<int>(parsed);
      } else {
        config.seed = static_cast<uint32_t>(parsed);
      }
    } else if (arg == "--csv") {
      config.outputCsvFile = value;
    } else if (arg == "--json") {
      config.outputJsonFile = value;
    } else {
      error = "Unknown option: " + arg;
      return false;
    }
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  process_miner::GeneratorConfig config;
  std::string argError;
  if (!parseArguments(argc, argv, config, argError)) {
    std::cerr << "Error: " << argError << std::endl;
    printUsage(argv[0]);
    return 1;
  }

  auto [generator, err] = process_miner::LogGenerator::Create(config);
  if (err) {
    std::cerr << "Error creating log generator: " << err->What() << std::endl;
    return 1;
  }

  std::cout << "Process log generator ready" << std::endl;
  std::cout << "Configuration:" << std::endl;
  std::cout << "  Cases: " << config.totalCases << std::endl;
  std::cout << "  Seed: " << config.seed << std::endl;
  std::cout << "  Output CSV: " << config.outputCsvFile << std::endl;
  std::cout << "  Output JSON: " << config.outputJsonFile << std::endl;

  std::cout << "\nGenerating " << config.totalCases << " cases..." << std::endl;
  err = generator->Generate();
  if (err) {
    std::cerr << "Error during generation: " << err->What() << std::endl;
    return 1;
  }

  err = generator->Finalize();
  if (err) {
    std::cerr << "Error during finalization: " << err->What() << std::endl;
    return 1;
  }

  std::cout << "\nProcess log written" << std::endl;
  std::cout << "Files created:" << std::endl;
  std::cout << "  - " << config.outputCsvFile << std::endl;
  std::cout << "  - " << config.outputJsonFile << std::endl;

  return 0;
}

#include <cstdlib>
#include <iostream>
#include <kvalog/kvalog.hpp>
#include <string>

#include "analysis_cache.hpp"
#include "config.hpp"
#include "csv_loader.hpp"
#include "event_filter.hpp"
#include "process_analyzer.hpp"
#include "report_writer.hpp"

namespace {

struct CliOptions {
  std::string csvFile;
  std::string configFile;
  std::string jsonOutput;
  process_miner::EventFilter filter;
};

void printUsage(const char* program) {
  std::cout
      << "Usage: " << program << " <csv_file> [options]\n\n"
      << "Options:\n"
      << "  --config <file>      JSON analyzer configuration\n"
      << "  --json <file>        Also write the report as JSON\n"
      << "  --from <timestamp>   Keep events at or after this instant\n"
      << "  --to <timestamp>     Keep events at or before this instant\n"
      << "  --activity <text>    Keep activities containing text\n"
      << "  --resource <text>    Keep resources containing text\n"
      << "  -h, --help           Show this help message\n";
}

bool parseArguments(int argc, char** argv, CliOptions& options,
                    std::string& error) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      std::exit(0);
    }

    if (arg.rfind("--", 0) != 0) {
      if (!options.csvFile.empty()) {
        error = "Unexpected argument: " + arg;
        return false;
      }
      options.csvFile = arg;
      continue;
    }

    if (i + 1 >= argc) {
      error = "Missing value for " + arg;
      return false;
    }
    const std::string value = argv[++i];

    if (arg == "--config") {
      options.configFile = value;
    } else if (arg == "--json") {
      options.jsonOutput = value;
    } else if (arg == "--from" || arg == "--to") {
      auto [ms, err] = process_miner::EventLog::ParseTimestamp(value);
      if (err) {
        error = "Invalid value for " + arg + ": " + err->What();
        return false;
      }
      if (arg == "--from") {
        options.filter.fromMs = ms;
      } else {
        options.filter.toMs = ms;
      }
    } else if (arg == "--activity") {
      options.filter.activity = value;
    } else if (arg == "--resource") {
      options.filter.resource = value;
    } else {
      error = "Unknown option: " + arg;
      return false;
    }
  }

  if (options.csvFile.empty()) {
    error = "Missing <csv_file>";
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions options;
  std::string argError;
  if (!parseArguments(argc, argv, options, argError)) {
    std::cerr << "Error: " << argError << std::endl;
    printUsage(argv[0]);
    return 1;
  }

  auto logger = kvalog::CreateLogger("process_miner", "cli");

  process_miner::AnalyzerConfig config;
  if (!options.configFile.empty()) {
    auto [loaded, err] = process_miner::ConfigLoader::Load(options.configFile);
    if (err) {
      std::cerr << "Error: " << err->What() << std::endl;
      return 1;
    }
    config = loaded;
  }

  std::cout << "Analyzing CSV file: " << options.csvFile << std::endl;
  std::cout << std::endl;

  auto [events, loadErr] = process_miner::CsvLoader::Load(options.csvFile);
  if (loadErr) {
    logger.Error(loadErr->What());
    std::cerr << "Error: " << loadErr->What() << std::endl;
    return 1;
  }

  auto [analyzer, createErr] = process_miner::ProcessAnalyzer::Create(config);
  if (createErr) {
    std::cerr << "Error: " << createErr->What() << std::endl;
    return 1;
  }

  process_miner::AnalysisCache cache(analyzer);
  auto [result, runErr] = cache.Get(events, options.filter);
  if (runErr) {
    logger.Error(runErr->What());
    std::cerr << "Error: " << runErr->What() << std::endl;
    return 1;
  }

  process_miner::ReportWriter::PrintReport(*result);

  if (!options.jsonOutput.empty()) {
    if (auto err = process_miner::ReportWriter::WriteJson(*result,
                                                          options.jsonOutput)) {
      std::cerr << "Error: " << err->What() << std::endl;
      return 1;
    }
    std::cout << "JSON report written to " << options.jsonOutput << std::endl;
  }

  logger.Flush();
  return 0;
}

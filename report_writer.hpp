#pragma once

#include <cstddef>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>

#include "ports/errors/errors.hpp"
#include "process_analyzer.hpp"

namespace process_miner {

class ReportWriter {
 public:
  static void PrintReport(const AnalysisResult& result,
                          std::ostream& out = std::cout);

  static nlohmann::json ToJson(const AnalysisResult& result);

  static error WriteJson(const AnalysisResult& result, const std::string& path);

 private:
  static constexpr size_t maxPrintedCases = 10;
};

}  // namespace process_miner

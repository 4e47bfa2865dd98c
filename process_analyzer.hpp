#pragma once

#include <cstdint>
#include <kvalog/kvalog.hpp>
#include <memory>
#include <tuple>
#include <vector>

#include "anomaly_source.hpp"
#include "bottleneck_analyzer.hpp"
#include "config.hpp"
#include "conformance_checker.hpp"
#include "event_filter.hpp"
#include "event_log.hpp"
#include "flow_graph.hpp"
#include "ports/errors/errors.hpp"
#include "summaries.hpp"

namespace process_miner {

struct AnalysisResult {
  int64_t inputEvents = 0;
  int64_t filteredOutEvents = 0;
  Summaries summaries;
  FlowGraph flow;
  ConformanceReport conformance;
  BottleneckReport bottlenecks;
  std::vector<std::string> idealFlow;
};

// Runs every analysis over one grouped view of the (filtered) log.
class ProcessAnalyzer {
 private:
  AnalyzerConfig config;
  kvalog::Logger logger;
  std::unique_ptr<AnomalySource> anomalies;

  ProcessAnalyzer(const AnalyzerConfig& cfg,
                  std::unique_ptr<AnomalySource> source);

 public:
  // Builds the anomaly source named by cfg.anomalyMode.
  static std::tuple<std::shared_ptr<ProcessAnalyzer>, error> Create(
      const AnalyzerConfig& cfg);

  static std::tuple<std::shared_ptr<ProcessAnalyzer>, error> Create(
      const AnalyzerConfig& cfg, std::unique_ptr<AnomalySource> source);

  // Not safe to call concurrently: the anomaly source may carry state.
  std::tuple<AnalysisResult, error> Run(const std::vector<Event>& events,
                                        const EventFilter& filter = {});

  const AnalyzerConfig& Config() const { return config; }

 private:
  static std::tuple<std::unique_ptr<AnomalySource>, error> makeAnomalySource(
      const AnalyzerConfig& cfg);
};

}  // namespace process_miner

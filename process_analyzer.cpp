#include "process_analyzer.hpp"

#include <sstream>
#include <utility>

namespace process_miner {

ProcessAnalyzer::ProcessAnalyzer(const AnalyzerConfig& cfg,
                                 std::unique_ptr<AnomalySource> source)
    : config(cfg),
      logger(kvalog::CreateLogger("process_miner", "process_analyzer")),
      anomalies(std::move(source)) {}

std::tuple<std::shared_ptr<ProcessAnalyzer>, error> ProcessAnalyzer::Create(
    const AnalyzerConfig& cfg) {
  auto [source, err] = makeAnomalySource(cfg);
  if (err) {
    return {nullptr, err};
  }
  return Create(cfg, std::move(source));
}

std::tuple<std::shared_ptr<ProcessAnalyzer>, error> ProcessAnalyzer::Create(
    const AnalyzerConfig& cfg, std::unique_ptr<AnomalySource> source) {
  if (auto err = ConfigLoader::Validate(cfg)) {
    return {nullptr, errors::Wrap(err, "invalid analyzer config")};
  }
  if (!source) {
    source = std::make_unique<NoAnomalySource>();
  }
  auto analyzer = std::shared_ptr<ProcessAnalyzer>(
      new ProcessAnalyzer(cfg, std::move(source)));
  return {analyzer, nullptr};
}

std::tuple<AnalysisResult, error> ProcessAnalyzer::Run(
    const std::vector<Event>& events, const EventFilter& filter) {
  if (auto err = EventLog::Validate(events)) {
    logger.Error("event log rejected: " + err->What());
    return {AnalysisResult(), errors::Wrap(err, "invalid event log")};
  }

  AnalysisResult result;
  result.inputEvents = static_cast<int64_t>(events.size());
  result.idealFlow = config.idealFlow;

  const std::vector<Event> selected = filter.Apply(events);
  result.filteredOutEvents =
      result.inputEvents - static_cast<int64_t>(selected.size());

  const CasesView cases = EventLog::GroupAndSort(selected);

  result.summaries = SummaryBuilder::Summarize(selected, config.topActivities);
  result.flow = FlowGraphBuilder::Build(cases);

  auto [conformance, err] =
      ConformanceChecker::Check(cases, config.idealFlow, config.conformance);
  if (err) {
    return {AnalysisResult(), errors::Wrap(err, "conformance check failed")};
  }
  result.conformance = std::move(conformance);
  result.bottlenecks =
      BottleneckAnalyzer::Analyze(cases, *anomalies, config.bottlenecks);

  std::ostringstream msg;
  msg << "analysis_completed events=" << selected.size()
      << " filtered_out=" << result.filteredOutEvents
      << " cases=" << cases.size() << " nodes=" << result.flow.nodes.size()
      << " edges=" << result.flow.edges.size()
      << " conformance=" << result.conformance.overallConformance << "%";
  logger.Info(msg.str());

  for (const auto& profile : result.bottlenecks.resources) {
    if (profile.errors > profile.workload) {
      logger.Warning("anomaly feed reports more errors than work items for " +
                     profile.resource + "; error rate clamped to 100%");
    }
  }
  return {result, nullptr};
}

std::tuple<std::unique_ptr<AnomalySource>, error>
ProcessAnalyzer::makeAnomalySource(const AnalyzerConfig& cfg) {
  switch (cfg.anomalyMode) {
    case AnomalyMode::None:
      return {std::make_unique<NoAnomalySource>(), nullptr};
    case AnomalyMode::Random:
      return {std::make_unique<RandomAnomalySource>(cfg.randomErrorRate,
                                                    cfg.randomSeed),
              nullptr};
    case AnomalyMode::Reported: {
      auto [source, err] =
          ReportedAnomalySource::FromFile(cfg.reportedAnomaliesFile);
      if (err) {
        return {nullptr, err};
      }
      return {std::move(source), nullptr};
    }
  }
  return {nullptr, errors::New("unknown anomaly mode")};
}

}  // namespace process_miner

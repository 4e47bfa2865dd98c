#include "process_analyzer.hpp"

#include <gtest/gtest.h>

#include "analysis_cache.hpp"
#include "test_events.hpp"

namespace process_miner {
namespace {

using testing::At;

// Reports a fixed count for every resource it sees and records each call.
class CountingAnomalySource : public AnomalySource {
 public:
  explicit CountingAnomalySource(int64_t perResource, int* calls)
      : perResource(perResource), calls(calls) {}

  ResourceErrors ErrorsByResource(const CasesView& cases) override {
    ++*calls;
    ResourceErrors counts;
    for (const auto& [caseId, events] : cases) {
      for (const auto& event : events) {
        counts[event.resource] = perResource;
      }
    }
    return counts;
  }

 private:
  int64_t perResource;
  int* calls;
};

std::vector<Event> idealLog() {
  std::vector<Event> events;
  const auto flow = DefaultIdealFlow();
  for (const char* id : {"c1", "c2"}) {
    for (size_t i = 0; i < flow.size(); ++i) {
      events.push_back(At(id, flow[i], static_cast<double>(i), "alice"));
    }
  }
  return events;
}

std::shared_ptr<ProcessAnalyzer> makeAnalyzer(
    std::unique_ptr<AnomalySource> source = nullptr) {
  auto [analyzer, err] = ProcessAnalyzer::Create(AnalyzerConfig(),
                                                 std::move(source));
  EXPECT_EQ(err, nullptr);
  return analyzer;
}

TEST(ProcessAnalyzerTest, EmptyLogIsNotAnError) {
  auto analyzer = makeAnalyzer();
  ASSERT_NE(analyzer, nullptr);
  auto [result, err] = analyzer->Run({});
  ASSERT_EQ(err, nullptr);
  EXPECT_EQ(result.inputEvents, 0);
  EXPECT_TRUE(result.flow.nodes.empty());
  EXPECT_TRUE(result.flow.edges.empty());
  EXPECT_TRUE(result.conformance.cases.empty());
  EXPECT_EQ(result.conformance.overallConformance, 0);
  EXPECT_TRUE(result.bottlenecks.ranked.empty());
  EXPECT_TRUE(result.bottlenecks.resources.empty());
  EXPECT_EQ(result.summaries.totalCases, 0);
}

TEST(ProcessAnalyzerTest, RunsEveryAnalysis) {
  auto analyzer = makeAnalyzer();
  auto [result, err] = analyzer->Run(idealLog());
  ASSERT_EQ(err, nullptr);
  EXPECT_EQ(result.inputEvents, 10);
  EXPECT_EQ(result.filteredOutEvents, 0);
  EXPECT_EQ(result.summaries.totalCases, 2);
  EXPECT_EQ(result.flow.nodes.size(), 5u);
  EXPECT_EQ(result.flow.edges.size(), 4u);
  EXPECT_EQ(result.conformance.overallConformance, 100);
  EXPECT_EQ(result.bottlenecks.all.size(), 4u);
  ASSERT_EQ(result.bottlenecks.resources.size(), 1u);
  EXPECT_EQ(result.bottlenecks.resources[0].workload, 10);
  EXPECT_EQ(result.idealFlow, DefaultIdealFlow());
}

TEST(ProcessAnalyzerTest, RejectsEventsWithMissingFields) {
  auto analyzer = makeAnalyzer();
  auto events = idealLog();
  events[3].resource.clear();
  auto [result, err] = analyzer->Run(events);
  ASSERT_NE(err, nullptr);
  EXPECT_NE(err->What().find("event #3"), std::string::npos);
}

TEST(ProcessAnalyzerTest, AppliesFilterBeforeGrouping) {
  auto analyzer = makeAnalyzer();
  EventFilter filter;
  filter.activity = "Process";
  auto [result, err] = analyzer->Run(idealLog(), filter);
  ASSERT_EQ(err, nullptr);
  EXPECT_EQ(result.inputEvents, 10);
  EXPECT_EQ(result.filteredOutEvents, 6);
  EXPECT_EQ(result.summaries.totalEvents, 4);
  ASSERT_EQ(result.flow.edges.size(), 1u);
  EXPECT_EQ(result.flow.edges[0].from, "Start Process");
  EXPECT_EQ(result.flow.edges[0].to, "Complete Process");
  EXPECT_DOUBLE_EQ(result.flow.edges[0].avgDurationHours, 4.0);
}

TEST(ProcessAnalyzerTest, UsesInjectedAnomalySource) {
  int calls = 0;
  auto analyzer =
      makeAnalyzer(std::make_unique<CountingAnomalySource>(1, &calls));
  auto [result, err] = analyzer->Run(idealLog());
  ASSERT_EQ(err, nullptr);
  EXPECT_EQ(calls, 1);
  ASSERT_EQ(result.bottlenecks.resources.size(), 1u);
  EXPECT_EQ(result.bottlenecks.resources[0].errors, 1);
  EXPECT_DOUBLE_EQ(result.bottlenecks.resources[0].errorRate, 10.0);
}

TEST(ProcessAnalyzerTest, CreateRejectsInvalidConfig) {
  AnalyzerConfig config;
  config.idealFlow.clear();
  auto [analyzer, err] = ProcessAnalyzer::Create(config);
  EXPECT_EQ(analyzer, nullptr);
  EXPECT_NE(err, nullptr);
}

TEST(ProcessAnalyzerTest, CreateFailsWhenAnomalyFileIsMissing) {
  AnalyzerConfig config;
  config.anomalyMode = AnomalyMode::Reported;
  config.reportedAnomaliesFile = ::testing::TempDir() + "does_not_exist.json";
  auto [analyzer, err] = ProcessAnalyzer::Create(config);
  EXPECT_EQ(analyzer, nullptr);
  EXPECT_NE(err, nullptr);
}

TEST(ProcessAnalyzerTest, RandomModeIsReproducible) {
  AnalyzerConfig config;
  config.anomalyMode = AnomalyMode::Random;
  config.randomErrorRate = 0.5;
  config.randomSeed = 11;
  auto [first, err1] = ProcessAnalyzer::Create(config);
  auto [second, err2] = ProcessAnalyzer::Create(config);
  ASSERT_EQ(err1, nullptr);
  ASSERT_EQ(err2, nullptr);

  auto [a, runErr1] = first->Run(idealLog());
  auto [b, runErr2] = second->Run(idealLog());
  ASSERT_EQ(runErr1, nullptr);
  ASSERT_EQ(runErr2, nullptr);
  EXPECT_EQ(a.bottlenecks, b.bottlenecks);
}

TEST(AnalysisCacheTest, ReusesResultUntilInputChanges) {
  int calls = 0;
  AnalysisCache cache(
      makeAnalyzer(std::make_unique<CountingAnomalySource>(0, &calls)));
  auto events = idealLog();

  auto [first, err1] = cache.Get(events);
  ASSERT_EQ(err1, nullptr);
  auto [second, err2] = cache.Get(events);
  ASSERT_EQ(err2, nullptr);
  EXPECT_EQ(first, second);
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(cache.Hits(), 1);
  EXPECT_EQ(cache.Misses(), 1);

  EventFilter filter;
  filter.resource = "alice";
  auto [filtered, err3] = cache.Get(events, filter);
  ASSERT_EQ(err3, nullptr);
  EXPECT_NE(filtered, second);
  EXPECT_EQ(cache.Misses(), 2);

  events[0].timestampMs += 1;
  auto [changed, err4] = cache.Get(events, filter);
  ASSERT_EQ(err4, nullptr);
  EXPECT_EQ(cache.Misses(), 3);
  EXPECT_EQ(calls, 3);
}

TEST(AnalysisCacheTest, InvalidateForcesRecompute) {
  AnalysisCache cache(makeAnalyzer());
  auto events = idealLog();
  auto [first, err1] = cache.Get(events);
  ASSERT_EQ(err1, nullptr);
  cache.Invalidate();
  auto [second, err2] = cache.Get(events);
  ASSERT_EQ(err2, nullptr);
  EXPECT_NE(first, second);
  EXPECT_EQ(cache.Misses(), 2);
  EXPECT_EQ(cache.Hits(), 0);
  EXPECT_EQ(first->conformance, second->conformance);
}

TEST(AnalysisCacheTest, ErrorsAreNotCached) {
  AnalysisCache cache(makeAnalyzer());
  std::vector<Event> events = {At("c1", "", 0.0)};
  auto [first, err1] = cache.Get(events);
  EXPECT_EQ(first, nullptr);
  EXPECT_NE(err1, nullptr);
  auto [second, err2] = cache.Get(events);
  EXPECT_NE(err2, nullptr);
  EXPECT_EQ(cache.Misses(), 2);
}

TEST(AnalysisCacheTest, FingerprintSeparatesFieldBoundaries) {
  std::vector<Event> a = {At("ab", "c", 0.0)};
  std::vector<Event> b = {At("a", "bc", 0.0)};
  EXPECT_NE(AnalysisCache::Fingerprint(a, {}), AnalysisCache::Fingerprint(b, {}));
  EXPECT_EQ(AnalysisCache::Fingerprint(a, {}), AnalysisCache::Fingerprint(a, {}));
}

}  // namespace
}  // namespace process_miner

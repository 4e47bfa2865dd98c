#pragma once

#include <cstdint>
#include <kvalog/kvalog.hpp>
#include <memory>
#include <mutex>
#include <tuple>
#include <vector>

#include "event_filter.hpp"
#include "event_log.hpp"
#include "ports/errors/errors.hpp"
#include "process_analyzer.hpp"

namespace process_miner {

// Memoizes the last analysis keyed by a fingerprint of the events and the
// filter. Recomputes from scratch whenever either changes.
class AnalysisCache {
 public:
  explicit AnalysisCache(std::shared_ptr<ProcessAnalyzer> analyzer);

  std::tuple<std::shared_ptr<const AnalysisResult>, error> Get(
      const std::vector<Event>& events, const EventFilter& filter = {});

  void Invalidate();

  int64_t Hits() const;
  int64_t Misses() const;

  // FNV-1a over every event field and the filter.
  static uint64_t Fingerprint(const std::vector<Event>& events,
                              const EventFilter& filter);

 private:
  std::shared_ptr<ProcessAnalyzer> analyzer;
  kvalog::Logger logger;

  mutable std::mutex mutex;
  bool valid = false;
  uint64_t cachedKey = 0;
  std::shared_ptr<const AnalysisResult> cached;
  int64_t hits = 0;
  int64_t misses = 0;
};

}  // namespace process_miner

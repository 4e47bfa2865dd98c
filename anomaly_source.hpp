#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <tuple>

#include "event_log.hpp"
#include "ports/errors/errors.hpp"

namespace process_miner {

using ResourceErrors = std::map<std::string, int64_t>;

// Per-resource error counts from a quality or incident system. The event log
// itself carries no error signal.
class AnomalySource {
 public:
  virtual ~AnomalySource() = default;

  virtual ResourceErrors ErrorsByResource(const CasesView& cases) = 0;
};

// Default: nothing is ever reported.
class NoAnomalySource : public AnomalySource {
 public:
  ResourceErrors ErrorsByResource(const CasesView& cases) override;
};

// Demo signal: one Bernoulli(rate) draw per event, charged to the event's
// resource. Reproducible for a fixed seed. Not thread-safe.
class RandomAnomalySource : public AnomalySource {
 public:
  explicit RandomAnomalySource(double rate = 0.1, uint32_t seed = 42);

  ResourceErrors ErrorsByResource(const CasesView& cases) override;

 private:
  double rate;
  std::mt19937 rng;
  std::uniform_real_distribution<> uniformDist;
};

// Fixed counts handed over by an external feed.
class ReportedAnomalySource : public AnomalySource {
 public:
  explicit ReportedAnomalySource(ResourceErrors reported);

  // Reads a JSON object {"resource": count, ...}.
  static std::tuple<std::unique_ptr<ReportedAnomalySource>, error> FromFile(
      const std::string& path);

  ResourceErrors ErrorsByResource(const CasesView& cases) override;

 private:
  ResourceErrors reported;
};

}  // namespace process_miner

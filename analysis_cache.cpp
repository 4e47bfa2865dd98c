#include "analysis_cache.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace process_miner {

namespace {

constexpr uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

void mixBytes(uint64_t& hash, const void* data, size_t size) {
  const auto* bytes = static_cast<const unsigned char*>(data);
  for (size_t i = 0; i < size; ++i) {
    hash ^= bytes[i];
    hash *= kFnvPrime;
  }
}

// Length prefix keeps ("ab", "c") and ("a", "bc") apart.
void mixString(uint64_t& hash, const std::string& value) {
  uint64_t size = value.size();
  mixBytes(hash, &size, sizeof(size));
  mixBytes(hash, value.data(), value.size());
}

void mixInt(uint64_t& hash, int64_t value) {
  mixBytes(hash, &value, sizeof(value));
}

void mixOptional(uint64_t& hash, const std::optional<int64_t>& value) {
  mixInt(hash, value ? 1 : 0);
  if (value) mixInt(hash, *value);
}

}  // namespace

AnalysisCache::AnalysisCache(std::shared_ptr<ProcessAnalyzer> analyzer)
    : analyzer(std::move(analyzer)),
      logger(kvalog::CreateLogger("process_miner", "analysis_cache")) {}

std::tuple<std::shared_ptr<const AnalysisResult>, error> AnalysisCache::Get(
    const std::vector<Event>& events, const EventFilter& filter) {
  const uint64_t key = Fingerprint(events, filter);

  std::lock_guard<std::mutex> lock(mutex);
  if (valid && key == cachedKey) {
    ++hits;
    return {cached, nullptr};
  }

  ++misses;
  std::ostringstream msg;
  msg << "recomputing analysis key=" << std::hex << std::setw(16)
      << std::setfill('0') << key;
  logger.Info(msg.str());

  auto [result, err] = analyzer->Run(events, filter);
  if (err) {
    valid = false;
    cached.reset();
    return {nullptr, err};
  }

  cached = std::make_shared<const AnalysisResult>(std::move(result));
  cachedKey = key;
  valid = true;
  return {cached, nullptr};
}

void AnalysisCache::Invalidate() {
  std::lock_guard<std::mutex> lock(mutex);
  valid = false;
  cached.reset();
}

int64_t AnalysisCache::Hits() const {
  std::lock_guard<std::mutex> lock(mutex);
  return hits;
}

int64_t AnalysisCache::Misses() const {
  std::lock_guard<std::mutex> lock(mutex);
  return misses;
}

uint64_t AnalysisCache::Fingerprint(const std::vector<Event>& events,
                                    const EventFilter& filter) {
  uint64_t hash = kFnvOffset;
  mixInt(hash, static_cast<int64_t>(events.size()));
  for (const auto& event : events) {
    mixString(hash, event.caseId);
    mixString(hash, event.activity);
    mixInt(hash, event.timestampMs);
    mixString(hash, event.resource);
  }
  mixOptional(hash, filter.fromMs);
  mixOptional(hash, filter.toMs);
  mixString(hash, filter.activity);
  mixString(hash, filter.resource);
  return hash;
}

}  // namespace process_miner

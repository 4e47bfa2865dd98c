#include "anomaly_source.hpp"

#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <utility>

namespace process_miner {

ResourceErrors NoAnomalySource::ErrorsByResource(const CasesView& /*cases*/) {
  return {};
}

RandomAnomalySource::RandomAnomalySource(double rate, uint32_t seed)
    : rate(rate), rng(seed), uniformDist(0.0, 1.0) {}

ResourceErrors RandomAnomalySource::ErrorsByResource(const CasesView& cases) {
  ResourceErrors counts;
  for (const auto& [caseId, events] : cases) {
    for (const auto& event : events) {
      if (uniformDist(rng) < rate) {
        counts[event.resource]++;
      }
    }
  }
  return counts;
}

ReportedAnomalySource::ReportedAnomalySource(ResourceErrors reported)
    : reported(std::move(reported)) {}

std::tuple<std::unique_ptr<ReportedAnomalySource>, error>
ReportedAnomalySource::FromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return {nullptr, errors::New("failed to open anomaly file: " + path)};
  }

  nlohmann::json doc;
  try {
    file >> doc;
  } catch (const nlohmann::json::parse_error& e) {
    return {nullptr, errors::Errorf("anomaly file {}: {}", path, e.what())};
  }
  if (!doc.is_object()) {
    return {nullptr,
            errors::New("anomaly file " + path + ": expected a JSON object")};
  }

  ResourceErrors counts;
  for (const auto& [resource, value] : doc.items()) {
    if (!value.is_number_integer() || value.get<int64_t>() < 0) {
      return {nullptr, errors::Contract("anomaly file " + path, resource,
                                        "must be a non-negative integer")};
    }
    counts[resource] = value.get<int64_t>();
  }
  return {std::make_unique<ReportedAnomalySource>(std::move(counts)), nullptr};
}

ResourceErrors ReportedAnomalySource::ErrorsByResource(
    const CasesView& /*cases*/) {
  return reported;
}

}  // namespace process_miner

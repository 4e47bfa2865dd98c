#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "event_log.hpp"

namespace process_miner {

struct FlowNode {
  std::string activity;
  int64_t frequency = 0;
  std::set<std::string> resources;

  bool operator==(const FlowNode&) const = default;
};

// Directed edge between two consecutive activities of a case. from == to is
// a self-loop.
struct FlowEdge {
  std::string from;
  std::string to;
  int64_t frequency = 0;
  double avgDurationHours = 0.0;

  bool operator==(const FlowEdge&) const = default;
};

struct FlowGraph {
  std::vector<FlowNode> nodes;  // frequency desc, then activity asc
  std::vector<FlowEdge> edges;  // frequency desc, then (from, to) asc

  bool operator==(const FlowGraph&) const = default;
};

class FlowGraphBuilder {
 public:
  static FlowGraph Build(const CasesView& cases);
};

}  // namespace process_miner

#include "flow_graph.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace process_miner {

FlowGraph FlowGraphBuilder::Build(const CasesView& cases) {
  std::map<std::string, FlowNode> nodeMap;
  std::map<std::pair<std::string, std::string>, FlowEdge> edgeMap;

  for (const auto& [caseId, events] : cases) {
    for (size_t i = 0; i < events.size(); ++i) {
      const auto& event = events[i];

      auto& node = nodeMap[event.activity];
      if (node.frequency == 0) {
        node.activity = event.activity;
      }
      node.frequency += 1;
      node.resources.insert(event.resource);

      if (i == 0) continue;

      const auto& prev = events[i - 1];
      auto& edge = edgeMap[{prev.activity, event.activity}];
      if (edge.frequency == 0) {
        edge.from = prev.activity;
        edge.to = event.activity;
      }
      edge.frequency += 1;
      double duration = EventLog::HoursBetween(prev, event);
      edge.avgDurationHours +=
          (duration - edge.avgDurationHours) / static_cast<double>(edge.frequency);
    }
  }

  // Maps iterate in key order, so the stable sort leaves ties ordered by key.
  FlowGraph graph;
  graph.nodes.reserve(nodeMap.size());
  for (auto& [activity, node] : nodeMap) {
    graph.nodes.push_back(std::move(node));
  }
  graph.edges.reserve(edgeMap.size());
  for (auto& [key, edge] : edgeMap) {
    graph.edges.push_back(std::move(edge));
  }

  std::stable_sort(graph.nodes.begin(), graph.nodes.end(),
                   [](const FlowNode& a, const FlowNode& b) {
                     return a.frequency > b.frequency;
                   });
  std::stable_sort(graph.edges.begin(), graph.edges.end(),
                   [](const FlowEdge& a, const FlowEdge& b) {
                     return a.frequency > b.frequency;
                   });
  return graph;
}

}  // namespace process_miner

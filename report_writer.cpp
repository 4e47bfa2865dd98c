#include "report_writer.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>

namespace process_miner {

void ReportWriter::PrintReport(const AnalysisResult& result, std::ostream& out) {
  const auto& summary = result.summaries;
  const auto& conformance = result.conformance;

  out << "========================================" << std::endl;
  out << "        PROCESS MINING REPORT" << std::endl;
  out << "========================================" << std::endl;
  out << std::endl;

  out << "Total Events: " << summary.totalEvents << std::endl;
  out << "Total Cases: " << summary.totalCases << std::endl;
  out << "Unique Activities: " << summary.uniqueActivities << std::endl;
  out << "Unique Resources: " << summary.uniqueResources << std::endl;
  if (result.filteredOutEvents > 0) {
    out << "Filtered Out: " << result.filteredOutEvents << " of "
        << result.inputEvents << " events" << std::endl;
  }
  out << std::endl;

  out << "Activity Frequency:" << std::endl;
  out << "-------------------" << std::endl;
  for (const auto& [activity, count] : summary.activityFrequency) {
    out << "  " << std::left << std::setw(30) << activity << std::right << ": "
        << count << std::endl;
  }
  out << std::endl;

  out << "Cases Per Day:" << std::endl;
  out << "--------------" << std::endl;
  for (const auto& [date, cases] : summary.casesPerDay) {
    out << "  " << date << ": " << cases << std::endl;
  }
  out << std::endl;

  out << std::fixed << std::setprecision(2);
  out << "Process Flow:" << std::endl;
  out << "-------------" << std::endl;
  for (const auto& node : result.flow.nodes) {
    out << "  [" << node.activity << "] x" << node.frequency << " ("
        << node.resources.size() << " resources)" << std::endl;
  }
  for (const auto& edge : result.flow.edges) {
    out << "  " << edge.from << " -> " << edge.to << "  x" << edge.frequency
        << "  avg " << edge.avgDurationHours << " h" << std::endl;
  }
  out << std::endl;

  out << "Conformance:" << std::endl;
  out << "------------" << std::endl;
  out << "  Overall: " << conformance.overallConformance << "%" << std::endl;
  out << "  Conforming: " << conformance.conformingCases << std::endl;
  out << "  Partially Conforming: " << conformance.partiallyConformingCases
      << std::endl;
  out << "  Non-Conforming: " << conformance.nonConformingCases << std::endl;
  for (const auto& [deviation, count] : conformance.deviationTally) {
    out << "  " << deviation << ": " << count << " cases" << std::endl;
  }
  size_t shown = std::min(conformance.cases.size(), maxPrintedCases);
  for (size_t i = 0; i < shown; ++i) {
    const auto& c = conformance.cases[i];
    out << "  case " << std::left << std::setw(12) << c.caseId << std::right
        << std::setw(4) << c.score << "  " << ToString(c.status) << std::endl;
  }
  out << std::endl;

  out << "Bottlenecks:" << std::endl;
  out << "------------" << std::endl;
  for (const auto& b : result.bottlenecks.ranked) {
    out << "  " << b.transition << ": avg " << b.avgDuration << " h, max "
        << b.maxDuration << " h, sd " << b.variability << " h, n="
        << b.occurrences << std::endl;
  }
  out << std::endl;

  out << "Resources:" << std::endl;
  out << "----------" << std::endl;
  for (const auto& r : result.bottlenecks.resources) {
    out << "  " << std::left << std::setw(20) << r.resource << std::right
        << " workload " << r.workload << ", errors " << r.errors << " ("
        << r.errorRate << "%)" << std::endl;
  }
  out << std::endl;

  out << "Issues:" << std::endl;
  out << "-------" << std::endl;
  for (const auto& issue : result.bottlenecks.issues) {
    out << "  " << issue.category << " [" << ToString(issue.severity)
        << "]: " << issue.count << std::endl;
  }

  out << "========================================" << std::endl;
}

nlohmann::json ReportWriter::ToJson(const AnalysisResult& result) {
  const auto& summary = result.summaries;

  nlohmann::json activities = nlohmann::json::array();
  for (const auto& a : summary.activityFrequency) {
    activities.push_back({{"activity", a.activity}, {"count", a.count}});
  }
  nlohmann::json days = nlohmann::json::array();
  for (const auto& d : summary.casesPerDay) {
    days.push_back({{"date", d.date}, {"cases", d.cases}});
  }

  nlohmann::json nodes = nlohmann::json::array();
  for (const auto& n : result.flow.nodes) {
    nodes.push_back({{"activity", n.activity},
                     {"frequency", n.frequency},
                     {"resources", n.resources}});
  }
  nlohmann::json edges = nlohmann::json::array();
  for (const auto& e : result.flow.edges) {
    edges.push_back({{"from", e.from},
                     {"to", e.to},
                     {"frequency", e.frequency},
                     {"avgDurationHours", e.avgDurationHours}});
  }

  nlohmann::json cases = nlohmann::json::array();
  for (const auto& c : result.conformance.cases) {
    cases.push_back({{"caseId", c.caseId},
                     {"status", std::string(ToString(c.status))},
                     {"score", c.score},
                     {"deviations", c.deviations}});
  }

  auto bottlenecks = [](const std::vector<BottleneckEntry>& entries) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& b : entries) {
      list.push_back({{"transition", b.transition},
                      {"avgDuration", b.avgDuration},
                      {"maxDuration", b.maxDuration},
                      {"occurrences", b.occurrences},
                      {"variability", b.variability}});
    }
    return list;
  };

  nlohmann::json resources = nlohmann::json::array();
  for (const auto& r : result.bottlenecks.resources) {
    resources.push_back({{"resource", r.resource},
                         {"workload", r.workload},
                         {"errors", r.errors},
                         {"errorRate", r.errorRate}});
  }
  nlohmann::json issues = nlohmann::json::array();
  for (const auto& i : result.bottlenecks.issues) {
    issues.push_back({{"category", i.category},
                      {"count", i.count},
                      {"severity", std::string(ToString(i.severity))}});
  }

  return {
      {"summary",
       {{"totalCases", summary.totalCases},
        {"totalEvents", summary.totalEvents},
        {"uniqueResources", summary.uniqueResources},
        {"uniqueActivities", summary.uniqueActivities},
        {"inputEvents", result.inputEvents},
        {"filteredOutEvents", result.filteredOutEvents},
        {"activityFrequency", activities},
        {"casesPerDay", days}}},
      {"flow", {{"nodes", nodes}, {"edges", edges}}},
      {"conformance",
       {{"idealFlow", result.idealFlow},
        {"overallConformance", result.conformance.overallConformance},
        {"conformingCases", result.conformance.conformingCases},
        {"partiallyConformingCases",
         result.conformance.partiallyConformingCases},
        {"nonConformingCases", result.conformance.nonConformingCases},
        {"totalCases", result.conformance.totalCases},
        {"deviations", result.conformance.deviationTally},
        {"cases", cases}}},
      {"rootCause",
       {{"bottlenecks", bottlenecks(result.bottlenecks.ranked)},
        {"allTransitions", bottlenecks(result.bottlenecks.all)},
        {"resources", resources},
        {"issues", issues}}},
  };
}

error ReportWriter::WriteJson(const AnalysisResult& result,
                              const std::string& path) {
  std::ofstream file(path, std::ios::out | std::ios::trunc);
  if (!file.is_open()) {
    return errors::New("failed to open JSON report file: " + path);
  }
  file << ToJson(result).dump(2) << "\n";
  file.flush();
  if (!file) {
    return errors::New("failed to write JSON report file: " + path);
  }
  return nullptr;
}

}  // namespace process_miner

#include "network/graph_stats.h"

#include <algorithm>
#include <cmath>

namespace transitgraph {

GraphStats ComputeGraphStats(const TransitGraph& graph) {
  GraphStats stats;
  stats.num_nodes = graph.NodeCount();
  stats.num_edges = graph.EdgeCount();
  if (graph.NodeCount() == 0) {
    return stats;
  }

  size_t degree_sum = 0;
  stats.min_degree = graph.Degree(0);
  stats.max_degree = graph.Degree(0);
  for (size_t i = 0; i < graph.NodeCount(); ++i) {
    const size_t degree = graph.Degree(i);
    stats.degrees.emplace(graph.nodes()[i].id, degree);
    stats.min_degree = std::min(stats.min_degree, degree);
    stats.max_degree = std::max(stats.max_degree, degree);
    degree_sum += degree;
  }
  stats.avg_degree =
      static_cast<double>(degree_sum) / static_cast<double>(graph.NodeCount());
  return stats;
}

PathCostSummary SummarizePathCosts(const AllPairsResult& all_pairs) {
  PathCostSummary summary;
  double total = 0.0;
  for (const auto& [pair, path] : all_pairs.paths) {
    if (!path.found() || !std::isfinite(path.cost)) {
      continue;
    }
    if (summary.count == 0) {
      summary.min_cost = path.cost;
      summary.max_cost = path.cost;
    } else {
      summary.min_cost = std::min(summary.min_cost, path.cost);
      summary.max_cost = std::max(summary.max_cost, path.cost);
    }
    total += path.cost;
    summary.count += 1;
  }
  if (summary.count > 0) {
    summary.mean_cost = total / static_cast<double>(summary.count);
  }
  return summary;
}

}  // namespace transitgraph

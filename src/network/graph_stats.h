#pragma once

#include <cstddef>
#include <map>

#include "network/graph.h"
#include "solver/path_search.h"

namespace transitgraph {

struct GraphStats {
  size_t num_nodes = 0;
  size_t num_edges = 0;

  // All three are 0 for an empty graph.
  size_t min_degree = 0;
  size_t max_degree = 0;
  double avg_degree = 0.0;

  std::map<NodeId, size_t> degrees;
};

GraphStats ComputeGraphStats(const TransitGraph& graph);

// Aggregate over the finite costs of an all-pairs sweep.
struct PathCostSummary {
  size_t count = 0;
  double min_cost = 0.0;
  double max_cost = 0.0;
  double mean_cost = 0.0;
};

PathCostSummary SummarizePathCosts(const AllPairsResult& all_pairs);

}  // namespace transitgraph

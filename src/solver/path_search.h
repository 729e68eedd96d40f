#pragma once

#include <chrono>
#include <cstddef>
#include <limits>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "log.h"
#include "network/graph.h"

namespace transitgraph {

using NodePath = std::vector<NodeId>;

// Depth-first search from `start` to `end` using an explicit stack.
//
// Neighbors are pushed in ascending id order (so the largest id is expanded
// first) and keep the predecessor they were first discovered from. Edge
// weights are ignored and the path is not necessarily the shortest one.
//
// Returns std::nullopt when either node is not in the graph or `end` is not
// reachable. A search from a node to itself returns just that node.
std::optional<NodePath> FindPathDfs(
    const TransitGraph& graph, const NodeId& start, const NodeId& end
);

// Breadth-first search from `start` to `end`. The result has the fewest
// possible edges; among equally short paths the one discovered first wins,
// with neighbors enqueued in ascending id order. Same "no path" contract as
// FindPathDfs.
std::optional<NodePath> FindPathBfs(
    const TransitGraph& graph, const NodeId& start, const NodeId& end
);

struct WeightedPath {
  // Empty when there is no path.
  NodePath nodes;

  // Sum of edge weights along `nodes`; infinity when there is no path.
  double cost = std::numeric_limits<double>::infinity();

  bool found() const { return !nodes.empty(); }

  bool operator==(const WeightedPath& other) const {
    return nodes == other.nodes && cost == other.cost;
  }
};

// Dijkstra's algorithm from `start`, stopping as soon as `end` is settled.
//
// Ties between equal tentative distances are broken by node id. Edges without
// a weight count as 1. Results are undefined if any weight is negative.
//
// An unknown or unreachable node gives an empty path with infinite cost.
WeightedPath FindShortestPath(
    const TransitGraph& graph, const NodeId& start, const NodeId& end
);

// (first, second) with first before second in the graph's node order.
using NodePair = std::pair<NodeId, NodeId>;

struct AllPairsOptions {
  // Worker threads sharing the sources. 0 means one per hardware thread.
  unsigned int num_threads = 1;

  // Workers stop picking up new sources once this has passed. Sources already
  // being searched are finished.
  std::optional<std::chrono::steady_clock::time_point> deadline;
};

struct AllPairsResult {
  // One entry per unordered pair of distinct, mutually reachable nodes.
  std::map<NodePair, WeightedPath> paths;

  // False if the deadline stopped the sweep before every source was searched.
  bool complete = true;

  // Pairs whose search has run, whether or not a path was found.
  size_t pairs_processed = 0;
};

// Shortest paths between every unordered pair of distinct nodes. Each pair is
// computed once, from the node that comes first in the graph's node order,
// and matches FindShortestPath for that pair. The graph must not be modified
// while this runs.
AllPairsResult FindAllPairsShortestPaths(
    const TransitGraph& graph,
    const AllPairsOptions& options = {},
    const TextLogger& log = NullLogger()
);

struct PathComparison {
  // Node counts; nullopt for a missing path.
  std::optional<size_t> first_length;
  std::optional<size_t> second_length;

  std::optional<size_t> first_edges;
  std::optional<size_t> second_edges;

  // first_length - second_length, when both paths exist.
  std::optional<long> length_difference;

  // Both paths exist and visit the same nodes in the same order.
  bool same_path = false;
};

PathComparison ComparePaths(
    const std::optional<NodePath>& first, const std::optional<NodePath>& second
);

}  // namespace transitgraph

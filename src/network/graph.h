#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "gtfs/gtfs.h"

namespace transitgraph {

// A logical station. The id is the trimmed stop name shared by all member
// stops.
using NodeId = std::string;

struct StationNode {
  NodeId id;

  // Arithmetic mean over all member stops.
  double lat = 0.0;
  double lon = 0.0;

  // Member stops in the order they were encountered in the stops table.
  std::vector<GtfsStopId> stop_ids;

  bool transfer() const { return stop_ids.size() > 1; }

  bool operator==(const StationNode& other) const {
    return id == other.id && lat == other.lat && lon == other.lon &&
           stop_ids == other.stop_ids;
  }
};

// An undirected edge between two distinct stations. `u` and `v` are in the
// direction of the first traversal seen; lookups ignore the order.
struct Edge {
  NodeId u;
  NodeId v;

  // Every route observed between the two stations, in either direction.
  std::set<GtfsRouteId> route_ids;
  std::set<int> route_types;

  // One sample per trip traversal, in seconds. Duplicates are kept.
  std::vector<int> travel_times;

  // Set by ApplyEdgeWeights. Searches treat a missing weight as 1.
  std::optional<double> weight;

  // The endpoint that is not `end`.
  const NodeId& Other(const NodeId& end) const { return end == u ? v : u; }

  bool operator==(const Edge& other) const {
    return u == other.u && v == other.v && route_ids == other.route_ids &&
           route_types == other.route_types &&
           travel_times == other.travel_times && weight == other.weight;
  }
};

// Unordered pair of node indices, stored with a <= b.
struct NodePairKey {
  size_t a;
  size_t b;

  static NodePairKey Of(size_t x, size_t y) {
    return x <= y ? NodePairKey{x, y} : NodePairKey{y, x};
  }

  bool operator==(const NodePairKey& other) const {
    return a == other.a && b == other.b;
  }
};

}  // namespace transitgraph

namespace std {
template <>
struct hash<transitgraph::NodePairKey> {
  size_t operator()(const transitgraph::NodePairKey& key) const {
    size_t h1 = hash<size_t>()(key.a);
    size_t h2 = hash<size_t>()(key.b);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
  }
};
}  // namespace std

namespace transitgraph {

// One entry of a node's neighbor list: the neighbor's node index and the index
// of the connecting edge.
struct Adjacent {
  size_t node;
  size_t edge;
};

// Undirected station graph with at most one edge per node pair.
//
// Nodes are enumerated in ascending id order, so comparing node indices is the
// same as comparing ids. Every neighbor list is sorted by neighbor id, which
// fixes the order DFS and BFS expand nodes in regardless of the order trips
// were assembled in.
//
// The structure is immutable after construction except for edge weights.
class TransitGraph {
 public:
  TransitGraph() = default;

  // Throws std::invalid_argument for a duplicate node id, an edge endpoint
  // that is not a node, a self-loop, or two edges joining the same pair.
  TransitGraph(std::vector<StationNode> nodes, std::vector<Edge> edges);

  const std::vector<StationNode>& nodes() const { return nodes_; }
  const std::vector<Edge>& edges() const { return edges_; }

  size_t NodeCount() const { return nodes_.size(); }
  size_t EdgeCount() const { return edges_.size(); }

  bool HasNode(const NodeId& id) const { return node_index_.contains(id); }
  std::optional<size_t> NodeIndex(const NodeId& id) const;
  const StationNode* FindNode(const NodeId& id) const;

  // Symmetric: FindEdge(a, b) == FindEdge(b, a). nullptr if absent.
  const Edge* FindEdge(const NodeId& a, const NodeId& b) const;
  bool HasEdge(const NodeId& a, const NodeId& b) const {
    return FindEdge(a, b) != nullptr;
  }

  const std::vector<Adjacent>& Adjacency(size_t node_index) const {
    return adjacency_[node_index];
  }
  size_t Degree(size_t node_index) const {
    return adjacency_[node_index].size();
  }

  // Neighbor ids of `id` sorted ascending; empty for an unknown id.
  std::vector<NodeId> Neighbors(const NodeId& id) const;

  void SetEdgeWeight(size_t edge_index, double weight);

 private:
  std::vector<StationNode> nodes_;
  std::vector<Edge> edges_;
  std::unordered_map<NodeId, size_t> node_index_;
  std::unordered_map<NodePairKey, size_t> edge_index_;
  std::vector<std::vector<Adjacent>> adjacency_;
};

}  // namespace transitgraph

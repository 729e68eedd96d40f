#include "network/graph.h"

#include <algorithm>
#include <stdexcept>

namespace transitgraph {

TransitGraph::TransitGraph(
    std::vector<StationNode> nodes, std::vector<Edge> edges
)
    : nodes_(std::move(nodes)), edges_(std::move(edges)) {
  std::sort(
      nodes_.begin(),
      nodes_.end(),
      [](const StationNode& a, const StationNode& b) { return a.id < b.id; }
  );

  node_index_.reserve(nodes_.size());
  for (size_t i = 0; i < nodes_.size(); ++i) {
    if (!node_index_.emplace(nodes_[i].id, i).second) {
      throw std::invalid_argument("Duplicate node id: '" + nodes_[i].id + "'");
    }
  }

  adjacency_.resize(nodes_.size());
  edge_index_.reserve(edges_.size());
  for (size_t e = 0; e < edges_.size(); ++e) {
    const Edge& edge = edges_[e];
    auto u_it = node_index_.find(edge.u);
    auto v_it = node_index_.find(edge.v);
    if (u_it == node_index_.end() || v_it == node_index_.end()) {
      throw std::invalid_argument(
          "Edge '" + edge.u + "' - '" + edge.v + "' references an unknown node"
      );
    }
    const size_t u = u_it->second;
    const size_t v = v_it->second;
    if (u == v) {
      throw std::invalid_argument("Self-loop edge at '" + edge.u + "'");
    }
    if (!edge_index_.emplace(NodePairKey::Of(u, v), e).second) {
      throw std::invalid_argument(
          "Duplicate edge '" + edge.u + "' - '" + edge.v + "'"
      );
    }
    adjacency_[u].push_back(Adjacent{v, e});
    adjacency_[v].push_back(Adjacent{u, e});
  }

  for (auto& neighbors : adjacency_) {
    std::sort(
        neighbors.begin(),
        neighbors.end(),
        [](const Adjacent& a, const Adjacent& b) { return a.node < b.node; }
    );
  }
}

std::optional<size_t> TransitGraph::NodeIndex(const NodeId& id) const {
  auto it = node_index_.find(id);
  if (it == node_index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

const StationNode* TransitGraph::FindNode(const NodeId& id) const {
  auto index = NodeIndex(id);
  return index ? &nodes_[*index] : nullptr;
}

const Edge* TransitGraph::FindEdge(const NodeId& a, const NodeId& b) const {
  auto a_index = NodeIndex(a);
  auto b_index = NodeIndex(b);
  if (!a_index || !b_index) {
    return nullptr;
  }
  auto it = edge_index_.find(NodePairKey::Of(*a_index, *b_index));
  return it == edge_index_.end() ? nullptr : &edges_[it->second];
}

std::vector<NodeId> TransitGraph::Neighbors(const NodeId& id) const {
  std::vector<NodeId> result;
  auto index = NodeIndex(id);
  if (!index) {
    return result;
  }
  result.reserve(adjacency_[*index].size());
  for (const Adjacent& adjacent : adjacency_[*index]) {
    result.push_back(nodes_[adjacent.node].id);
  }
  return result;
}

void TransitGraph::SetEdgeWeight(size_t edge_index, double weight) {
  edges_.at(edge_index).weight = weight;
}

}  // namespace transitgraph

#include "solver/path_search.h"

#include <algorithm>
#include <deque>
#include <format>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>

namespace transitgraph {

namespace {

constexpr size_t kNoPredecessor = std::numeric_limits<size_t>::max();
constexpr double kInfinity = std::numeric_limits<double>::infinity();

// Cost of an edge that has not been weighted yet.
constexpr double kUnweightedEdgeCost = 1.0;

NodePath ReconstructPath(
    const TransitGraph& graph,
    const std::vector<size_t>& predecessor,
    size_t end
) {
  NodePath path;
  for (size_t node = end; node != kNoPredecessor; node = predecessor[node]) {
    path.push_back(graph.nodes()[node].id);
  }
  std::reverse(path.begin(), path.end());
  return path;
}

enum class FrontierOrder { kLifo, kFifo };

// Shared skeleton of DFS and BFS. Nodes are marked visited when they are
// pushed, so each one keeps the predecessor it was first reached from.
std::optional<NodePath> FindPathUnweighted(
    const TransitGraph& graph,
    const NodeId& start,
    const NodeId& end,
    FrontierOrder order
) {
  const std::optional<size_t> start_index = graph.NodeIndex(start);
  const std::optional<size_t> end_index = graph.NodeIndex(end);
  if (!start_index || !end_index) {
    return std::nullopt;
  }

  std::vector<char> visited(graph.NodeCount(), 0);
  std::vector<size_t> predecessor(graph.NodeCount(), kNoPredecessor);
  std::deque<size_t> frontier;
  frontier.push_back(*start_index);
  visited[*start_index] = 1;

  while (!frontier.empty()) {
    size_t current;
    if (order == FrontierOrder::kLifo) {
      current = frontier.back();
      frontier.pop_back();
    } else {
      current = frontier.front();
      frontier.pop_front();
    }

    if (current == *end_index) {
      return ReconstructPath(graph, predecessor, current);
    }

    for (const Adjacent& adjacent : graph.Adjacency(current)) {
      if (!visited[adjacent.node]) {
        visited[adjacent.node] = 1;
        predecessor[adjacent.node] = current;
        frontier.push_back(adjacent.node);
      }
    }
  }

  return std::nullopt;
}

struct ShortestPathTree {
  std::vector<double> distance;
  std::vector<size_t> predecessor;
};

// Dijkstra from `source`. Stops once `target` is settled, or runs until the
// frontier is empty when there is no target.
//
// The queue may hold several entries for one node; only the one matching the
// node's current distance is expanded. Node indices follow id order, so the
// (distance, index) key breaks ties by id.
ShortestPathTree RunDijkstra(
    const TransitGraph& graph, size_t source, std::optional<size_t> target
) {
  ShortestPathTree tree{
      std::vector<double>(graph.NodeCount(), kInfinity),
      std::vector<size_t>(graph.NodeCount(), kNoPredecessor),
  };
  tree.distance[source] = 0.0;

  using QueueEntry = std::pair<double, size_t>;
  std::priority_queue<
      QueueEntry,
      std::vector<QueueEntry>,
      std::greater<QueueEntry>>
      frontier;
  frontier.emplace(0.0, source);

  while (!frontier.empty()) {
    const auto [current_distance, current] = frontier.top();
    frontier.pop();

    if (current_distance > tree.distance[current]) {
      continue;
    }
    if (target && current == *target) {
      break;
    }

    for (const Adjacent& adjacent : graph.Adjacency(current)) {
      const double weight =
          graph.edges()[adjacent.edge].weight.value_or(kUnweightedEdgeCost);
      const double new_distance = current_distance + weight;
      if (new_distance < tree.distance[adjacent.node]) {
        tree.distance[adjacent.node] = new_distance;
        tree.predecessor[adjacent.node] = current;
        frontier.emplace(new_distance, adjacent.node);
      }
    }
  }

  return tree;
}

}  // namespace

std::optional<NodePath> FindPathDfs(
    const TransitGraph& graph, const NodeId& start, const NodeId& end
) {
  return FindPathUnweighted(graph, start, end, FrontierOrder::kLifo);
}

std::optional<NodePath> FindPathBfs(
    const TransitGraph& graph, const NodeId& start, const NodeId& end
) {
  return FindPathUnweighted(graph, start, end, FrontierOrder::kFifo);
}

WeightedPath FindShortestPath(
    const TransitGraph& graph, const NodeId& start, const NodeId& end
) {
  const std::optional<size_t> start_index = graph.NodeIndex(start);
  const std::optional<size_t> end_index = graph.NodeIndex(end);
  if (!start_index || !end_index) {
    return WeightedPath{};
  }

  const ShortestPathTree tree = RunDijkstra(graph, *start_index, *end_index);
  if (tree.distance[*end_index] == kInfinity) {
    return WeightedPath{};
  }
  return WeightedPath{
      ReconstructPath(graph, tree.predecessor, *end_index),
      tree.distance[*end_index]
  };
}

AllPairsResult FindAllPairsShortestPaths(
    const TransitGraph& graph,
    const AllPairsOptions& options,
    const TextLogger& log
) {
  const size_t num_nodes = graph.NodeCount();
  const size_t total_pairs =
      num_nodes < 2 ? 0 : num_nodes * (num_nodes - 1) / 2;

  // Each source writes only its own slot: paths to the nodes after it.
  std::vector<std::vector<std::pair<size_t, WeightedPath>>> per_source(
      num_nodes
  );
  std::vector<char> source_done(num_nodes, 0);

  // Work queue and progress tracking
  std::mutex mutex;
  std::mutex log_mutex;
  size_t next_source = 0;
  size_t processed = 0;

  auto worker = [&]() {
    while (true) {
      // Claim the next source
      size_t source;
      {
        std::lock_guard<std::mutex> lock(mutex);
        if (options.deadline &&
            std::chrono::steady_clock::now() >= *options.deadline) {
          break;
        }
        source = next_source;
        next_source += 1;
      }
      if (source >= num_nodes) {
        break;
      }

      // A full tree from `source` settles every target exactly as a run that
      // stops at that target would, so one run serves all of its pairs.
      if (source + 1 < num_nodes) {
        const ShortestPathTree tree = RunDijkstra(graph, source, std::nullopt);
        for (size_t target = source + 1; target < num_nodes; ++target) {
          if (tree.distance[target] == kInfinity) {
            continue;
          }
          per_source[source].emplace_back(
              target,
              WeightedPath{
                  ReconstructPath(graph, tree.predecessor, target),
                  tree.distance[target]
              }
          );
        }
      }
      source_done[source] = 1;

      size_t processed_now;
      bool crossed_hundred;
      {
        std::lock_guard<std::mutex> lock(mutex);
        const size_t before = processed;
        processed += num_nodes - 1 - source;
        processed_now = processed;
        crossed_hundred = processed / 100 != before / 100;
      }
      if (crossed_hundred) {
        // Log calls are serialized without holding the work-queue lock.
        std::lock_guard<std::mutex> lock(log_mutex);
        log(std::format("Processed {}/{} pairs", processed_now, total_pairs));
      }
    }
  };

  unsigned int num_threads = options.num_threads;
  if (num_threads == 0) {
    num_threads = std::max(1u, std::thread::hardware_concurrency());
  }
  if (num_threads <= 1) {
    worker();
  } else {
    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (unsigned int t = 0; t < num_threads; ++t) {
      threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
      thread.join();
    }
  }

  AllPairsResult result;
  result.pairs_processed = processed;
  for (size_t source = 0; source < num_nodes; ++source) {
    if (!source_done[source]) {
      result.complete = false;
      continue;
    }
    for (auto& [target, path] : per_source[source]) {
      result.paths.emplace(
          NodePair{graph.nodes()[source].id, graph.nodes()[target].id},
          std::move(path)
      );
    }
  }
  return result;
}

PathComparison ComparePaths(
    const std::optional<NodePath>& first, const std::optional<NodePath>& second
) {
  PathComparison comparison;
  if (first) {
    comparison.first_length = first->size();
    comparison.first_edges = first->empty() ? 0 : first->size() - 1;
  }
  if (second) {
    comparison.second_length = second->size();
    comparison.second_edges = second->empty() ? 0 : second->size() - 1;
  }
  if (first && second) {
    comparison.length_difference = static_cast<long>(first->size()) -
                                   static_cast<long>(second->size());
    comparison.same_path = *first == *second;
  }
  return comparison;
}

}  // namespace transitgraph

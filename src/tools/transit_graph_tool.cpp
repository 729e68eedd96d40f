#include <CLI/CLI.hpp>
#include <chrono>
#include <format>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include "gtfs/gtfs.h"
#include "log.h"
#include "network/edge_weights.h"
#include "network/graph_builder.h"
#include "network/graph_stats.h"
#include "network/network_config.h"
#include "serialization/json.h"
#include "solver/path_search.h"
#include "solver/route_segments.h"
#include "util/format.h"

using namespace transitgraph;

namespace {

std::string FormatCost(double cost, CostModel model) {
  return model == CostModel::kGeographic ? FormatDistance(cost)
                                         : FormatTravelTime(cost);
}

std::string FormatPath(const NodePath& path) {
  std::string out;
  for (size_t i = 0; i < path.size(); ++i) {
    if (i > 0) {
      out += " -> ";
    }
    out += path[i];
  }
  return out;
}

void RequireNodes(
    const TransitGraph& graph, const std::vector<std::string>& ids
) {
  for (const auto& id : ids) {
    if (!graph.HasNode(id)) {
      throw std::runtime_error("Node '" + id + "' not found in graph");
    }
  }
}

void PrintStats(const TransitGraph& graph, bool json) {
  GraphStats stats = ComputeGraphStats(graph);
  if (json) {
    std::cout << nlohmann::json(stats).dump(2) << std::endl;
    return;
  }
  size_t transfer_nodes = 0;
  for (const auto& node : graph.nodes()) {
    if (node.transfer()) {
      transfer_nodes += 1;
    }
  }
  std::cout << "Nodes: " << stats.num_nodes << "\n"
            << "Transfer nodes: " << transfer_nodes << "\n"
            << "Edges: " << stats.num_edges << "\n"
            << "Min degree: " << stats.min_degree << "\n"
            << "Max degree: " << stats.max_degree << "\n"
            << "Avg degree: " << stats.avg_degree << std::endl;
}

void PrintUnweighted(
    const std::string& algorithm, const std::optional<NodePath>& path, bool json
) {
  if (json) {
    std::cout << nlohmann::json{
                     {"algorithm", algorithm},
                     {"nodes", OptionalToJson(path)}
                 }.dump(2)
              << std::endl;
    return;
  }
  if (!path) {
    std::cout << algorithm << ": path not found" << std::endl;
    return;
  }
  std::cout << algorithm << " path (" << path->size()
            << " stations): " << FormatPath(*path) << std::endl;
}

void PrintComparison(
    const std::optional<NodePath>& dfs,
    const std::optional<NodePath>& bfs,
    bool json
) {
  PathComparison comparison = ComparePaths(dfs, bfs);
  if (json) {
    std::cout << nlohmann::json{
                     {"dfs", OptionalToJson(dfs)},
                     {"bfs", OptionalToJson(bfs)},
                     {"comparison", comparison}
                 }.dump(2)
              << std::endl;
    return;
  }
  PrintUnweighted("DFS", dfs, false);
  PrintUnweighted("BFS", bfs, false);
  auto or_dash = [](const auto& value) {
    return value ? std::to_string(*value) : std::string("-");
  };
  std::cout << "DFS length: " << or_dash(comparison.first_length) << "\n"
            << "BFS length: " << or_dash(comparison.second_length) << "\n"
            << "Difference: " << or_dash(comparison.length_difference) << "\n"
            << "Same path: " << (comparison.same_path ? "yes" : "no")
            << std::endl;
}

void PrintRoute(
    const TransitNetwork& network,
    const WeightedPath& path,
    CostModel model,
    bool json
) {
  const std::vector<RouteSegment> segments =
      DescribeRouteSegments(network.graph, path.nodes, network.routes);
  if (json) {
    std::cout << nlohmann::json{
                     {"cost_model", std::string(CostModelName(model))},
                     {"path", path},
                     {"segments", segments}
                 }.dump(2)
              << std::endl;
    return;
  }
  if (!path.found()) {
    std::cout << "Path not found" << std::endl;
    return;
  }
  std::cout << "Path length: " << FormatCost(path.cost, model) << "\n"
            << "Route (" << path.nodes.size() << " stations):\n";
  for (size_t i = 0; i + 1 < path.nodes.size(); ++i) {
    const Edge* edge = network.graph.FindEdge(path.nodes[i], path.nodes[i + 1]);
    std::cout << "  " << (i + 1) << ". " << path.nodes[i] << " -> "
              << path.nodes[i + 1];
    if (edge != nullptr && edge->weight) {
      std::cout << ": " << FormatCost(*edge->weight, model);
    }
    std::cout << "\n";
  }
  std::cout << "Segments:\n";
  for (const auto& segment : segments) {
    std::cout << "  " << FormatRouteSegment(segment) << "\n";
  }
  std::cout << std::flush;
}

void PrintAllPairs(const AllPairsResult& result, CostModel model, bool json) {
  if (json) {
    std::cout << nlohmann::json(result).dump(2) << std::endl;
    return;
  }
  PathCostSummary summary = SummarizePathCosts(result);
  std::cout << "Found " << result.paths.size() << " unique pairs of paths";
  if (!result.complete) {
    std::cout << " (stopped at deadline after " << result.pairs_processed
              << " pairs)";
  }
  std::cout << "\n";
  if (summary.count == 0) {
    std::cout << "No valid paths found" << std::endl;
    return;
  }
  std::cout << "Minimum: " << FormatCost(summary.min_cost, model) << "\n"
            << "Maximum: " << FormatCost(summary.max_cost, model) << "\n"
            << "Average: " << FormatCost(summary.mean_cost, model) << "\n"
            << "Total pairs: " << summary.count << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  CLI::App app{"Build a station graph from a GTFS feed and search it"};
  app.require_subcommand(1);

  std::string config_path;
  std::string gtfs_dir;
  std::vector<int> route_types;
  std::string cost_model_name;
  std::optional<unsigned int> threads;
  bool json = false;
  bool verbose = false;

  app.add_option("--config", config_path, "Path to TOML config file");
  app.add_option("--gtfs-dir", gtfs_dir, "Directory with the unzipped feed");
  app.add_option(
         "--route-types",
         route_types,
         "Comma-separated route types to include (default: all)"
  )
      ->delimiter(',');
  app.add_option(
      "--cost-model", cost_model_name, "Edge weights: geographic or travel-time"
  );
  app.add_option(
      "--threads", threads, "Worker threads for all-pairs (0 = all)"
  );
  app.add_flag("--json", json, "Print results as JSON");
  app.add_flag("-v,--verbose", verbose, "Log progress to stderr");

  std::string from;
  std::string to;

  CLI::App* stats_cmd =
      app.add_subcommand("stats", "Node, edge and degree counts");

  CLI::App* dfs_cmd = app.add_subcommand("dfs", "Depth-first path");
  dfs_cmd->add_option("from", from, "Start station")->required();
  dfs_cmd->add_option("to", to, "End station")->required();

  CLI::App* bfs_cmd = app.add_subcommand("bfs", "Breadth-first path");
  bfs_cmd->add_option("from", from, "Start station")->required();
  bfs_cmd->add_option("to", to, "End station")->required();

  CLI::App* compare_cmd =
      app.add_subcommand("compare", "Compare the DFS and BFS paths");
  compare_cmd->add_option("from", from, "Start station")->required();
  compare_cmd->add_option("to", to, "End station")->required();

  CLI::App* route_cmd =
      app.add_subcommand("route", "Weighted shortest path (Dijkstra)");
  route_cmd->add_option("from", from, "Start station")->required();
  route_cmd->add_option("to", to, "End station")->required();

  double timeout_seconds = 0;
  CLI::App* all_pairs_cmd =
      app.add_subcommand("all-pairs", "Shortest paths between all stations");
  all_pairs_cmd->add_option(
      "--timeout", timeout_seconds, "Stop starting new sources after N seconds"
  );

  std::string output_path;
  CLI::App* export_cmd =
      app.add_subcommand("export", "Write the weighted graph as JSON");
  export_cmd->add_option("output", output_path, "Output JSON file path")
      ->required();

  CLI11_PARSE(app, argc, argv);

  TextLogger log = verbose ? OstreamLogger(std::cerr) : NullLogger();

  try {
    NetworkConfig config;
    if (!config_path.empty()) {
      config = NetworkConfigLoad(config_path);
    }
    if (!gtfs_dir.empty()) {
      config.gtfs_dir = gtfs_dir;
    }
    if (config.gtfs_dir.empty()) {
      throw std::runtime_error("Either --config or --gtfs-dir is required");
    }
    if (!route_types.empty()) {
      config.route_types =
          std::unordered_set<int>(route_types.begin(), route_types.end());
    }
    if (!cost_model_name.empty()) {
      config.cost_model = ParseCostModel(cost_model_name);
    }
    if (threads) {
      config.threads = *threads;
    }

    log(std::format("Loading GTFS data from: {}", config.gtfs_dir));
    Gtfs gtfs = GtfsLoad(config.gtfs_dir);
    TransitNetwork network = BuildTransitNetwork(
        gtfs, config.route_types, PrefixLogger(log, "[build] ")
    );
    ApplyEdgeWeights(network.graph, config.cost_model, config.weighting);
    log(std::format("Weighted edges by {}", CostModelName(config.cost_model)));

    if (*stats_cmd) {
      PrintStats(network.graph, json);
    } else if (*dfs_cmd) {
      RequireNodes(network.graph, {from, to});
      PrintUnweighted("DFS", FindPathDfs(network.graph, from, to), json);
    } else if (*bfs_cmd) {
      RequireNodes(network.graph, {from, to});
      PrintUnweighted("BFS", FindPathBfs(network.graph, from, to), json);
    } else if (*compare_cmd) {
      RequireNodes(network.graph, {from, to});
      PrintComparison(
          FindPathDfs(network.graph, from, to),
          FindPathBfs(network.graph, from, to),
          json
      );
    } else if (*route_cmd) {
      RequireNodes(network.graph, {from, to});
      PrintRoute(
          network,
          FindShortestPath(network.graph, from, to),
          config.cost_model,
          json
      );
    } else if (*all_pairs_cmd) {
      AllPairsOptions options;
      options.num_threads = config.threads;
      if (timeout_seconds > 0) {
        options.deadline =
            std::chrono::steady_clock::now() +
            std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                std::chrono::duration<double>(timeout_seconds)
            );
      }
      AllPairsResult result = FindAllPairsShortestPaths(
          network.graph, options, PrefixLogger(log, "[all-pairs] ")
      );
      PrintAllPairs(result, config.cost_model, json);
    } else if (*export_cmd) {
      std::ofstream out(output_path);
      if (!out.is_open()) {
        throw std::runtime_error(
            "Could not open " + output_path + " for writing"
        );
      }
      out << nlohmann::json(network.graph).dump(2) << "\n";
      log(std::format("Wrote graph to {}", output_path));
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}

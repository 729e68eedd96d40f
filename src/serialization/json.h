#pragma once

#include <cmath>
#include <nlohmann/json.hpp>
#include <optional>

#include "gtfs/gtfs.h"
#include "network/graph.h"
#include "network/graph_stats.h"
#include "solver/path_search.h"
#include "solver/route_segments.h"

namespace transitgraph {

// Ids serialize as plain strings.
inline void to_json(nlohmann::json& j, const GtfsStopId& id) { j = id.v; }
inline void from_json(const nlohmann::json& j, GtfsStopId& id) {
  id.v = j.get<std::string>();
}

inline void to_json(nlohmann::json& j, const GtfsRouteId& id) { j = id.v; }
inline void from_json(const nlohmann::json& j, GtfsRouteId& id) {
  id.v = j.get<std::string>();
}

// Infinite or NaN costs become null.
inline nlohmann::json CostToJson(double cost) {
  return std::isfinite(cost) ? nlohmann::json(cost) : nlohmann::json(nullptr);
}

inline void to_json(nlohmann::json& j, const StationNode& node) {
  j = nlohmann::json{
      {"id", node.id},
      {"lat", node.lat},
      {"lon", node.lon},
      {"stop_ids", node.stop_ids},
      {"transfer", node.transfer()}
  };
}

inline void to_json(nlohmann::json& j, const Edge& edge) {
  j = nlohmann::json{
      {"u", edge.u},
      {"v", edge.v},
      {"route_ids", edge.route_ids},
      {"route_types", edge.route_types},
      {"travel_times", edge.travel_times},
      {"weight",
       edge.weight ? CostToJson(*edge.weight) : nlohmann::json(nullptr)}
  };
}

inline void to_json(nlohmann::json& j, const TransitGraph& graph) {
  j = nlohmann::json{{"nodes", graph.nodes()}, {"edges", graph.edges()}};
}

inline void to_json(nlohmann::json& j, const WeightedPath& path) {
  j = nlohmann::json{{"nodes", path.nodes}, {"cost", CostToJson(path.cost)}};
}

inline void to_json(nlohmann::json& j, const GraphStats& stats) {
  j = nlohmann::json{
      {"num_nodes", stats.num_nodes},
      {"num_edges", stats.num_edges},
      {"min_degree", stats.min_degree},
      {"max_degree", stats.max_degree},
      {"avg_degree", stats.avg_degree},
      {"degrees", stats.degrees}
  };
}

inline void to_json(nlohmann::json& j, const PathCostSummary& summary) {
  j = nlohmann::json{
      {"count", summary.count},
      {"min_cost", summary.min_cost},
      {"max_cost", summary.max_cost},
      {"mean_cost", summary.mean_cost}
  };
}

// Pairs become an array of {"from", "to", "nodes", "cost"} objects in pair
// order, since JSON object keys cannot be pairs.
inline void to_json(nlohmann::json& j, const AllPairsResult& result) {
  nlohmann::json paths = nlohmann::json::array();
  for (const auto& [pair, path] : result.paths) {
    paths.push_back(
        {{"from", pair.first},
         {"to", pair.second},
         {"nodes", path.nodes},
         {"cost", CostToJson(path.cost)}}
    );
  }
  j = nlohmann::json{
      {"complete", result.complete},
      {"pairs_processed", result.pairs_processed},
      {"paths", std::move(paths)}
  };
}

inline void to_json(nlohmann::json& j, const RouteSegment& segment) {
  j = nlohmann::json{
      {"from", segment.from},
      {"to", segment.to},
      {"route_names", segment.route_names}
  };
}

// Absent values are written as null.
template <typename T>
nlohmann::json OptionalToJson(const std::optional<T>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

inline void to_json(nlohmann::json& j, const PathComparison& comparison) {
  j = nlohmann::json{
      {"first_length", OptionalToJson(comparison.first_length)},
      {"second_length", OptionalToJson(comparison.second_length)},
      {"first_edges", OptionalToJson(comparison.first_edges)},
      {"second_edges", OptionalToJson(comparison.second_edges)},
      {"length_difference", OptionalToJson(comparison.length_difference)},
      {"same_path", comparison.same_path}
  };
}

}  // namespace transitgraph

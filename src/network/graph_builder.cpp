#include "network/graph_builder.h"

#include <algorithm>
#include <format>
#include <unordered_map>

namespace transitgraph {

namespace {

// One stop of one trip, resolved to its node and route. Only lives while the
// graph is being assembled.
struct TripStep {
  const GtfsTripId* trip_id;
  size_t node;
  const GtfsRoute* route;
  int stop_sequence;
  GtfsTimeSinceServiceStart arrival_time;
  GtfsTimeSinceServiceStart departure_time;
};

std::vector<TripStep> JoinTripSteps(
    const Gtfs& filtered,
    const StopClusters& clusters,
    const std::unordered_map<NodeId, size_t>& node_index
) {
  std::unordered_map<GtfsRouteId, const GtfsRoute*> routes_by_id;
  for (const auto& route : filtered.routes) {
    routes_by_id.emplace(route.route_id, &route);
  }
  std::unordered_map<GtfsTripId, const GtfsRoute*> trip_routes;
  for (const auto& trip : filtered.trips) {
    auto it = routes_by_id.find(trip.route_id);
    if (it != routes_by_id.end()) {
      trip_routes.emplace(trip.trip_id, it->second);
    }
  }

  std::vector<TripStep> steps;
  steps.reserve(filtered.stop_times.size());
  for (const auto& stop_time : filtered.stop_times) {
    auto route_it = trip_routes.find(stop_time.trip_id);
    if (route_it == trip_routes.end()) {
      continue;
    }
    auto node_it = clusters.stop_to_node.find(stop_time.stop_id);
    if (node_it == clusters.stop_to_node.end()) {
      continue;
    }
    steps.push_back(TripStep{
        &stop_time.trip_id,
        node_index.at(node_it->second),
        route_it->second,
        stop_time.stop_sequence,
        stop_time.arrival_time,
        stop_time.departure_time,
    });
  }

  // Group by trip, then order each trip by stop_sequence. Stable so that
  // duplicate sequence numbers keep their input order.
  std::stable_sort(
      steps.begin(),
      steps.end(),
      [](const TripStep& a, const TripStep& b) {
        if (a.trip_id->v != b.trip_id->v) {
          return a.trip_id->v < b.trip_id->v;
        }
        return a.stop_sequence < b.stop_sequence;
      }
  );
  return steps;
}

}  // namespace

int SegmentTravelTime(
    GtfsTimeSinceServiceStart departure, GtfsTimeSinceServiceStart arrival
) {
  int travel_time = arrival.seconds - departure.seconds;
  if (travel_time < 0) {
    travel_time += kSecondsPerDay;
  }
  return travel_time;
}

TransitNetwork BuildTransitNetwork(
    const Gtfs& gtfs, const RouteTypeFilter& route_types, const TextLogger& log
) {
  Gtfs filtered = GtfsFilterByRouteTypes(gtfs, route_types);
  log(std::format(
      "Selected {} routes, {} trips, {} stop times",
      filtered.routes.size(),
      filtered.trips.size(),
      filtered.stop_times.size()
  ));

  const std::unordered_set<GtfsStopId> used_stop_ids =
      UsedStopIds(filtered.stop_times);
  StopClusters clusters = ClusterStops(filtered.stops, used_stop_ids);
  log(std::format(
      "Clustered {} used stops into {} nodes",
      used_stop_ids.size(),
      clusters.nodes.size()
  ));

  std::unordered_map<NodeId, size_t> node_index;
  for (size_t i = 0; i < clusters.nodes.size(); ++i) {
    node_index.emplace(clusters.nodes[i].id, i);
  }

  const std::vector<TripStep> steps =
      JoinTripSteps(filtered, clusters, node_index);

  // Edges accumulate here keyed by unordered node pair and only become a
  // graph once every trip has been walked.
  std::vector<Edge> edges;
  std::unordered_map<NodePairKey, size_t> edge_for_pair;
  for (size_t i = 0; i + 1 < steps.size(); ++i) {
    const TripStep& current = steps[i];
    const TripStep& next = steps[i + 1];
    if (current.trip_id->v != next.trip_id->v) {
      continue;
    }
    if (current.node == next.node) {
      continue;
    }

    const int travel_time =
        SegmentTravelTime(current.departure_time, next.arrival_time);
    const NodePairKey key = NodePairKey::Of(current.node, next.node);
    auto it = edge_for_pair.find(key);
    if (it != edge_for_pair.end()) {
      Edge& edge = edges[it->second];
      edge.route_ids.insert(current.route->route_id);
      edge.route_types.insert(current.route->route_type);
      edge.travel_times.push_back(travel_time);
    } else {
      edge_for_pair.emplace(key, edges.size());
      edges.push_back(Edge{
          .u = clusters.nodes[current.node].id,
          .v = clusters.nodes[next.node].id,
          .route_ids = {current.route->route_id},
          .route_types = {current.route->route_type},
          .travel_times = {travel_time},
          .weight = std::nullopt,
      });
    }
  }

  TransitNetwork network{
      .graph = TransitGraph(clusters.nodes, std::move(edges)),
      .clusters = std::move(clusters),
      .routes = std::move(filtered.routes),
  };
  log(std::format(
      "Assembled graph: {} nodes, {} edges",
      network.graph.NodeCount(),
      network.graph.EdgeCount()
  ));
  return network;
}

}  // namespace transitgraph

#pragma once

#include <vector>

#include "gtfs/gtfs.h"
#include "gtfs/gtfs_filter.h"
#include "log.h"
#include "network/graph.h"
#include "network/stop_clusters.h"

namespace transitgraph {

struct TransitNetwork {
  // Unweighted station graph.
  TransitGraph graph;

  StopClusters clusters;

  // Routes that passed the route-type filter.
  std::vector<GtfsRoute> routes;
};

constexpr int kSecondsPerDay = 24 * 3600;

// Scheduled time from departing one stop to arriving at the next. A negative
// difference is a service day rollover and gets one day added.
int SegmentTravelTime(
    GtfsTimeSinceServiceStart departure, GtfsTimeSinceServiceStart arrival
);

// Build the station graph of `gtfs` restricted to routes of `route_types`.
//
// Stops referenced by retained trips are clustered by name into nodes. Each
// trip is walked in stop_sequence order (trips in ascending trip id order) and
// every pair of consecutive nodes becomes or extends an undirected edge:
// the trip's route id and type are added to the edge's sets and the segment
// travel time is appended to its samples. Consecutive stops in the same node
// never produce an edge.
TransitNetwork BuildTransitNetwork(
    const Gtfs& gtfs,
    const RouteTypeFilter& route_types,
    const TextLogger& log = NullLogger()
);

}  // namespace transitgraph

#pragma once

#include <string>
#include <vector>

#include "gtfs/gtfs.h"
#include "network/graph.h"
#include "solver/path_search.h"

namespace transitgraph {

// A stretch of a path during which the set of routes serving each edge does
// not change.
struct RouteSegment {
  NodeId from;
  NodeId to;

  // Display names of the routes serving the stretch, sorted.
  std::vector<std::string> route_names;

  bool operator==(const RouteSegment& other) const {
    return from == other.from && to == other.to &&
           route_names == other.route_names;
  }
};

// Split `path` into segments wherever the route set of the next edge differs
// from the previous one; the station where it changes ends one segment and
// starts the next. A step between two nodes with no edge closes the open
// segment and the next one starts at the step's target.
//
// Paths of fewer than two nodes have no segments. If no edge of the path is
// in the graph the result is a single segment from the first to the last node
// with no routes.
std::vector<RouteSegment> DescribeRouteSegments(
    const TransitGraph& graph,
    const NodePath& path,
    const std::vector<GtfsRoute>& routes
);

// "Hauptbahnhof - U1, U3 - Berliner Tor", or "A - B" without routes.
std::string FormatRouteSegment(const RouteSegment& segment);

}  // namespace transitgraph

#include "solver/route_segments.h"

#include <algorithm>
#include <optional>
#include <set>
#include <unordered_map>

namespace transitgraph {

std::vector<RouteSegment> DescribeRouteSegments(
    const TransitGraph& graph,
    const NodePath& path,
    const std::vector<GtfsRoute>& routes
) {
  std::vector<RouteSegment> segments;
  if (path.size() < 2) {
    return segments;
  }

  std::unordered_map<GtfsRouteId, std::string> route_names;
  for (const auto& route : routes) {
    route_names.emplace(route.route_id, RouteDisplayName(route));
  }
  auto names_of = [&route_names](const std::set<GtfsRouteId>& route_ids) {
    std::vector<std::string> names;
    for (const auto& route_id : route_ids) {
      auto it = route_names.find(route_id);
      names.push_back(it == route_names.end() ? route_id.v : it->second);
    }
    std::sort(names.begin(), names.end());
    return names;
  };

  // The route set of the segment being built, if one is open.
  std::optional<std::set<GtfsRouteId>> current_routes;
  NodeId segment_start = path.front();

  for (size_t i = 0; i + 1 < path.size(); ++i) {
    const NodeId& u = path[i];
    const NodeId& v = path[i + 1];
    const Edge* edge = graph.FindEdge(u, v);
    if (edge == nullptr) {
      if (current_routes) {
        segments.push_back(
            RouteSegment{segment_start, u, names_of(*current_routes)}
        );
      }
      segment_start = v;
      current_routes.reset();
      continue;
    }
    if (!current_routes) {
      current_routes = edge->route_ids;
    } else if (*current_routes != edge->route_ids) {
      segments.push_back(
          RouteSegment{segment_start, u, names_of(*current_routes)}
      );
      segment_start = u;
      current_routes = edge->route_ids;
    }
  }

  if (current_routes) {
    segments.push_back(
        RouteSegment{segment_start, path.back(), names_of(*current_routes)}
    );
  } else if (segments.empty()) {
    segments.push_back(RouteSegment{path.front(), path.back(), {}});
  }
  return segments;
}

std::string FormatRouteSegment(const RouteSegment& segment) {
  if (segment.route_names.empty()) {
    return segment.from + " - " + segment.to;
  }
  std::string lines;
  for (size_t i = 0; i < segment.route_names.size(); ++i) {
    if (i > 0) {
      lines += ", ";
    }
    lines += segment.route_names[i];
  }
  return segment.from + " - " + lines + " - " + segment.to;
}

}  // namespace transitgraph

#pragma once

#include <string_view>

#include "network/graph.h"

namespace transitgraph {

enum class CostModel {
  // Great-circle distance between the endpoint stations, in km.
  kGeographic,
  // Fastest scheduled traversal of the edge, in seconds.
  kTravelTime,
};

// Accepts "geographic", "travel-time" and "time". Throws std::invalid_argument
// for anything else.
CostModel ParseCostModel(std::string_view name);
std::string_view CostModelName(CostModel model);
std::string_view CostModelUnit(CostModel model);

struct WeightingOptions {
  double earth_radius_km = 6371.0;

  // Weight of an edge without travel time samples under kTravelTime.
  int default_travel_time_seconds = 60;
};

// Haversine distance between two points given in degrees.
double HaversineDistanceKm(
    double lat1, double lon1, double lat2, double lon2, double earth_radius_km
);

double GeographicWeight(
    const TransitGraph& graph, const Edge& edge, const WeightingOptions& options
);

double TravelTimeWeight(const Edge& edge, const WeightingOptions& options);

// Set the weight of every edge of `graph` under `model`. Depends only on node
// coordinates and edge samples, so reapplying the same model gives the same
// weights.
void ApplyEdgeWeights(
    TransitGraph& graph, CostModel model, const WeightingOptions& options = {}
);

}  // namespace transitgraph

#include "network/edge_weights.h"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include <string>

namespace transitgraph {

namespace {

double ToRadians(double degrees) { return degrees * std::numbers::pi / 180.0; }

}  // namespace

CostModel ParseCostModel(std::string_view name) {
  if (name == "geographic") {
    return CostModel::kGeographic;
  }
  if (name == "travel-time" || name == "time") {
    return CostModel::kTravelTime;
  }
  throw std::invalid_argument(
      "Unknown cost model '" + std::string(name) +
      "' (expected geographic or travel-time)"
  );
}

std::string_view CostModelName(CostModel model) {
  switch (model) {
    case CostModel::kGeographic:
      return "geographic";
    case CostModel::kTravelTime:
      return "travel-time";
  }
  return "unknown";
}

std::string_view CostModelUnit(CostModel model) {
  switch (model) {
    case CostModel::kGeographic:
      return "km";
    case CostModel::kTravelTime:
      return "s";
  }
  return "";
}

double HaversineDistanceKm(
    double lat1, double lon1, double lat2, double lon2, double earth_radius_km
) {
  const double phi1 = ToRadians(lat1);
  const double phi2 = ToRadians(lat2);
  const double dphi = ToRadians(lat2) - ToRadians(lat1);
  const double dlambda = ToRadians(lon2) - ToRadians(lon1);

  const double a = std::sin(dphi / 2) * std::sin(dphi / 2) +
                   std::cos(phi1) * std::cos(phi2) * std::sin(dlambda / 2) *
                       std::sin(dlambda / 2);
  const double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
  return earth_radius_km * c;
}

double GeographicWeight(
    const TransitGraph& graph, const Edge& edge, const WeightingOptions& options
) {
  const StationNode* u = graph.FindNode(edge.u);
  const StationNode* v = graph.FindNode(edge.v);
  if (u == nullptr || v == nullptr) {
    throw std::invalid_argument(
        "Edge '" + edge.u + "' - '" + edge.v + "' is not part of the graph"
    );
  }
  return HaversineDistanceKm(
      u->lat, u->lon, v->lat, v->lon, options.earth_radius_km
  );
}

double TravelTimeWeight(const Edge& edge, const WeightingOptions& options) {
  if (edge.travel_times.empty()) {
    return options.default_travel_time_seconds;
  }
  return *std::min_element(edge.travel_times.begin(), edge.travel_times.end());
}

void ApplyEdgeWeights(
    TransitGraph& graph, CostModel model, const WeightingOptions& options
) {
  for (size_t e = 0; e < graph.EdgeCount(); ++e) {
    const Edge& edge = graph.edges()[e];
    double weight = 0.0;
    switch (model) {
      case CostModel::kGeographic:
        weight = GeographicWeight(graph, edge, options);
        break;
      case CostModel::kTravelTime:
        weight = TravelTimeWeight(edge, options);
        break;
    }
    graph.SetEdgeWeight(e, weight);
  }
}

}  // namespace transitgraph

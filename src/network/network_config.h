#pragma once

#include <string>

#include "gtfs/gtfs_filter.h"
#include "network/edge_weights.h"

namespace transitgraph {

struct NetworkConfig {
  std::string gtfs_dir;
  RouteTypeFilter route_types;
  CostModel cost_model = CostModel::kGeographic;
  WeightingOptions weighting;
  unsigned int threads = 1;
};

// Parse a TOML config file into a NetworkConfig.
//
//   gtfs_dir = "data/HVV"          # required, relative to the config file
//   route_types = [402, 109]       # optional, all routes when absent
//   cost_model = "travel-time"     # optional, "geographic" by default
//   earth_radius_km = 6371.0       # optional
//   default_travel_time_seconds = 60
//   threads = 4
NetworkConfig NetworkConfigLoad(const std::string& config_path);

}  // namespace transitgraph

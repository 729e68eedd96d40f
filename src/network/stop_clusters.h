#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "gtfs/gtfs.h"
#include "network/graph.h"

namespace transitgraph {

struct StopClusters {
  // One node per distinct normalized stop name, sorted by id.
  std::vector<StationNode> nodes;

  // Every clustered stop id to the id of the node that owns it.
  std::unordered_map<GtfsStopId, NodeId> stop_to_node;
};

// Strip leading and trailing whitespace. Case and inner whitespace are kept.
std::string NormalizeStopName(std::string_view stop_name);

// Merge the stops in `used_stop_ids` that share a normalized name into one
// node each, averaging their coordinates. Stops outside `used_stop_ids` are
// dropped. An empty name is a valid (if degenerate) cluster key.
StopClusters ClusterStops(
    const std::vector<GtfsStop>& stops,
    const std::unordered_set<GtfsStopId>& used_stop_ids
);

}  // namespace transitgraph

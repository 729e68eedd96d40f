#include "network/stop_clusters.h"

#include <map>

namespace transitgraph {

std::string NormalizeStopName(std::string_view stop_name) {
  constexpr std::string_view kWhitespace = " \t\n\r\f\v";
  const size_t begin = stop_name.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  const size_t end = stop_name.find_last_not_of(kWhitespace);
  return std::string(stop_name.substr(begin, end - begin + 1));
}

StopClusters ClusterStops(
    const std::vector<GtfsStop>& stops,
    const std::unordered_set<GtfsStopId>& used_stop_ids
) {
  struct Accumulator {
    double lat_sum = 0.0;
    double lon_sum = 0.0;
    std::vector<GtfsStopId> stop_ids;
  };

  // Ordered by name so the node list comes out sorted.
  std::map<std::string, Accumulator> groups;
  for (const auto& stop : stops) {
    if (!used_stop_ids.count(stop.stop_id)) {
      continue;
    }
    Accumulator& group = groups[NormalizeStopName(stop.stop_name)];
    group.lat_sum += stop.stop_lat;
    group.lon_sum += stop.stop_lon;
    group.stop_ids.push_back(stop.stop_id);
  }

  StopClusters result;
  result.nodes.reserve(groups.size());
  for (auto& [name, group] : groups) {
    const double count = static_cast<double>(group.stop_ids.size());
    for (const auto& stop_id : group.stop_ids) {
      result.stop_to_node[stop_id] = name;
    }
    result.nodes.push_back(StationNode{
        .id = name,
        .lat = group.lat_sum / count,
        .lon = group.lon_sum / count,
        .stop_ids = std::move(group.stop_ids),
    });
  }

  return result;
}

}  // namespace transitgraph

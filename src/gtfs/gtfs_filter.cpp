#include "gtfs/gtfs_filter.h"

namespace transitgraph {

Gtfs GtfsFilterByRouteTypes(
    const Gtfs& gtfs, const RouteTypeFilter& route_types
) {
  Gtfs result;

  // Step 1: Keep routes of an allowed type
  std::unordered_set<GtfsRouteId> kept_route_ids;
  for (const auto& route : gtfs.routes) {
    if (!route_types || route_types->count(route.route_type)) {
      result.routes.push_back(route);
      kept_route_ids.insert(route.route_id);
    }
  }

  // Step 2: Keep trips running on kept routes
  std::unordered_set<GtfsTripId> kept_trip_ids;
  for (const auto& trip : gtfs.trips) {
    if (kept_route_ids.count(trip.route_id)) {
      result.trips.push_back(trip);
      kept_trip_ids.insert(trip.trip_id);
    }
  }

  // Step 3: Keep stop times of kept trips
  for (const auto& stop_time : gtfs.stop_times) {
    if (kept_trip_ids.count(stop_time.trip_id)) {
      result.stop_times.push_back(stop_time);
    }
  }

  // Step 4: Include all stops
  result.stops = gtfs.stops;

  return result;
}

std::unordered_set<GtfsStopId> UsedStopIds(
    const std::vector<GtfsStopTime>& stop_times
) {
  std::unordered_set<GtfsStopId> used;
  for (const auto& stop_time : stop_times) {
    used.insert(stop_time.stop_id);
  }
  return used;
}

}  // namespace transitgraph

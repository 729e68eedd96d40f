#pragma once

#include <optional>
#include <unordered_set>
#include <vector>

#include "gtfs/gtfs.h"

namespace transitgraph {

// Route types to keep when assembling a network. `std::nullopt` keeps every
// route.
using RouteTypeFilter = std::optional<std::unordered_set<int>>;

// Keep routes whose route_type passes `route_types`, the trips on those
// routes and the stop times of those trips. Stops are kept unchanged; the stop
// clusterer discards the ones no retained trip references.
Gtfs GtfsFilterByRouteTypes(
    const Gtfs& gtfs, const RouteTypeFilter& route_types
);

// Stop ids referenced by at least one stop time.
std::unordered_set<GtfsStopId> UsedStopIds(
    const std::vector<GtfsStopTime>& stop_times
);

}  // namespace transitgraph

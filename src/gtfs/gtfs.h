#pragma once

#include <functional>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace transitgraph {

struct GtfsStopId {
  std::string v;

  bool operator==(const GtfsStopId& other) const { return v == other.v; }
  bool operator<(const GtfsStopId& other) const { return v < other.v; }
};

struct GtfsRouteId {
  std::string v;

  bool operator==(const GtfsRouteId& other) const { return v == other.v; }
  bool operator<(const GtfsRouteId& other) const { return v < other.v; }
};

struct GtfsTripId {
  std::string v;

  bool operator==(const GtfsTripId& other) const { return v == other.v; }
  bool operator<(const GtfsTripId& other) const { return v < other.v; }
};

struct GtfsTimeSinceServiceStart {
  int seconds;

  bool operator==(const GtfsTimeSinceServiceStart& other) const {
    return seconds == other.seconds;
  }
};

struct GtfsStop {
  GtfsStopId stop_id;
  std::string stop_name;
  double stop_lat;
  double stop_lon;

  bool operator==(const GtfsStop& other) const {
    return stop_id == other.stop_id && stop_name == other.stop_name &&
           stop_lat == other.stop_lat && stop_lon == other.stop_lon;
  }
};

struct GtfsRoute {
  GtfsRouteId route_id;
  int route_type;
  std::string route_short_name;
  std::string route_long_name;
  std::string route_color;

  bool operator==(const GtfsRoute& other) const {
    return route_id == other.route_id && route_type == other.route_type &&
           route_short_name == other.route_short_name &&
           route_long_name == other.route_long_name &&
           route_color == other.route_color;
  }
};

struct GtfsTrip {
  GtfsTripId trip_id;
  GtfsRouteId route_id;

  bool operator==(const GtfsTrip& other) const {
    return trip_id == other.trip_id && route_id == other.route_id;
  }
};

struct GtfsStopTime {
  GtfsTripId trip_id;
  GtfsStopId stop_id;
  int stop_sequence;
  GtfsTimeSinceServiceStart arrival_time;
  GtfsTimeSinceServiceStart departure_time;

  bool operator==(const GtfsStopTime& other) const {
    return trip_id == other.trip_id && stop_id == other.stop_id &&
           stop_sequence == other.stop_sequence &&
           arrival_time == other.arrival_time &&
           departure_time == other.departure_time;
  }
};

struct Gtfs {
  std::vector<GtfsStop> stops;
  std::vector<GtfsRoute> routes;
  std::vector<GtfsTrip> trips;
  std::vector<GtfsStopTime> stop_times;
};

// Raised when a feed file is missing or lacks a required column. Nothing is
// assembled from a feed that fails this check.
class GtfsSchemaError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Load stops.txt, routes.txt, trips.txt and stop_times.txt from a directory
// containing an unzipped GTFS feed.
Gtfs GtfsLoad(const std::string& gtfs_directory_path);

// Parse GTFS time string (H:MM:SS, hours may exceed 23) to seconds since the
// start of the service day. Empty or malformed input parses to 0.
GtfsTimeSinceServiceStart ParseGtfsTime(std::string_view time_str);

// Short name if present, else the long name cut to 30 characters, else the id.
std::string RouteDisplayName(const GtfsRoute& route);

// "#RRGGBB" / "#RGB" for a valid route_color, `fallback` otherwise.
std::string RouteColorHex(
    const GtfsRoute& route, const std::string& fallback = "#999999"
);

// Stream output, used by Google Test failure messages.
inline std::ostream& operator<<(std::ostream& os, const GtfsStopId& id) {
  return os << "stop:" << std::quoted(id.v);
}

inline std::ostream& operator<<(std::ostream& os, const GtfsRouteId& id) {
  return os << "route:" << std::quoted(id.v);
}

inline std::ostream& operator<<(std::ostream& os, const GtfsTripId& id) {
  return os << "trip:" << std::quoted(id.v);
}

inline std::ostream& operator<<(
    std::ostream& os, const GtfsTimeSinceServiceStart& time
) {
  const char fill = os.fill('0');
  os << time.seconds / 3600 << ":" << std::setw(2) << time.seconds % 3600 / 60
     << ":" << std::setw(2) << time.seconds % 60;
  os.fill(fill);
  return os;
}

inline std::ostream& operator<<(std::ostream& os, const GtfsStop& stop) {
  return os << "(" << stop.stop_id << " " << std::quoted(stop.stop_name)
            << " @ " << stop.stop_lat << "," << stop.stop_lon << ")";
}

inline std::ostream& operator<<(std::ostream& os, const GtfsRoute& route) {
  return os << "(" << route.route_id << " type=" << route.route_type << " "
            << std::quoted(route.route_short_name) << " "
            << std::quoted(route.route_long_name) << " #" << route.route_color
            << ")";
}

inline std::ostream& operator<<(std::ostream& os, const GtfsTrip& trip) {
  return os << "(" << trip.trip_id << " on " << trip.route_id << ")";
}

inline std::ostream& operator<<(std::ostream& os, const GtfsStopTime& st) {
  return os << "(" << st.trip_id << " #" << st.stop_sequence << " at "
            << st.stop_id << " arr " << st.arrival_time << " dep "
            << st.departure_time << ")";
}

// Hashes any of the string-backed feed ids by its raw value.
struct GtfsIdHash {
  template <typename Id>
  size_t operator()(const Id& id) const {
    return std::hash<std::string>()(id.v);
  }
};

}  // namespace transitgraph

namespace std {
template <>
struct hash<transitgraph::GtfsStopId> : transitgraph::GtfsIdHash {};
template <>
struct hash<transitgraph::GtfsRouteId> : transitgraph::GtfsIdHash {};
template <>
struct hash<transitgraph::GtfsTripId> : transitgraph::GtfsIdHash {};
}  // namespace std

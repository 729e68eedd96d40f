#include "gtfs/gtfs.h"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <csv.hpp>
#include <filesystem>
#include <initializer_list>
#include <limits>
#include <string_view>

namespace transitgraph {

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

std::string_view TrimWhitespace(std::string_view s) {
  const size_t begin = s.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  const size_t end = s.find_last_not_of(kWhitespace);
  return s.substr(begin, end - begin + 1);
}

// Parses a non-empty run of decimal digits. Anything else (signs, spaces
// inside, overflow) is rejected.
bool ParseTimeField(std::string_view field, int& out) {
  field = TrimWhitespace(field);
  if (field.empty() || !std::all_of(field.begin(), field.end(), [](char c) {
        return c >= '0' && c <= '9';
      })) {
    return false;
  }
  const char* last = field.data() + field.size();
  auto [ptr, ec] = std::from_chars(field.data(), last, out);
  return ec == std::errc() && ptr == last;
}

bool HasColumn(const std::vector<std::string>& columns, std::string_view name) {
  return std::find(columns.begin(), columns.end(), name) != columns.end();
}

// Checks that the header already read by `reader` has every column in
// `required`.
std::vector<std::string> RequireColumns(
    csv::CSVReader& reader,
    const std::string& file_path,
    std::initializer_list<std::string_view> required
) {
  std::vector<std::string> columns = reader.get_col_names();
  for (std::string_view column : required) {
    if (!HasColumn(columns, column)) {
      throw GtfsSchemaError(
          "Required column '" + std::string(column) + "' missing from " +
          file_path
      );
    }
  }
  return columns;
}

// Reads every row of one feed table. The file must exist and carry all
// `required` columns; `read_row` fills one record from one row and may look at
// the header to decide about optional columns.
template <typename Record, typename ReadRow>
std::vector<Record> LoadTable(
    const std::string& file_path,
    std::initializer_list<std::string_view> required,
    size_t approx_bytes_per_row,
    ReadRow read_row
) {
  if (!std::filesystem::exists(file_path)) {
    throw GtfsSchemaError("Required GTFS file not found: " + file_path);
  }
  csv::CSVReader reader(file_path);
  const std::vector<std::string> columns =
      RequireColumns(reader, file_path, required);

  std::vector<Record> records;
  try {
    records.reserve(
        std::filesystem::file_size(file_path) / approx_bytes_per_row
    );
    for (csv::CSVRow& row : reader) {
      read_row(row, columns, records.emplace_back());
    }
  } catch (const std::exception& e) {
    throw std::runtime_error(
        "Could not parse file: " + file_path + " - " + e.what()
    );
  }
  return records;
}

// Empty string when the column is absent.
std::string OptionalField(
    csv::CSVRow& row,
    const std::vector<std::string>& columns,
    std::string_view name
) {
  return HasColumn(columns, name) ? row[std::string(name)].get<std::string>()
                                  : std::string();
}

GtfsTimeSinceServiceStart OptionalTime(
    csv::CSVRow& row,
    const std::vector<std::string>& columns,
    std::string_view name
) {
  if (!HasColumn(columns, name)) {
    return GtfsTimeSinceServiceStart{0};
  }
  return ParseGtfsTime(row[std::string(name)].get<std::string_view>());
}

bool IsHexDigit(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') ||
         (c >= 'A' && c <= 'F');
}

}  // namespace

GtfsTimeSinceServiceStart ParseGtfsTime(std::string_view time_str) {
  std::array<std::string_view, 3> fields;
  size_t field_count = 0;
  size_t start = 0;
  while (true) {
    const size_t colon = time_str.find(':', start);
    if (field_count == fields.size()) {
      return GtfsTimeSinceServiceStart{0};
    }
    fields[field_count++] = time_str.substr(start, colon - start);
    if (colon == std::string_view::npos) {
      break;
    }
    start = colon + 1;
  }
  if (field_count != fields.size()) {
    return GtfsTimeSinceServiceStart{0};
  }

  int hours = 0;
  int minutes = 0;
  int seconds = 0;
  if (!ParseTimeField(fields[0], hours) ||
      !ParseTimeField(fields[1], minutes) ||
      !ParseTimeField(fields[2], seconds)) {
    return GtfsTimeSinceServiceStart{0};
  }

  const int64_t total = int64_t{hours} * 3600 + int64_t{minutes} * 60 + seconds;
  if (total > std::numeric_limits<int>::max()) {
    return GtfsTimeSinceServiceStart{0};
  }
  return GtfsTimeSinceServiceStart{static_cast<int>(total)};
}

Gtfs GtfsLoad(const std::string& gtfs_directory_path) {
  const std::filesystem::path dir(gtfs_directory_path);
  Gtfs gtfs;

  gtfs.stops = LoadTable<GtfsStop>(
      (dir / "stops.txt").string(),
      {"stop_id", "stop_name", "stop_lat", "stop_lon"},
      100,
      [](csv::CSVRow& row, const std::vector<std::string>&, GtfsStop& stop) {
        stop.stop_id = GtfsStopId{row["stop_id"].get<std::string>()};
        stop.stop_name = row["stop_name"].get<std::string>();
        stop.stop_lat = row["stop_lat"].get<double>();
        stop.stop_lon = row["stop_lon"].get<double>();
      }
  );

  gtfs.routes = LoadTable<GtfsRoute>(
      (dir / "routes.txt").string(),
      {"route_id", "route_type"},
      100,
      [](csv::CSVRow& row,
         const std::vector<std::string>& columns,
         GtfsRoute& route) {
        route.route_id = GtfsRouteId{row["route_id"].get<std::string>()};
        route.route_type = row["route_type"].get<int>();
        route.route_short_name =
            OptionalField(row, columns, "route_short_name");
        route.route_long_name = OptionalField(row, columns, "route_long_name");
        route.route_color = OptionalField(row, columns, "route_color");
      }
  );

  gtfs.trips = LoadTable<GtfsTrip>(
      (dir / "trips.txt").string(),
      {"trip_id", "route_id"},
      80,
      [](csv::CSVRow& row, const std::vector<std::string>&, GtfsTrip& trip) {
        trip.trip_id = GtfsTripId{row["trip_id"].get<std::string>()};
        trip.route_id = GtfsRouteId{row["route_id"].get<std::string>()};
      }
  );

  // stop_times.txt is by far the largest table.
  gtfs.stop_times = LoadTable<GtfsStopTime>(
      (dir / "stop_times.txt").string(),
      {"trip_id", "stop_id", "stop_sequence"},
      70,
      [](csv::CSVRow& row,
         const std::vector<std::string>& columns,
         GtfsStopTime& st) {
        st.trip_id = GtfsTripId{row["trip_id"].get<std::string>()};
        st.stop_id = GtfsStopId{row["stop_id"].get<std::string>()};
        st.stop_sequence = row["stop_sequence"].get<int>();
        st.arrival_time = OptionalTime(row, columns, "arrival_time");
        st.departure_time = OptionalTime(row, columns, "departure_time");
      }
  );

  return gtfs;
}

std::string RouteDisplayName(const GtfsRoute& route) {
  if (!route.route_short_name.empty()) {
    return route.route_short_name;
  }
  if (!route.route_long_name.empty()) {
    return route.route_long_name.substr(0, 30);
  }
  return route.route_id.v;
}

std::string RouteColorHex(const GtfsRoute& route, const std::string& fallback) {
  std::string_view color = TrimWhitespace(route.route_color);
  if ((color.size() != 3 && color.size() != 6) ||
      !std::all_of(color.begin(), color.end(), IsHexDigit)) {
    return fallback;
  }
  return "#" + std::string(color);
}

}  // namespace transitgraph

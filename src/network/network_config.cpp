#include "network/network_config.h"

#include <cstdint>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <string>
#include <toml++/toml.hpp>
#include <unordered_set>

namespace transitgraph {

namespace {

bool FitsInInt(int64_t value) {
  return value >= std::numeric_limits<int>::min() &&
         value <= std::numeric_limits<int>::max();
}

}  // namespace

NetworkConfig NetworkConfigLoad(const std::string& config_path) {
  toml::table config;
  try {
    config = toml::parse_file(config_path);
  } catch (const toml::parse_error& err) {
    throw std::runtime_error(
        "Could not parse config " + config_path + ": " +
        std::string(err.description())
    );
  }

  auto gtfs_dir = config["gtfs_dir"].value<std::string>();
  if (!gtfs_dir) {
    throw std::runtime_error("Config file must contain gtfs_dir");
  }

  NetworkConfig result;

  // Resolve gtfs_dir relative to the config file's directory.
  std::filesystem::path config_dir =
      std::filesystem::weakly_canonical(config_path).parent_path();
  result.gtfs_dir = (config_dir / *gtfs_dir).string();

  if (auto arr = config["route_types"].as_array()) {
    std::unordered_set<int> route_types;
    for (const auto& elem : *arr) {
      auto val = elem.value<int64_t>();
      if (!val) {
        throw std::runtime_error("route_types must be an array of integers");
      }
      if (!FitsInInt(*val)) {
        throw std::runtime_error(
            "route_types value out of range: " + std::to_string(*val)
        );
      }
      route_types.insert(static_cast<int>(*val));
    }
    result.route_types = std::move(route_types);
  } else if (config.contains("route_types")) {
    throw std::runtime_error("route_types must be an array of integers");
  }

  if (auto cost_model = config["cost_model"].value<std::string>()) {
    result.cost_model = ParseCostModel(*cost_model);
  }
  if (auto radius = config["earth_radius_km"].value<double>()) {
    result.weighting.earth_radius_km = *radius;
  }
  if (auto seconds = config["default_travel_time_seconds"].value<int64_t>()) {
    if (!FitsInInt(*seconds)) {
      throw std::runtime_error(
          "default_travel_time_seconds out of range: " +
          std::to_string(*seconds)
      );
    }
    result.weighting.default_travel_time_seconds = static_cast<int>(*seconds);
  }
  if (auto threads = config["threads"].value<int64_t>()) {
    if (*threads < 0) {
      throw std::runtime_error("threads must not be negative");
    }
    result.threads = static_cast<unsigned int>(*threads);
  }

  return result;
}

}  // namespace transitgraph

#include "util/format.h"

#include <cmath>
#include <format>

namespace transitgraph {

std::string FormatTravelTime(double seconds) {
  if (seconds < 60) {
    return std::format("{:.1f} sec", seconds);
  }
  if (seconds < 3600) {
    return std::format("{:.1f} min", seconds / 60);
  }
  const int hours = static_cast<int>(seconds / 3600);
  const int minutes = static_cast<int>(std::fmod(seconds, 3600.0) / 60);
  return std::format("{} h {} min", hours, minutes);
}

std::string FormatDistance(double km) {
  if (km < 1) {
    return std::format("{:.0f} m", km * 1000);
  }
  return std::format("{:.2f} km", km);
}

}  // namespace transitgraph

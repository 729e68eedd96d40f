#pragma once

#include <string>

namespace transitgraph {

// "12.5 sec" below a minute, "4.0 min" below an hour, "1 h 5 min" otherwise.
std::string FormatTravelTime(double seconds);

// "850 m" below one kilometer, "3.25 km" otherwise.
std::string FormatDistance(double km);

}  // namespace transitgraph

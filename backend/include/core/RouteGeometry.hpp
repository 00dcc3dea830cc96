#pragma once
#include "core/Coordinate.hpp"

namespace routesim::geometry {

// Straight-line distance in coordinate-degree space: sqrt(dlat^2 + dlng^2).
// Not a geodesic distance.
double segment_distance(const Coordinate& a, const Coordinate& b);

// Sum of segment_distance over consecutive waypoint pairs (0 for fewer than two points).
double total_distance(const Waypoints& waypoints);

// Component-wise linear interpolation; ratio is not clamped.
Coordinate lerp(const Coordinate& from, const Coordinate& to, double ratio);

} // namespace routesim::geometry

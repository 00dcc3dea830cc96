#include "core/RouteGeometry.hpp"
#include <cmath>

namespace routesim::geometry {

double segment_distance(const Coordinate& a, const Coordinate& b) {
    const double lat_diff = b.lat - a.lat;
    const double lng_diff = b.lng - a.lng;
    return std::sqrt(lat_diff * lat_diff + lng_diff * lng_diff);
}

double total_distance(const Waypoints& waypoints) {
    double total = 0.0;
    for (std::size_t i = 0; i + 1 < waypoints.size(); ++i) {
        total += segment_distance(waypoints[i], waypoints[i + 1]);
    }
    return total;
}

Coordinate lerp(const Coordinate& from, const Coordinate& to, double ratio) {
    return Coordinate{
        from.lat + (to.lat - from.lat) * ratio,
        from.lng + (to.lng - from.lng) * ratio
    };
}

} // namespace routesim::geometry

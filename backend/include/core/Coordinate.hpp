#pragma once
#include <vector>
#include <nlohmann/json.hpp>

namespace routesim {

// A point in coordinate-degree space. No range checking: out-of-range values are kept as-is.
struct Coordinate {
    double lat = 0.0;
    double lng = 0.0;
};

inline bool operator==(const Coordinate& a, const Coordinate& b) {
    return a.lat == b.lat && a.lng == b.lng;
}

inline bool operator!=(const Coordinate& a, const Coordinate& b) {
    return !(a == b);
}

inline void to_json(nlohmann::json& j, const Coordinate& c) {
    j = nlohmann::json{ {"lat", c.lat}, {"lng", c.lng} };
}

using Waypoints = std::vector<Coordinate>;

} // namespace routesim

#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace routesim::api {

struct GeocodeResult {
    std::string name;
    double lat = 0.0;
    double lng = 0.0;
};

inline void to_json(nlohmann::json& j, const GeocodeResult& r) {
    j = nlohmann::json{ {"name", r.name}, {"lat", r.lat}, {"lng", r.lng} };
}

// Named-location lookup used to seed a waypoint list.
class IGeocoder {
public:
    virtual ~IGeocoder() = default;
    virtual std::vector<GeocodeResult> search(const std::string& query) const = 0;
};

// Fixed answers keyed on a few well-known city names; no network access.
class MockGeocoder : public IGeocoder {
public:
    std::vector<GeocodeResult> search(const std::string& query) const override;
};

} // namespace routesim::api

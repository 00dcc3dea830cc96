#include "api/Geocoder.hpp"
#include <algorithm>
#include <cctype>

namespace routesim::api {

std::vector<GeocodeResult> MockGeocoder::search(const std::string& query) const {
    std::string q = query;
    std::transform(q.begin(), q.end(), q.begin(), [](unsigned char c) { return std::tolower(c); });

    if (q.find("new york") != std::string::npos) {
        return {
            { "New York, NY, USA", 40.7128, -74.0060 },
            { "New York Mills, MN, USA", 46.5188, -95.3767 }
        };
    }
    if (q.find("london") != std::string::npos) {
        return {
            { "London, UK", 51.5074, -0.1278 },
            { "London, ON, Canada", 42.9849, -81.2453 }
        };
    }
    return {
        { "Paris, France", 48.8566, 2.3522 },
        { "Berlin, Germany", 52.5200, 13.4050 },
        { "Tokyo, Japan", 35.6762, 139.6503 }
    };
}

} // namespace routesim::api

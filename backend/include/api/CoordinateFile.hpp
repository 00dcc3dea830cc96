#pragma once
#include <string>
#include "core/Coordinate.hpp"

namespace routesim::api {

// Parse an uploaded waypoint file, choosing the format from the file extension
// (.json / .geojson, .csv, .txt). Throws CoordinateParseError.
Waypoints parse_coordinate_file(const std::string& content, const std::string& filename);

// Array of {lat, lng} objects, or a GeoJSON FeatureCollection of points.
Waypoints parse_json_coordinates(const std::string& content);
// Header row plus data rows; lat/lng columns located by header name.
Waypoints parse_csv_coordinates(const std::string& content);
// One "lat,lng" or "lat lng" pair per line.
Waypoints parse_txt_coordinates(const std::string& content);

} // namespace routesim::api

#pragma once

#include <string>
#include <string_view>

namespace routesim::errors {

// 2400-2499: WebSocket / control channel errors
// 2500-2599: coordinate import and HTTP API errors

inline constexpr int E2400_CONTROL_REJECTED = 2400;
inline constexpr int E2401_START_REJECTED = 2401;
inline constexpr int E2410_SESSION_DROPPED = 2410;
inline constexpr int E2500_COORDINATE_IMPORT = 2500;

inline constexpr const char* MSG_E2400_CONTROL_REJECTED_PREFIX = "Error 2400: Control message rejected: ";
inline constexpr const char* MSG_E2410_SESSION_DROPPED = "Error 2410: WebSocket session dropped unexpectedly";

// Sent to the client verbatim in an ERROR message.
inline constexpr const char* MSG_E2401_MIN_WAYPOINTS = "At least two waypoints are required";

// Catalogued detail strings for E2400 (logged, never sent to the client).
inline constexpr const char* D2400_INVALID_REQUEST = "invalid request";
inline constexpr const char* D2400_INVALID_JSON = "invalid JSON";
inline constexpr const char* D2400_NOT_OBJECT = "message must be a JSON object";
inline constexpr const char* D2400_MISSING_TYPE = "message missing type";
inline constexpr const char* D2400_UNKNOWN_TYPE = "unknown message type";
inline constexpr const char* D2400_WAYPOINTS_NOT_ARRAY = "waypoints must be an array";
inline constexpr const char* D2400_WAYPOINT_INVALID = "waypoint must be {lat:number, lng:number}";
inline constexpr const char* D2400_SPEED_NOT_NUMBER = "speed must be a number";
inline constexpr const char* D2400_SPEED_MISSING = "UPDATE_SPEED requires speed";

// Coordinate file import (E2500). Prefixes match the file kind.
inline constexpr const char* D2500_JSON_PREFIX = "JSON parsing error: ";
inline constexpr const char* D2500_CSV_PREFIX = "CSV parsing error: ";
inline constexpr const char* D2500_TXT_PREFIX = "Text file parsing error: ";
inline constexpr const char* D2500_UNSUPPORTED_FORMAT = "Unsupported file format. Please upload JSON, CSV, or TXT files.";
inline constexpr const char* D2500_JSON_BAD_POINT = "Invalid coordinate format. Expected {lat, lng} objects.";
inline constexpr const char* D2500_JSON_BAD_GEOJSON = "Invalid GeoJSON format. Expected coordinates array in geometry.";
inline constexpr const char* D2500_JSON_BAD_SHAPE = "Invalid JSON format. Expected array of coordinates or GeoJSON.";
inline constexpr const char* D2500_CSV_TOO_SHORT = "CSV file must contain at least a header and one data row.";
inline constexpr const char* D2500_CSV_NO_COLUMNS = "Could not find latitude/longitude columns in CSV.";
inline constexpr const char* D2500_CSV_SHORT_ROW = "CSV row has fewer columns than expected.";
inline constexpr const char* D2500_CSV_BAD_VALUE = "Invalid coordinate values in CSV.";
inline constexpr const char* D2500_TXT_BAD_LINE = "Invalid coordinate format in text file.";
inline constexpr const char* D2500_TXT_BAD_VALUE = "Invalid coordinate values in text file.";

// HTTP API replies.
inline constexpr const char* D2500_QUERY_REQUIRED = "Search query is required";
inline constexpr const char* D2500_NO_FILE = "No file uploaded";
inline constexpr const char* D2500_NOT_FOUND = "not found";
inline constexpr const char* D2500_INTERNAL = "internal server error";

// "E2401" style tag for log lines.
inline std::string code_tag(int code) {
    return "E" + std::to_string(code);
}

// Full ProtocolError text; an empty detail falls back to the generic one.
inline std::string control_rejected(std::string_view detail) {
    return std::string(MSG_E2400_CONTROL_REJECTED_PREFIX) + std::string(detail.empty() ? D2400_INVALID_REQUEST : detail);
}

} // namespace routesim::errors

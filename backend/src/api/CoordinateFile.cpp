/*
src/api/CoordinateFile.cpp
Parsers for waypoint lists uploaded through the HTTP API. Each parser
rejects the whole file on the first bad entry; no partial results.
*/
#include "api/CoordinateFile.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace routesim::api {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), is_space);
    auto end = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    if (begin >= end) return {};
    return std::string(begin, end);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::size_t start = 0;
    for (;;) {
        auto pos = s.find(sep, start);
        if (pos == std::string::npos) {
            out.push_back(s.substr(start));
            return out;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

// Split on runs of whitespace. Leading/trailing whitespace yields an empty first/last field.
std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    bool in_space = false;
    for (char c : s) {
        if (is_space(c)) {
            if (!in_space) {
                out.push_back(cur);
                cur.clear();
                in_space = true;
            }
        } else {
            cur.push_back(c);
            in_space = false;
        }
    }
    out.push_back(cur);
    return out;
}

// Leading numeric prefix after optional whitespace; nullopt if there is none.
std::optional<double> parse_number_prefix(const std::string& s) {
    const char* begin = s.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    if (end == begin || std::isnan(v)) return std::nullopt;
    return v;
}

[[noreturn]] void fail(const char* prefix, const std::string& detail) {
    throw CoordinateParseError(std::string(prefix) + detail);
}

// Only a string "type" can name a collection; any other value is not GeoJSON.
bool is_feature_collection(const json& data) {
    if (!data.is_object()) return false;
    auto type = data.find("type");
    return type != data.end() && type->is_string() && type->get<std::string>() == "FeatureCollection";
}

Coordinate geojson_point(const json& feature) {
    if (!feature.is_object()) throw CoordinateParseError(errors::D2500_JSON_BAD_GEOJSON);
    auto geometry = feature.find("geometry");
    if (geometry == feature.end() || !geometry->is_object()) {
        throw CoordinateParseError(errors::D2500_JSON_BAD_GEOJSON);
    }
    auto coords = geometry->find("coordinates");
    if (coords == geometry->end() || !coords->is_array() || coords->size() < 2 ||
        !(*coords)[0].is_number() || !(*coords)[1].is_number()) {
        throw CoordinateParseError(errors::D2500_JSON_BAD_GEOJSON);
    }
    // GeoJSON positions are [lng, lat].
    return Coordinate{ (*coords)[1].get<double>(), (*coords)[0].get<double>() };
}

} // namespace

Waypoints parse_coordinate_file(const std::string& content, const std::string& filename) {
    const std::string ext = to_lower(std::filesystem::path(filename).extension().string());
    if (ext == ".json" || ext == ".geojson") return parse_json_coordinates(content);
    if (ext == ".csv") return parse_csv_coordinates(content);
    if (ext == ".txt") return parse_txt_coordinates(content);
    throw CoordinateParseError(errors::D2500_UNSUPPORTED_FORMAT);
}

Waypoints parse_json_coordinates(const std::string& content) {
    json data;
    try {
        data = json::parse(content);
    } catch (const json::parse_error& e) {
        fail(errors::D2500_JSON_PREFIX, e.what());
    }

    Waypoints out;
    try {
        if (data.is_array()) {
            out.reserve(data.size());
            for (const auto& point : data) {
                if (!point.is_object() || !point.contains("lat") || !point.contains("lng") ||
                    !point["lat"].is_number() || !point["lng"].is_number()) {
                    throw CoordinateParseError(errors::D2500_JSON_BAD_POINT);
                }
                out.push_back(Coordinate{ point["lat"].get<double>(), point["lng"].get<double>() });
            }
        } else if (is_feature_collection(data)) {
            auto features = data.find("features");
            if (features == data.end() || !features->is_array()) {
                throw CoordinateParseError(errors::D2500_JSON_BAD_GEOJSON);
            }
            out.reserve(features->size());
            for (const auto& feature : *features) out.push_back(geojson_point(feature));
        } else {
            throw CoordinateParseError(errors::D2500_JSON_BAD_SHAPE);
        }
    } catch (const CoordinateParseError& e) {
        fail(errors::D2500_JSON_PREFIX, e.what());
    } catch (const json::exception&) {
        fail(errors::D2500_JSON_PREFIX, errors::D2500_JSON_BAD_SHAPE);
    }
    return out;
}

Waypoints parse_csv_coordinates(const std::string& content) {
    const auto lines = split(trim(content), '\n');
    if (lines.size() < 2) fail(errors::D2500_CSV_PREFIX, errors::D2500_CSV_TOO_SHORT);

    const auto headers = split(to_lower(lines[0]), ',');
    std::optional<std::size_t> lat_index;
    std::optional<std::size_t> lng_index;
    for (std::size_t i = 0; i < headers.size(); ++i) {
        const auto& h = headers[i];
        if (!lat_index && h.find("lat") != std::string::npos) lat_index = i;
        if (!lng_index && (h.find("lon") != std::string::npos || h.find("lng") != std::string::npos)) lng_index = i;
    }
    if (!lat_index || !lng_index) fail(errors::D2500_CSV_PREFIX, errors::D2500_CSV_NO_COLUMNS);

    Waypoints out;
    out.reserve(lines.size() - 1);
    for (std::size_t i = 1; i < lines.size(); ++i) {
        const auto values = split(lines[i], ',');
        if (values.size() <= std::max(*lat_index, *lng_index)) {
            fail(errors::D2500_CSV_PREFIX, errors::D2500_CSV_SHORT_ROW);
        }
        auto lat = parse_number_prefix(values[*lat_index]);
        auto lng = parse_number_prefix(values[*lng_index]);
        if (!lat || !lng) fail(errors::D2500_CSV_PREFIX, errors::D2500_CSV_BAD_VALUE);
        out.push_back(Coordinate{ *lat, *lng });
    }
    return out;
}

Waypoints parse_txt_coordinates(const std::string& content) {
    // An empty file yields one empty line and is reported as a bad line.
    const auto lines = split(trim(content), '\n');

    Waypoints out;
    out.reserve(lines.size());
    for (const auto& line : lines) {
        const auto parts = line.find(',') != std::string::npos ? split(line, ',') : split_whitespace(line);
        if (parts.size() < 2) fail(errors::D2500_TXT_PREFIX, errors::D2500_TXT_BAD_LINE);
        auto lat = parse_number_prefix(parts[0]);
        auto lng = parse_number_prefix(parts[1]);
        if (!lat || !lng) fail(errors::D2500_TXT_PREFIX, errors::D2500_TXT_BAD_VALUE);
        out.push_back(Coordinate{ *lat, *lng });
    }
    return out;
}

} // namespace routesim::api

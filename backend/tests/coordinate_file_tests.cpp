#include <gtest/gtest.h>
#include "api/CoordinateFile.hpp"
#include "core/Errors.hpp"
#include <string>

using routesim::Coordinate;
using routesim::CoordinateParseError;
using routesim::api::parse_coordinate_file;

namespace {

std::string parse_error(const std::string& content, const std::string& filename) {
    try {
        parse_coordinate_file(content, filename);
    } catch (const CoordinateParseError& e) {
        return e.what();
    }
    return "<no error>";
}

} // namespace

TEST(CoordinateFile, JsonArrayOfPoints) {
    auto wp = parse_coordinate_file(R"([{"lat":40.7,"lng":-74.0,"name":"a"},{"lat":41,"lng":-73.5}])", "route.JSON");
    ASSERT_EQ(wp.size(), 2u);
    EXPECT_EQ(wp[0], (Coordinate{40.7, -74.0}));
    EXPECT_EQ(wp[1], (Coordinate{41, -73.5}));
}

TEST(CoordinateFile, GeoJsonFeatureCollectionSwapsAxisOrder) {
    const char* doc = R"({
        "type": "FeatureCollection",
        "features": [
            {"type":"Feature","geometry":{"type":"Point","coordinates":[2.35, 48.85]}},
            {"type":"Feature","geometry":{"type":"Point","coordinates":[13.4, 52.5, 34.0]}}
        ]
    })";
    auto wp = parse_coordinate_file(doc, "cities.geojson");
    ASSERT_EQ(wp.size(), 2u);
    EXPECT_EQ(wp[0], (Coordinate{48.85, 2.35}));
    EXPECT_EQ(wp[1], (Coordinate{52.5, 13.4}));
    EXPECT_EQ(parse_coordinate_file(doc, "cities.json").size(), 2u);
}

TEST(CoordinateFile, JsonErrors) {
    EXPECT_EQ(parse_error(R"([{"lat":"1","lng":2}])", "a.json"),
              "JSON parsing error: Invalid coordinate format. Expected {lat, lng} objects.");
    EXPECT_EQ(parse_error(R"({"type":"FeatureCollection","features":[{"type":"Feature"}]})", "a.json"),
              "JSON parsing error: Invalid GeoJSON format. Expected coordinates array in geometry.");
    EXPECT_EQ(parse_error(R"({"points":[]})", "a.json"),
              "JSON parsing error: Invalid JSON format. Expected array of coordinates or GeoJSON.");
    EXPECT_EQ(parse_error(R"({"type":5})", "a.json"),
              "JSON parsing error: Invalid JSON format. Expected array of coordinates or GeoJSON.");
    EXPECT_EQ(parse_error(R"({"type":["FeatureCollection"],"features":[]})", "a.geojson"),
              "JSON parsing error: Invalid JSON format. Expected array of coordinates or GeoJSON.");
    EXPECT_EQ(parse_error("[1,", "a.json").rfind("JSON parsing error: ", 0), 0u);
}

TEST(CoordinateFile, CsvFindsColumnsByHeaderName) {
    const char* csv = "id,Latitude,Longitude\r\n1,40.5,-74.25\r\n2,41,-73\r\n";
    auto wp = parse_coordinate_file(csv, "points.csv");
    ASSERT_EQ(wp.size(), 2u);
    EXPECT_EQ(wp[0], (Coordinate{40.5, -74.25}));
    EXPECT_EQ(wp[1], (Coordinate{41, -73}));

    auto swapped = parse_coordinate_file("lng,lat\n2,1\n", "x.csv");
    ASSERT_EQ(swapped.size(), 1u);
    EXPECT_EQ(swapped[0], (Coordinate{1, 2}));
}

TEST(CoordinateFile, CsvErrors) {
    EXPECT_EQ(parse_error("lat,lng", "a.csv"),
              "CSV parsing error: CSV file must contain at least a header and one data row.");
    EXPECT_EQ(parse_error("x,y\n1,2", "a.csv"),
              "CSV parsing error: Could not find latitude/longitude columns in CSV.");
    EXPECT_EQ(parse_error("lat,lng\n1", "a.csv"),
              "CSV parsing error: CSV row has fewer columns than expected.");
    EXPECT_EQ(parse_error("lat,lng\nabc,2", "a.csv"),
              "CSV parsing error: Invalid coordinate values in CSV.");
}

TEST(CoordinateFile, TxtAcceptsCommaOrWhitespaceSeparators) {
    auto wp = parse_coordinate_file("\n  51.5,-0.12\n48.85 2.35\n52.5\t13.4  \n", "route.txt");
    ASSERT_EQ(wp.size(), 3u);
    EXPECT_EQ(wp[0], (Coordinate{51.5, -0.12}));
    EXPECT_EQ(wp[1], (Coordinate{48.85, 2.35}));
    EXPECT_EQ(wp[2], (Coordinate{52.5, 13.4}));
}

TEST(CoordinateFile, NumbersUseLeadingNumericPrefix) {
    auto wp = parse_coordinate_file("10.5deg, 20abc", "p.txt");
    ASSERT_EQ(wp.size(), 1u);
    EXPECT_EQ(wp[0], (Coordinate{10.5, 20}));
}

TEST(CoordinateFile, TxtErrors) {
    EXPECT_EQ(parse_error("", "a.txt"), "Text file parsing error: Invalid coordinate format in text file.");
    EXPECT_EQ(parse_error("42", "a.txt"), "Text file parsing error: Invalid coordinate format in text file.");
    EXPECT_EQ(parse_error("1,north", "a.txt"), "Text file parsing error: Invalid coordinate values in text file.");
}

TEST(CoordinateFile, UnsupportedExtension) {
    EXPECT_EQ(parse_error("1,2", "route.kml"), "Unsupported file format. Please upload JSON, CSV, or TXT files.");
    EXPECT_EQ(parse_error("1,2", "noextension"), "Unsupported file format. Please upload JSON, CSV, or TXT files.");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

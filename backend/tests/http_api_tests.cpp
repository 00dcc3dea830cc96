#include <gtest/gtest.h>
#include "api/Geocoder.hpp"
#include "api/HttpApi.hpp"
#include "SessionRegistry.hpp"
#include "core/BuildInfo.hpp"
#include "simulator/TickScheduler.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using nlohmann::json;
namespace api = routesim::api;
namespace http = boost::beast::http;

namespace {

class NullTickScheduler : public routesim::ITickScheduler {
public:
    struct Timer : routesim::ITickTimer {
        void cancel() override {}
    };
    std::shared_ptr<routesim::ITickTimer> schedule_every(std::chrono::milliseconds, std::function<void()>) override {
        return std::make_shared<Timer>();
    }
};

class HttpApiTest : public ::testing::Test {
protected:
    HttpApiTest() : registry(scheduler, false), http_api(geocoder, registry) {}

    http::response<http::string_body> request(http::verb method, const std::string& target, const std::string& body = {}) {
        http::request<http::string_body> req{method, target, 11};
        req.body() = body;
        req.prepare_payload();
        return http_api.handle(req);
    }

    NullTickScheduler scheduler;
    api::MockGeocoder geocoder;
    routesim::SessionRegistry registry;
    api::HttpApi http_api;
};

} // namespace

TEST(MockGeocoder, MatchesKnownCitiesCaseInsensitively) {
    api::MockGeocoder g;
    auto ny = g.search("Hotels in NEW YORK");
    ASSERT_EQ(ny.size(), 2u);
    EXPECT_EQ(ny[0].name, "New York, NY, USA");
    EXPECT_DOUBLE_EQ(ny[0].lat, 40.7128);
    EXPECT_DOUBLE_EQ(ny[0].lng, -74.0060);

    auto london = g.search("london");
    ASSERT_EQ(london.size(), 2u);
    EXPECT_EQ(london[1].name, "London, ON, Canada");

    auto other = g.search("springfield");
    ASSERT_EQ(other.size(), 3u);
    EXPECT_EQ(other[2].name, "Tokyo, Japan");
}

TEST(HttpApi, ParseTargetDecodesQuery) {
    auto t = api::parse_target("/api/geocode?query=new+york%2C%20ny&empty&x=1");
    EXPECT_EQ(t.path, "/api/geocode");
    EXPECT_EQ(t.query.at("query"), "new york, ny");
    EXPECT_EQ(t.query.at("empty"), "");
    EXPECT_EQ(t.query.at("x"), "1");
    EXPECT_TRUE(api::parse_target("/health").query.empty());
}

TEST_F(HttpApiTest, HealthReportsBuildAndSessions) {
    auto res = request(http::verb::get, "/health");
    EXPECT_EQ(res.result(), http::status::ok);
    auto body = json::parse(res.body());
    EXPECT_TRUE(body["ok"].get<bool>());
    EXPECT_EQ(body["active_sessions"].get<int>(), 0);
    EXPECT_TRUE(body["git_commit"].is_string());
    EXPECT_EQ(body["version"], routesim::current_build().version);
    EXPECT_EQ(res[http::field::access_control_allow_origin], "*");
}

TEST_F(HttpApiTest, GeocodeReturnsResults) {
    auto res = request(http::verb::get, "/api/geocode?query=London");
    EXPECT_EQ(res.result(), http::status::ok);
    auto body = json::parse(res.body());
    ASSERT_EQ(body["results"].size(), 2u);
    EXPECT_EQ(body["results"][0]["name"], "London, UK");
    EXPECT_EQ(body["results"][0]["lat"].get<double>(), 51.5074);
}

TEST_F(HttpApiTest, GeocodeRequiresQuery) {
    for (const char* target : {"/api/geocode", "/api/geocode?query="}) {
        auto res = request(http::verb::get, target);
        EXPECT_EQ(res.result(), http::status::bad_request);
        EXPECT_EQ(json::parse(res.body())["error"], "Search query is required");
    }
}

TEST_F(HttpApiTest, UploadParsesByFilename) {
    auto res = request(http::verb::post, "/api/upload-coordinates?filename=route.csv", "lat,lng\n1,2\n3,4\n");
    EXPECT_EQ(res.result(), http::status::ok);
    auto body = json::parse(res.body());
    EXPECT_TRUE(body["success"].get<bool>());
    EXPECT_EQ(body["message"], "Successfully parsed 2 waypoints");
    EXPECT_EQ(body["coordinates"], json::parse(R"([{"lat":1.0,"lng":2.0},{"lat":3.0,"lng":4.0}])"));
}

TEST_F(HttpApiTest, UploadFilenameFromHeader) {
    http::request<http::string_body> req{http::verb::post, "/api/upload-coordinates", 11};
    req.set("X-Filename", "points.txt");
    req.body() = "1 2\n3 4";
    req.prepare_payload();
    auto res = http_api.handle(req);
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(json::parse(res.body())["coordinates"].size(), 2u);
}

TEST_F(HttpApiTest, UploadErrors) {
    auto empty = request(http::verb::post, "/api/upload-coordinates?filename=a.csv");
    EXPECT_EQ(empty.result(), http::status::bad_request);
    EXPECT_EQ(json::parse(empty.body())["error"], "No file uploaded");

    auto bad = request(http::verb::post, "/api/upload-coordinates?filename=a.kml", "<kml/>");
    EXPECT_EQ(bad.result(), http::status::bad_request);
    EXPECT_EQ(json::parse(bad.body())["error"], "Unsupported file format. Please upload JSON, CSV, or TXT files.");

    http::response<http::string_body> numeric_type;
    ASSERT_NO_THROW(numeric_type = request(http::verb::post, "/api/upload-coordinates?filename=r.json", R"({"type":5})"));
    EXPECT_EQ(numeric_type.result(), http::status::bad_request);
    EXPECT_EQ(json::parse(numeric_type.body())["error"],
              "JSON parsing error: Invalid JSON format. Expected array of coordinates or GeoJSON.");
}

TEST_F(HttpApiTest, PreflightAndUnknownRoutes) {
    auto pre = request(http::verb::options, "/api/upload-coordinates");
    EXPECT_EQ(pre.result(), http::status::no_content);
    EXPECT_EQ(pre[http::field::access_control_allow_methods], "GET, POST, OPTIONS");

    auto missing = request(http::verb::get, "/nope");
    EXPECT_EQ(missing.result(), http::status::not_found);
    EXPECT_EQ(json::parse(missing.body())["error"], "not found");

    auto wrong_method = request(http::verb::get, "/api/upload-coordinates");
    EXPECT_EQ(wrong_method.result(), http::status::not_found);
}

TEST(HttpApi, HandlerFailureBecomesServerError) {
    struct FailingGeocoder : api::IGeocoder {
        std::vector<api::GeocodeResult> search(const std::string&) const override {
            throw std::runtime_error("lookup backend unavailable");
        }
    };
    NullTickScheduler scheduler;
    FailingGeocoder geocoder;
    routesim::SessionRegistry registry(scheduler, false);
    api::HttpApi http_api(geocoder, registry);

    http::request<http::string_body> req{http::verb::get, "/api/geocode?query=paris", 11};
    http::response<http::string_body> res;
    ASSERT_NO_THROW(res = http_api.handle(req));
    EXPECT_EQ(res.result(), http::status::internal_server_error);
    EXPECT_EQ(json::parse(res.body())["error"], "internal server error");
    EXPECT_EQ(res[http::field::access_control_allow_origin], "*");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

#pragma once
#include <map>
#include <string>
#include <string_view>
#include <boost/beast/http.hpp>

namespace routesim {
class SessionRegistry;
}

namespace routesim::api {

class IGeocoder;

namespace http = boost::beast::http;

// Upload bodies larger than this are refused by the transport.
inline constexpr std::size_t kMaxUploadBytes = 5 * 1024 * 1024;

struct RequestTarget {
    std::string path;
    std::map<std::string, std::string> query;
};

// Split "/path?a=1&b=x%20y" into path and percent-decoded query parameters.
RequestTarget parse_target(std::string_view target);

// Plain HTTP endpoints served beside the WebSocket protocol:
//   GET  /health
//   GET  /api/geocode?query=...
//   POST /api/upload-coordinates?filename=route.csv   (body = file content)
class HttpApi {
public:
    HttpApi(const IGeocoder& geocoder, const SessionRegistry& registry);

    // Never throws: unexpected failures become a 500 reply.
    http::response<http::string_body> handle(const http::request<http::string_body>& req) const;

private:
    http::response<http::string_body> route(const http::request<http::string_body>& req) const;

    const IGeocoder& geocoder_;
    const SessionRegistry& registry_;
};

} // namespace routesim::api

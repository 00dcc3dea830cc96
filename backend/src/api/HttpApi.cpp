#include "api/HttpApi.hpp"
#include "api/CoordinateFile.hpp"
#include "api/Geocoder.hpp"
#include "SessionRegistry.hpp"
#include "core/BuildInfo.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/Errors.hpp"
#include <iostream>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace routesim::api {

namespace {

constexpr const char* kServerName = "routesim-backend";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < s.size() && hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

void set_common_headers(http::response<http::string_body>& res) {
    res.set(http::field::server, kServerName);
    // Browser front-ends are served from a different origin.
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type, X-Filename");
    res.keep_alive(false);
}

http::response<http::string_body> make_json_response(http::status status, const json& body) {
    http::response<http::string_body> res{status, 11};
    set_common_headers(res);
    res.set(http::field::content_type, "application/json");
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

} // namespace

RequestTarget parse_target(std::string_view target) {
    RequestTarget out;
    auto qpos = target.find('?');
    out.path = std::string(target.substr(0, qpos));
    if (qpos == std::string_view::npos) return out;

    std::string_view rest = target.substr(qpos + 1);
    while (!rest.empty()) {
        auto amp = rest.find('&');
        std::string_view pair = rest.substr(0, amp);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            std::string key = url_decode(pair.substr(0, eq));
            std::string value = eq == std::string_view::npos ? std::string{} : url_decode(pair.substr(eq + 1));
            out.query.emplace(std::move(key), std::move(value));
        }
        if (amp == std::string_view::npos) break;
        rest = rest.substr(amp + 1);
    }
    return out;
}

HttpApi::HttpApi(const IGeocoder& geocoder, const SessionRegistry& registry)
: geocoder_(geocoder), registry_(registry) {}

http::response<http::string_body> HttpApi::handle(const http::request<http::string_body>& req) const {
    try {
        return route(req);
    } catch (const std::exception& e) {
        std::cerr << "HttpApi: " << req.method_string() << " " << req.target() << " failed: " << e.what() << std::endl;
        return make_json_response(http::status::internal_server_error, json{{"error", errors::D2500_INTERNAL}});
    }
}

http::response<http::string_body> HttpApi::route(const http::request<http::string_body>& req) const {
    // Preflight CORS.
    if (req.method() == http::verb::options) {
        http::response<http::string_body> res{http::status::no_content, 11};
        set_common_headers(res);
        res.prepare_payload();
        return res;
    }

    const auto target = parse_target(std::string_view(req.target().data(), req.target().size()));

    if (req.method() == http::verb::get && target.path == "/health") {
        const BuildInfo build = current_build();
        return make_json_response(http::status::ok, json{
            {"ok", true},
            {"version", build.version},
            {"git_commit", build.git_commit},
            {"build_time", build.compiled_at},
            {"active_sessions", registry_.active_session_count()}
        });
    }

    if (req.method() == http::verb::get && target.path == "/api/geocode") {
        auto it = target.query.find("query");
        if (it == target.query.end() || it->second.empty()) {
            return make_json_response(http::status::bad_request, json{{"error", errors::D2500_QUERY_REQUIRED}});
        }
        return make_json_response(http::status::ok, json{{"results", geocoder_.search(it->second)}});
    }

    if (req.method() == http::verb::post && target.path == "/api/upload-coordinates") {
        if (req.body().empty()) {
            return make_json_response(http::status::bad_request, json{{"error", errors::D2500_NO_FILE}});
        }
        std::string filename;
        auto it = target.query.find("filename");
        if (it != target.query.end()) {
            filename = it->second;
        } else {
            auto h = req.find("X-Filename");
            if (h != req.end()) filename = std::string(h->value().data(), h->value().size());
        }
        try {
            auto coordinates = parse_coordinate_file(req.body(), filename);
            const auto count = coordinates.size();
            return make_json_response(http::status::ok, json{
                {"success", true},
                {"coordinates", coordinates},
                {"message", "Successfully parsed " + std::to_string(count) + " waypoints"}
            });
        } catch (const CoordinateParseError& e) {
            std::cerr << "HttpApi: upload '" << filename << "' rejected (" << errors::code_tag(errors::E2500_COORDINATE_IMPORT)
                      << "): " << e.what() << std::endl;
            return make_json_response(http::status::bad_request, json{{"error", e.what()}});
        }
    }

    return make_json_response(http::status::not_found, json{{"error", errors::D2500_NOT_FOUND}});
}

} // namespace routesim::api

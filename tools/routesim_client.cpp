#include "api/CoordinateFile.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

struct WsUrl {
    std::string host;
    std::string port;
    std::string target;
};

static bool parse_ws_url(const std::string& url, WsUrl& out) {
    // Minimal parser for ws://host:port/path
    std::string s = url;
    const std::string prefix = "ws://";
    if (s.rfind(prefix, 0) != 0) return false;
    s = s.substr(prefix.size());

    std::string hostport;
    auto slash = s.find('/');
    if (slash == std::string::npos) {
        hostport = s;
        out.target = "/";
    } else {
        hostport = s.substr(0, slash);
        out.target = s.substr(slash);
        if (out.target.empty()) out.target = "/";
    }

    auto colon = hostport.find(':');
    if (colon == std::string::npos) {
        out.host = hostport;
        out.port = "80";
    } else {
        out.host = hostport.substr(0, colon);
        out.port = hostport.substr(colon + 1);
        if (out.port.empty()) out.port = "80";
    }

    return !out.host.empty();
}

static std::string read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("unable to open " + path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

// Replays a waypoint file against a running backend and prints every update until the route completes.
int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " ws://host:port/ WAYPOINT_FILE [speed]\n";
        std::cerr << "Example:\n";
        std::cerr << "  " << argv[0] << " ws://localhost:8085/ route.csv 50\n";
        return 2;
    }

    const std::string ws_url = argv[1];
    const std::string path = argv[2];
    double speed = 1.0;
    if (argc >= 4) {
        try {
            speed = std::stod(argv[3]);
        } catch (const std::exception& e) {
            std::cerr << "Invalid speed: " << e.what() << "\n";
            return 2;
        }
    }

    WsUrl u;
    if (!parse_ws_url(ws_url, u)) {
        std::cerr << "Invalid ws url (expected ws://host:port/path): " << ws_url << "\n";
        return 2;
    }

    routesim::Waypoints waypoints;
    try {
        waypoints = routesim::api::parse_coordinate_file(read_file(path), path);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    try {
        net::io_context ioc;
        tcp::resolver resolver{ioc};
        websocket::stream<tcp::socket> ws{ioc};

        auto const results = resolver.resolve(u.host, u.port);
        net::connect(ws.next_layer(), results);
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws.handshake(u.host + ":" + u.port, u.target);

        json req = {
            {"type", "START_SIMULATION"},
            {"waypoints", waypoints},
            {"speed", speed},
        };
        ws.write(net::buffer(req.dump()));

        int exit_code = 0;
        beast::flat_buffer buffer;
        for (;;) {
            buffer.clear();
            ws.read(buffer);
            std::string data = beast::buffers_to_string(buffer.data());
            json msg = json::parse(data, nullptr, /*allow_exceptions=*/false);
            if (msg.is_discarded()) continue;

            std::cout << msg.dump() << std::endl;
            const auto type = msg.value("type", std::string{});
            if (type == "ERROR") {
                exit_code = 1;
                break;
            }
            if (type == "POSITION_UPDATE" && msg.value("isComplete", false)) break;
        }

        beast::error_code ec;
        ws.close(websocket::close_code::normal, ec);
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

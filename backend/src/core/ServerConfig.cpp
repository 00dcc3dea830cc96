#include "core/ServerConfig.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <thread>

namespace routesim {

namespace {

bool is_number(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::optional<unsigned long> parse_unsigned(const std::string& value, const char* what, unsigned long max) {
    if (!is_number(value)) {
        std::cerr << "config: ignoring invalid " << what << " '" << value << "'" << std::endl;
        return std::nullopt;
    }
    try {
        unsigned long v = std::stoul(value);
        if (v > max) throw std::out_of_range(what);
        return v;
    } catch (const std::exception&) {
        std::cerr << "config: " << what << " out of range '" << value << "'" << std::endl;
        return std::nullopt;
    }
}

void set_port(ServerConfig& cfg, const std::string& value) {
    if (auto v = parse_unsigned(value, "port", std::numeric_limits<unsigned short>::max())) {
        cfg.port = static_cast<unsigned short>(*v);
    }
}

} // namespace

ServerConfig load_server_config(int argc, const char* const* argv) {
    ServerConfig cfg;

    if (const char* env = std::getenv("ROUTESIM_PORT"); env && *env) set_port(cfg, env);
    if (const char* env = std::getenv("ROUTESIM_BIND"); env && *env) cfg.bind_address = env;

    // Accept either a numeric first argument (legacy) or explicit flags
    if (argc > 1 && is_number(argv[1])) set_port(cfg, argv[1]);

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "-h" || a == "--help") {
            cfg.show_help = true;
        } else if (a == "-q" || a == "--quiet") {
            cfg.quiet = true;
        } else if ((a == "-p" || a == "--port") && i + 1 < argc) {
            set_port(cfg, argv[++i]);
        } else if (a.rfind("--port=", 0) == 0) {
            set_port(cfg, a.substr(7));
        } else if (a == "--bind" && i + 1 < argc) {
            cfg.bind_address = argv[++i];
        } else if ((a == "-t" || a == "--threads") && i + 1 < argc) {
            if (auto v = parse_unsigned(argv[++i], "threads", 256)) cfg.threads = static_cast<unsigned int>(*v);
        }
    }
    return cfg;
}

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -h, --help          Show this help message and exit\n"
              << "  -p, --port PORT     Set listening TCP port (default 8085, env ROUTESIM_PORT)\n"
              << "      --bind ADDR     Listen address (default 0.0.0.0, env ROUTESIM_BIND)\n"
              << "  -t, --threads N     I/O threads (default: hardware concurrency)\n"
              << "  -q, --quiet         Do not log connection and simulation lifecycle\n"
              << std::flush;
}

unsigned int resolve_thread_count(const ServerConfig& config) {
    if (config.threads > 0) return config.threads;
    return std::max(1u, std::thread::hardware_concurrency());
}

} // namespace routesim

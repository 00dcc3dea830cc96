#pragma once
#include <string>

namespace routesim {

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    unsigned short port = 8085;   // 0 picks an ephemeral port
    unsigned int threads = 0;     // 0 = hardware concurrency
    bool quiet = false;
    bool show_help = false;
};

// Environment (ROUTESIM_PORT, ROUTESIM_BIND) first, then command-line flags.
// Unparseable values are reported on stderr and leave the default in place.
ServerConfig load_server_config(int argc, const char* const* argv);

void print_usage(const char* prog);

// Number of I/O threads to run for `config` (at least one).
unsigned int resolve_thread_count(const ServerConfig& config);

} // namespace routesim

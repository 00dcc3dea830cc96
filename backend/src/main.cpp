#include "WebSocketServer.hpp"
#include "core/BuildInfo.hpp"
#include "core/ServerConfig.hpp"
#include <csignal>
#include <iostream>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

int main(int argc, char** argv) {
    routesim::ServerConfig config = routesim::load_server_config(argc, argv);
    if (config.show_help) {
        routesim::print_usage(argv[0]);
        return 0;
    }

    routesim::WebSocketServer server(config);
    try {
        server.start();
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }

    const routesim::BuildInfo build = routesim::current_build();
    std::cout << "Route simulation backend " << build.version << " running on " << config.bind_address << ":" << server.port()
              << " (threads=" << routesim::resolve_thread_count(config)
              << ", commit=" << build.git_commit << ")" << std::endl;

    // CTRL-C / SIGTERM stop the server; block until then.
    boost::asio::io_context signals_ioc;
    boost::asio::signal_set signals(signals_ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (!ec) std::cerr << "Received signal " << signo << ", shutting down" << std::endl;
    });
    signals_ioc.run();

    server.stop();
    return 0;
}

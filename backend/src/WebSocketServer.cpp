#include "WebSocketServer.hpp"
#include "SessionRegistry.hpp"
#include "api/Geocoder.hpp"
#include "api/HttpApi.hpp"
#include "net/Connection.hpp"
#include "simulator/TickScheduler.hpp"
#include <iostream>
#include <stdexcept>
// Boost.Beast / Asio for WebSocket
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>

namespace asio = boost::asio;           // from <boost/asio.hpp>
using tcp = asio::ip::tcp;              // from <boost/asio/ip/tcp.hpp>

namespace routesim {

// Member order matters: the registry is destroyed before the scheduler and
// the io_context it arms clocks on.
struct WebSocketServer::Impl {
    asio::io_context ioc;
    asio::executor_work_guard<asio::io_context::executor_type> work;
    tcp::acceptor acceptor;
    AsioTickScheduler scheduler;
    api::MockGeocoder geocoder;
    SessionRegistry registry;
    api::HttpApi http_api;
    bool log_lifecycle;

    explicit Impl(bool log)
    : ioc(), work(asio::make_work_guard(ioc)), acceptor(ioc), scheduler(ioc),
      registry(scheduler, log), http_api(geocoder, registry), log_lifecycle(log) {}

    void listen(const std::string& address, unsigned short port) {
        boost::system::error_code ec;
        auto addr = asio::ip::make_address(address, ec);
        if (ec) throw std::runtime_error("invalid bind address '" + address + "': " + ec.message());
        tcp::endpoint endpoint(addr, port);

        acceptor.open(endpoint.protocol(), ec);
        if (ec) throw std::runtime_error("acceptor.open failed: " + ec.message());
        acceptor.set_option(asio::socket_base::reuse_address(true), ec);
        if (ec) {
            std::cerr << "WebSocketServer: set_option failed: " << ec.message() << std::endl;
        }
        acceptor.bind(endpoint, ec);
        if (ec) throw std::runtime_error("bind failed: " + ec.message());
        acceptor.listen(asio::socket_base::max_listen_connections, ec);
        if (ec) throw std::runtime_error("listen failed: " + ec.message());
    }
};

WebSocketServer::WebSocketServer(ServerConfig cfg)
: config(std::move(cfg)), running(false), impl(std::make_unique<Impl>(!config.quiet)) {}

WebSocketServer::~WebSocketServer() {
    stop();
}

void WebSocketServer::start() {
    if (running) return;
    impl->listen(config.bind_address, config.port);
    running = true;

    do_accept();

    const unsigned int n = resolve_thread_count(config);
    io_threads.reserve(n);
    for (unsigned int i = 0; i < n; ++i) {
        io_threads.emplace_back([this]() {
            // Re-enter run() after a handler exception; only stop() ends the thread.
            for (;;) {
                try {
                    impl->ioc.run();
                    break;
                } catch (const std::exception& e) {
                    std::cerr << "WebSocketServer: I/O thread error: " << e.what() << std::endl;
                }
            }
        });
    }
}

void WebSocketServer::stop() {
    if (!running.exchange(false)) return;
    boost::system::error_code ec;
    impl->acceptor.close(ec);
    impl->work.reset();
    impl->ioc.stop();
    for (auto& t : io_threads) {
        if (t.joinable()) t.join();
    }
    io_threads.clear();
}

unsigned short WebSocketServer::port() const {
    boost::system::error_code ec;
    auto ep = impl->acceptor.local_endpoint(ec);
    if (ec) return config.port;
    return ep.port();
}

asio::io_context::executor_type WebSocketServer::executor() {
    return impl->ioc.get_executor();
}

SessionRegistry& WebSocketServer::registry() {
    return impl->registry;
}

void WebSocketServer::do_accept() {
    // Each connection gets its own strand; handlers for one client never run concurrently.
    impl->acceptor.async_accept(asio::make_strand(impl->ioc), [this](boost::system::error_code ec, tcp::socket socket) {
        if (ec) {
            if (running) std::cerr << "WebSocketServer: accept error: " << ec.message() << std::endl;
        } else {
            std::make_shared<net::HttpSession>(std::move(socket), impl->registry, impl->http_api, impl->log_lifecycle)->run();
        }
        if (running) do_accept();
    });
}

} // namespace routesim

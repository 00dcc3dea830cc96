#pragma once
#include <atomic>
#include <memory>
#include <thread>
#include <vector>
#include <boost/asio/io_context.hpp>
#include "core/ServerConfig.hpp"

namespace routesim {

class SessionRegistry;

// Listens on one TCP port for WebSocket clients of the simulation protocol and
// for the plain HTTP API. I/O, ticks and control messages run on a pool of
// io_context threads.
class WebSocketServer {
public:
    explicit WebSocketServer(ServerConfig config);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    // Bind and start serving. Throws std::runtime_error if the port cannot be bound.
    void start();
    void stop();

    // Port actually bound (useful when configured with port 0).
    unsigned short port() const;
    SessionRegistry& registry();
    // Executor of the I/O pool shared by connections and simulation clocks.
    boost::asio::io_context::executor_type executor();

private:
    struct Impl;

    void do_accept();

    ServerConfig config;
    std::atomic<bool> running;
    std::unique_ptr<Impl> impl;
    std::vector<std::thread> io_threads;
};

} // namespace routesim

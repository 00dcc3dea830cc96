#pragma once
#include <atomic>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include "SessionRegistry.hpp"
#include "net/client_channel.h"

namespace routesim::api {
class HttpApi;
}

namespace routesim::net {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = boost::asio::ip::tcp;

// First stage of every accepted socket: reads one HTTP request. WebSocket
// upgrades are handed to a WebSocketSession; anything else goes to the HttpApi.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, SessionRegistry& registry, const api::HttpApi& api, bool log_lifecycle);

    void run();

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void on_write(beast::error_code ec, std::size_t bytes_transferred);

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<http::response<http::string_body>> res_;
    SessionRegistry& registry_;
    const api::HttpApi& api_;
    bool log_lifecycle_;
};

// One client on the real-time protocol. Inbound frames go to the registry;
// outbound frames are queued and written one at a time on the connection's strand.
class WebSocketSession : public IClientChannel, public std::enable_shared_from_this<WebSocketSession> {
public:
    WebSocketSession(tcp::socket&& socket, SessionRegistry& registry, bool log_lifecycle);

    void run(http::request<http::string_body> req);

    bool send(const std::string& payload) override;

private:
    void on_accept(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void on_send(std::shared_ptr<const std::string> payload);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes_transferred);
    // Transport failure or peer close: release the registry slot and the socket.
    void fail(const char* what, beast::error_code ec);

    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    std::deque<std::shared_ptr<const std::string>> queue_;
    SessionRegistry& registry_;
    std::atomic<bool> open_{false};
    ConnectionId id_ = 0;
    bool log_lifecycle_;
};

} // namespace routesim::net

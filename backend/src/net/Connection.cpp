#include "net/Connection.hpp"
#include "api/HttpApi.hpp"
#include "core/ErrorCatalog.hpp"
#include <chrono>
#include <iostream>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

namespace asio = boost::asio;

namespace routesim::net {

namespace {

constexpr auto kHttpReadTimeout = std::chrono::seconds(30);

bool is_routine_close(const beast::error_code& ec) {
    return ec == websocket::error::closed || ec == asio::error::operation_aborted ||
           ec == asio::error::eof || ec == asio::error::connection_reset;
}

} // namespace

// ---------------------------------------------------------------------------
// HttpSession

HttpSession::HttpSession(tcp::socket&& socket, SessionRegistry& registry, const api::HttpApi& api, bool log_lifecycle)
: stream_(std::move(socket)), registry_(registry), api_(api), log_lifecycle_(log_lifecycle) {}

void HttpSession::run() {
    // Start on the connection's strand.
    asio::dispatch(stream_.get_executor(), beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
}

void HttpSession::do_read() {
    parser_.emplace();
    parser_->body_limit(api::kMaxUploadBytes);
    stream_.expires_after(kHttpReadTimeout);
    http::async_read(stream_, buffer_, *parser_, beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        return;
    }
    if (ec) {
        if (!is_routine_close(ec)) std::cerr << "HttpSession: read failed: " << ec.message() << std::endl;
        return;
    }

    if (websocket::is_upgrade(parser_->get())) {
        // Hand the socket over; the WebSocket layer manages its own timeouts.
        stream_.expires_never();
        std::make_shared<WebSocketSession>(stream_.release_socket(), registry_, log_lifecycle_)->run(parser_->release());
        return;
    }

    res_ = std::make_shared<http::response<http::string_body>>(api_.handle(parser_->get()));
    http::async_write(stream_, *res_, beast::bind_front_handler(&HttpSession::on_write, shared_from_this()));
}

void HttpSession::on_write(beast::error_code ec, std::size_t) {
    if (ec) {
        std::cerr << "HttpSession: write failed: " << ec.message() << std::endl;
    }
    // Responses are sent with keep_alive(false).
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

// ---------------------------------------------------------------------------
// WebSocketSession

WebSocketSession::WebSocketSession(tcp::socket&& socket, SessionRegistry& registry, bool log_lifecycle)
: ws_(std::move(socket)), registry_(registry), log_lifecycle_(log_lifecycle) {}

void WebSocketSession::run(http::request<http::string_body> req) {
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, "routesim-backend");
    }));
    ws_.read_message_max(api::kMaxUploadBytes);
    ws_.async_accept(req, beast::bind_front_handler(&WebSocketSession::on_accept, shared_from_this()));
}

void WebSocketSession::on_accept(beast::error_code ec) {
    if (ec) {
        std::cerr << "WebSocketServer: websocket accept failed: " << ec.message() << std::endl;
        return;
    }
    open_.store(true);
    id_ = registry_.open_connection(shared_from_this());
    if (log_lifecycle_) {
        std::cerr << "WebSocketServer: client " << id_ << " connected (count=" << registry_.connection_count() << ")" << std::endl;
    }
    do_read();
}

void WebSocketSession::do_read() {
    ws_.async_read(buffer_, beast::bind_front_handler(&WebSocketSession::on_read, shared_from_this()));
}

void WebSocketSession::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        fail("read", ec);
        return;
    }
    auto data = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    registry_.handle_message(id_, data);
    do_read();
}

bool WebSocketSession::send(const std::string& payload) {
    if (!open_.load()) return false;
    auto msg = std::make_shared<const std::string>(payload);
    asio::post(ws_.get_executor(), beast::bind_front_handler(&WebSocketSession::on_send, shared_from_this(), std::move(msg)));
    return true;
}

void WebSocketSession::on_send(std::shared_ptr<const std::string> payload) {
    if (!open_.load()) return;
    queue_.push_back(std::move(payload));
    // A write is already in flight; it drains the queue.
    if (queue_.size() > 1) return;
    do_write();
}

void WebSocketSession::do_write() {
    ws_.text(true);
    ws_.async_write(asio::buffer(*queue_.front()),
                    beast::bind_front_handler(&WebSocketSession::on_write, shared_from_this()));
}

void WebSocketSession::on_write(beast::error_code ec, std::size_t) {
    if (ec) {
        fail("write", ec);
        return;
    }
    queue_.pop_front();
    if (!queue_.empty()) do_write();
}

void WebSocketSession::fail(const char* what, beast::error_code ec) {
    if (!open_.exchange(false)) return;
    if (!is_routine_close(ec)) {
        std::cerr << "WebSocketServer: client " << id_ << " " << what << " failed: " << ec.message()
                  << " (" << errors::MSG_E2410_SESSION_DROPPED << ")" << std::endl;
    }
    registry_.close_connection(id_);
    if (log_lifecycle_) {
        std::cerr << "WebSocketServer: client " << id_ << " disconnected (count=" << registry_.connection_count() << ")" << std::endl;
    }
    beast::error_code ignored;
    beast::get_lowest_layer(ws_).socket().close(ignored);
}

} // namespace routesim::net

#include "simulator/TickScheduler.hpp"
#include <atomic>
#include <iostream>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

namespace asio = boost::asio;

namespace routesim {

namespace {

class AsioTickTimer : public ITickTimer, public std::enable_shared_from_this<AsioTickTimer> {
public:
    AsioTickTimer(asio::io_context& ioc, std::chrono::milliseconds period, std::function<void()> tick)
    : strand_(asio::make_strand(ioc)), timer_(strand_), period_(period), tick_(std::move(tick)) {}

    void start() {
        auto self = shared_from_this();
        asio::post(strand_, [self]() {
            self->timer_.expires_after(self->period_);
            self->arm();
        });
    }

    void cancel() override {
        if (cancelled_.exchange(true)) return;
        auto self = shared_from_this();
        asio::post(strand_, [self]() { self->timer_.cancel(); });
    }

private:
    void arm() {
        auto self = shared_from_this();
        timer_.async_wait([self](const boost::system::error_code& ec) {
            if (ec || self->cancelled_.load()) return;
            try {
                self->tick_();
            } catch (const std::exception& e) {
                std::cerr << "TickScheduler: tick error: " << e.what() << std::endl;
            }
            if (self->cancelled_.load()) return;
            // Fixed-rate schedule: next expiry is relative to the previous one.
            self->timer_.expires_at(self->timer_.expiry() + self->period_);
            self->arm();
        });
    }

    asio::strand<asio::io_context::executor_type> strand_;
    asio::steady_timer timer_;
    std::chrono::milliseconds period_;
    std::function<void()> tick_;
    std::atomic<bool> cancelled_{false};
};

} // namespace

AsioTickScheduler::AsioTickScheduler(asio::io_context& ioc) : ioc_(ioc) {}

std::shared_ptr<ITickTimer> AsioTickScheduler::schedule_every(std::chrono::milliseconds period,
                                                              std::function<void()> tick) {
    auto timer = std::make_shared<AsioTickTimer>(ioc_, period, std::move(tick));
    timer->start();
    return timer;
}

} // namespace routesim

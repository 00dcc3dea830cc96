#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <boost/asio/io_context.hpp>

namespace routesim {

// Handle for one armed periodic clock.
class ITickTimer {
public:
    virtual ~ITickTimer() = default;
    // Disarm the clock. Safe from any thread, including from inside the tick callback.
    // A tick that already passed its own cancellation check may still run once.
    virtual void cancel() = 0;
};

class ITickScheduler {
public:
    virtual ~ITickScheduler() = default;
    // Arm a clock that calls `tick` every `period` until cancelled.
    // Consecutive ticks of one clock never overlap.
    virtual std::shared_ptr<ITickTimer> schedule_every(std::chrono::milliseconds period,
                                                       std::function<void()> tick) = 0;
};

// Steady-timer clocks on an io_context; each clock runs on its own strand.
class AsioTickScheduler : public ITickScheduler {
public:
    explicit AsioTickScheduler(boost::asio::io_context& ioc);

    std::shared_ptr<ITickTimer> schedule_every(std::chrono::milliseconds period,
                                               std::function<void()> tick) override;

private:
    boost::asio::io_context& ioc_;
};

} // namespace routesim

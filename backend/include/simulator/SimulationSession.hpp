#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include "core/Coordinate.hpp"

namespace routesim {

/** @brief Result of one tick, sent to the client as POSITION_UPDATE. */
struct PositionUpdate {
    Coordinate position;
    double progress = 0.0;
    std::size_t current_waypoint = 0;
    bool is_complete = false;
};

/**
 * @brief State machine for one vehicle traversing a waypoint route.
 *
 * The session has no clock of its own: the owner calls advance() once per
 * tick (every kTickPeriod). Movement is linear interpolation in coordinate
 * space, segment by segment. Any distance beyond the end of a segment is
 * dropped when the segment completes.
 *
 * Not thread-safe. The owner serializes advance() with the control calls.
 */
class SimulationSession {
public:
    static constexpr std::chrono::milliseconds kTickPeriod{100};
    static constexpr double kDefaultSpeed = 1.0;
    // step per tick = (speed * kStepPerSpeedUnit) / kTicksPerSecond
    static constexpr double kStepPerSpeedUnit = 0.0001;
    static constexpr double kTicksPerSecond = 10.0;

    struct Snapshot {
        Coordinate position;
        std::size_t current_index = 0;
        std::size_t next_index = 1;
        double progress = 0.0;
        double speed = kDefaultSpeed;
        double total_distance = 0.0;
        bool paused = false;
        bool complete = false;
    };

    /// Throws ValidationError when fewer than two waypoints are given.
    /// An absent or zero speed starts at kDefaultSpeed.
    explicit SimulationSession(Waypoints waypoints, std::optional<double> speed = std::nullopt);

    /// Move one tick along the route. Returns nullopt while paused or once complete.
    std::optional<PositionUpdate> advance();

    void pause() { paused_ = true; }
    void resume() { paused_ = false; }
    // No bounds check: zero stalls the route, negative values move backwards.
    void set_speed(double speed) { speed_ = speed; }

    /// Jump to the start of `segment` with `progress` already accumulated on it.
    void seek(std::size_t segment, double progress);

    const Waypoints& waypoints() const { return waypoints_; }
    const Coordinate& position() const { return position_; }
    std::size_t current_index() const { return current_index_; }
    std::size_t next_index() const { return next_index_; }
    double progress() const { return progress_; }
    double speed() const { return speed_; }
    double total_distance() const { return total_distance_; }
    bool paused() const { return paused_; }
    bool complete() const { return complete_; }

    Snapshot snapshot() const;

private:
    Waypoints waypoints_;
    std::size_t current_index_ = 0;
    std::size_t next_index_ = 1;
    double progress_ = 0.0;
    double speed_ = kDefaultSpeed;
    double total_distance_ = 0.0;
    bool paused_ = false;
    bool complete_ = false;
    Coordinate position_;
};

} // namespace routesim

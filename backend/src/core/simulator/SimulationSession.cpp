#include "simulator/SimulationSession.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/Errors.hpp"
#include "core/RouteGeometry.hpp"
#include <algorithm>

namespace routesim {

SimulationSession::SimulationSession(Waypoints waypoints, std::optional<double> speed)
: waypoints_(std::move(waypoints)) {
    if (waypoints_.size() < 2) {
        throw ValidationError(errors::MSG_E2401_MIN_WAYPOINTS);
    }
    if (speed && *speed != 0.0) speed_ = *speed;
    position_ = waypoints_.front();
    total_distance_ = geometry::total_distance(waypoints_);
}

std::optional<PositionUpdate> SimulationSession::advance() {
    if (paused_ || complete_) return std::nullopt;

    if (next_index_ >= waypoints_.size()) {
        complete_ = true;
        return PositionUpdate{ position_, progress_, current_index_, true };
    }

    const Coordinate& current = waypoints_[current_index_];
    const Coordinate& next = waypoints_[next_index_];
    const double segment = geometry::segment_distance(current, next);

    const double step = (speed_ * kStepPerSpeedUnit) / kTicksPerSecond;
    progress_ += step;

    // A zero-length segment is traversed immediately.
    const double ratio = segment == 0.0 ? 1.0 : std::min(progress_ / segment, 1.0);
    position_ = geometry::lerp(current, next, ratio);

    if (ratio >= 1.0) {
        ++current_index_;
        ++next_index_;
        progress_ = 0.0;
    }

    return PositionUpdate{ position_, progress_, current_index_, complete_ };
}

void SimulationSession::seek(std::size_t segment, double progress) {
    current_index_ = std::min(segment, waypoints_.size() - 1);
    next_index_ = current_index_ + 1;
    progress_ = progress;
    position_ = waypoints_[current_index_];
    complete_ = false;
}

SimulationSession::Snapshot SimulationSession::snapshot() const {
    Snapshot s;
    s.position = position_;
    s.current_index = current_index_;
    s.next_index = next_index_;
    s.progress = progress_;
    s.speed = speed_;
    s.total_distance = total_distance_;
    s.paused = paused_;
    s.complete = complete_;
    return s;
}

} // namespace routesim

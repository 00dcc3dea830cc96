#include "SessionRegistry.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/Errors.hpp"
#include "net/client_channel.h"
#include "simulator/TickScheduler.hpp"
#include <iostream>
#include <type_traits>
#include <vector>

using json = nlohmann::json;

namespace routesim {

SessionRegistry::SessionRegistry(ITickScheduler& scheduler, bool log_lifecycle)
: scheduler_(scheduler), log_lifecycle_(log_lifecycle) {}

SessionRegistry::~SessionRegistry() {
    std::vector<ConnectionId> ids;
    {
        std::lock_guard<std::mutex> lk(slots_m_);
        for (const auto& [id, _] : slots_) ids.push_back(id);
    }
    for (auto id : ids) close_connection(id);
}

ConnectionId SessionRegistry::open_connection(std::shared_ptr<net::IClientChannel> channel) {
    auto slot = std::make_shared<Slot>();
    slot->id = next_id_.fetch_add(1);
    slot->channel = std::move(channel);
    std::lock_guard<std::mutex> lk(slots_m_);
    slots_[slot->id] = slot;
    return slot->id;
}

void SessionRegistry::close_connection(ConnectionId id) {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lk(slots_m_);
        auto it = slots_.find(id);
        if (it == slots_.end()) return;
        slot = it->second;
        slots_.erase(it);
    }
    std::lock_guard<std::mutex> lk(slot->m);
    teardown_locked(*slot, "connection closed");
    slot->closed = true;
    slot->channel.reset();
}

std::shared_ptr<SessionRegistry::Slot> SessionRegistry::find_slot(ConnectionId id) const {
    std::lock_guard<std::mutex> lk(slots_m_);
    auto it = slots_.find(id);
    if (it == slots_.end()) return nullptr;
    return it->second;
}

void SessionRegistry::handle_message(ConnectionId id, std::string_view text) {
    try {
        dispatch(id, protocol::decode(text));
    } catch (const ProtocolError& e) {
        std::cerr << "SessionRegistry: connection " << id << ": " << e.what() << std::endl;
    }
}

void SessionRegistry::dispatch(ConnectionId id, const protocol::InboundMessage& msg) {
    std::visit([&](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, protocol::StartSimulation>) {
            start_simulation(id, m.waypoints, m.speed);
        } else if constexpr (std::is_same_v<T, protocol::PauseSimulation>) {
            pause_simulation(id);
        } else if constexpr (std::is_same_v<T, protocol::ResumeSimulation>) {
            resume_simulation(id);
        } else if constexpr (std::is_same_v<T, protocol::StopSimulation>) {
            stop_simulation(id);
        } else if constexpr (std::is_same_v<T, protocol::UpdateSpeed>) {
            update_speed(id, m.speed);
        } else {
            static_assert(!sizeof(T), "unhandled inbound message");
        }
    }, msg);
}

void SessionRegistry::start_simulation(ConnectionId id, Waypoints waypoints, std::optional<double> speed) {
    auto slot = find_slot(id);
    if (!slot) return;
    std::lock_guard<std::mutex> lk(slot->m);
    if (slot->closed) return;

    // Validate before touching a running session: a rejected start changes nothing.
    std::unique_ptr<SimulationSession> session;
    try {
        session = std::make_unique<SimulationSession>(std::move(waypoints), speed);
    } catch (const ValidationError& e) {
        std::cerr << "SessionRegistry: connection " << id << ": start rejected ("
                  << errors::code_tag(errors::E2401_START_REJECTED) << "): " << e.what() << std::endl;
        send_locked(*slot, protocol::build_error(e.what()));
        return;
    }

    teardown_locked(*slot, "restarted");

    const Coordinate initial = session->position();
    const std::size_t count = session->waypoints().size();
    const double total = session->total_distance();
    const double effective_speed = session->speed();
    slot->session = std::move(session);
    active_sessions_.fetch_add(1);

    if (!send_locked(*slot, protocol::build_simulation_started(initial))) return;

    const std::uint64_t generation = slot->generation;
    std::weak_ptr<Slot> weak = slot;
    slot->clock = scheduler_.schedule_every(SimulationSession::kTickPeriod, [this, weak, generation]() {
        on_tick(weak, generation);
    });

    if (log_lifecycle_) {
        std::cerr << "SessionRegistry: connection " << id << ": simulation started (waypoints=" << count
                  << ", total_distance=" << total << ", speed=" << effective_speed << ")" << std::endl;
    }
}

void SessionRegistry::pause_simulation(ConnectionId id) {
    auto slot = find_slot(id);
    if (!slot) return;
    std::lock_guard<std::mutex> lk(slot->m);
    if (slot->session) slot->session->pause();
}

void SessionRegistry::resume_simulation(ConnectionId id) {
    auto slot = find_slot(id);
    if (!slot) return;
    std::lock_guard<std::mutex> lk(slot->m);
    if (slot->session) slot->session->resume();
}

void SessionRegistry::stop_simulation(ConnectionId id) {
    auto slot = find_slot(id);
    if (!slot) return;
    std::lock_guard<std::mutex> lk(slot->m);
    teardown_locked(*slot, "stopped");
}

void SessionRegistry::update_speed(ConnectionId id, double speed) {
    auto slot = find_slot(id);
    if (!slot) return;
    std::lock_guard<std::mutex> lk(slot->m);
    if (slot->session) slot->session->set_speed(speed);
}

void SessionRegistry::on_tick(const std::weak_ptr<Slot>& weak, std::uint64_t generation) {
    auto slot = weak.lock();
    if (!slot) return;
    std::lock_guard<std::mutex> lk(slot->m);
    if (slot->closed || !slot->session || slot->generation != generation) return;

    auto update = slot->session->advance();
    if (!update) return;

    if (!send_locked(*slot, protocol::build_position_update(*update))) return;
    if (update->is_complete) teardown_locked(*slot, "completed");
}

void SessionRegistry::teardown_locked(Slot& slot, const char* reason) {
    ++slot.generation;
    if (slot.clock) {
        slot.clock->cancel();
        slot.clock.reset();
    }
    if (slot.session) {
        slot.session.reset();
        active_sessions_.fetch_sub(1);
        if (log_lifecycle_) {
            std::cerr << "SessionRegistry: connection " << slot.id << ": simulation " << reason << std::endl;
        }
    }
}

bool SessionRegistry::send_locked(Slot& slot, const json& msg) {
    if (slot.channel && slot.channel->send(msg.dump())) return true;
    std::cerr << "SessionRegistry: connection " << slot.id << ": " << errors::MSG_E2410_SESSION_DROPPED << std::endl;
    teardown_locked(slot, "dropped");
    return false;
}

std::size_t SessionRegistry::connection_count() const {
    std::lock_guard<std::mutex> lk(slots_m_);
    return slots_.size();
}

bool SessionRegistry::has_session(ConnectionId id) const {
    auto slot = find_slot(id);
    if (!slot) return false;
    std::lock_guard<std::mutex> lk(slot->m);
    return slot->session != nullptr;
}

std::optional<SimulationSession::Snapshot> SessionRegistry::session_snapshot(ConnectionId id) const {
    auto slot = find_slot(id);
    if (!slot) return std::nullopt;
    std::lock_guard<std::mutex> lk(slot->m);
    if (!slot->session) return std::nullopt;
    return slot->session->snapshot();
}

} // namespace routesim

#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "SimulationProtocol.hpp"
#include "simulator/SimulationSession.hpp"

namespace routesim {

namespace net { class IClientChannel; }
class ITickScheduler;
class ITickTimer;

// Opaque connection identity; never reused within one process.
using ConnectionId = std::uint64_t;

/**
 * @brief Binds at most one SimulationSession (and its clock) to each live connection.
 *
 * Locking: the connection map has its own mutex, held only for lookup, insert
 * and erase. Each connection slot has a mutex that serializes control
 * messages with that slot's ticks. The map mutex is never held while a slot
 * mutex is taken.
 *
 * The registry must outlive every clock it arms; stop the scheduler's
 * threads before destroying it.
 */
class SessionRegistry {
public:
    explicit SessionRegistry(ITickScheduler& scheduler, bool log_lifecycle = true);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Register a new connection and return its identity.
    ConnectionId open_connection(std::shared_ptr<net::IClientChannel> channel);
    // Tear down any session owned by the connection and forget it. Idempotent.
    void close_connection(ConnectionId id);

    // Decode a raw text frame and dispatch it. Protocol errors are logged and dropped.
    void handle_message(ConnectionId id, std::string_view text);
    void dispatch(ConnectionId id, const protocol::InboundMessage& msg);

    // Control operations. Unknown connections and missing sessions are silent no-ops.
    void start_simulation(ConnectionId id, Waypoints waypoints, std::optional<double> speed);
    void pause_simulation(ConnectionId id);
    void resume_simulation(ConnectionId id);
    void stop_simulation(ConnectionId id);
    void update_speed(ConnectionId id, double speed);

    std::size_t connection_count() const;
    std::size_t active_session_count() const { return active_sessions_.load(); }
    bool has_session(ConnectionId id) const;
    std::optional<SimulationSession::Snapshot> session_snapshot(ConnectionId id) const;

private:
    struct Slot {
        ConnectionId id = 0;
        std::shared_ptr<net::IClientChannel> channel;
        std::mutex m;
        std::unique_ptr<SimulationSession> session;
        std::shared_ptr<ITickTimer> clock;
        // Bumped on every teardown so ticks from a replaced clock are ignored.
        std::uint64_t generation = 0;
        bool closed = false;
    };

    std::shared_ptr<Slot> find_slot(ConnectionId id) const;
    void on_tick(const std::weak_ptr<Slot>& weak, std::uint64_t generation);
    // Caller holds slot.m.
    void teardown_locked(Slot& slot, const char* reason);
    bool send_locked(Slot& slot, const nlohmann::json& msg);

    ITickScheduler& scheduler_;
    bool log_lifecycle_;

    mutable std::mutex slots_m_;
    std::unordered_map<ConnectionId, std::shared_ptr<Slot>> slots_;
    std::atomic<ConnectionId> next_id_{1};
    std::atomic<std::size_t> active_sessions_{0};
};

} // namespace routesim

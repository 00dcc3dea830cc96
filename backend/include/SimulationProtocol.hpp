#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <nlohmann/json.hpp>
#include "core/Coordinate.hpp"
#include "simulator/SimulationSession.hpp"

namespace routesim::protocol {

// Inbound message types (client -> server).
inline constexpr const char* START_SIMULATION = "START_SIMULATION";
inline constexpr const char* PAUSE_SIMULATION = "PAUSE_SIMULATION";
inline constexpr const char* RESUME_SIMULATION = "RESUME_SIMULATION";
inline constexpr const char* STOP_SIMULATION = "STOP_SIMULATION";
inline constexpr const char* UPDATE_SPEED = "UPDATE_SPEED";

// Outbound message types (server -> client).
inline constexpr const char* SIMULATION_STARTED = "SIMULATION_STARTED";
inline constexpr const char* POSITION_UPDATE = "POSITION_UPDATE";
inline constexpr const char* ERROR_MESSAGE = "ERROR";

struct StartSimulation {
    Waypoints waypoints;          // empty when the field was absent
    std::optional<double> speed;  // absent or null
};
struct PauseSimulation {};
struct ResumeSimulation {};
struct StopSimulation {};
struct UpdateSpeed {
    double speed = 0.0;
};

using InboundMessage = std::variant<StartSimulation, PauseSimulation, ResumeSimulation,
                                    StopSimulation, UpdateSpeed>;

// Decode one text frame. Throws ProtocolError on malformed or unknown messages.
InboundMessage decode(std::string_view text);
InboundMessage decode_json(const nlohmann::json& msg);

nlohmann::json build_simulation_started(const Coordinate& initial_position);
nlohmann::json build_position_update(const PositionUpdate& update);
nlohmann::json build_error(std::string_view message);

} // namespace routesim::protocol

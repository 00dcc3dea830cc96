#include "SimulationProtocol.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/Errors.hpp"

using json = nlohmann::json;

namespace routesim::protocol {

namespace {

[[noreturn]] void reject(const char* detail) {
    throw ProtocolError(errors::control_rejected(detail));
}

Coordinate decode_coordinate(const json& j) {
    if (!j.is_object()) reject(errors::D2400_WAYPOINT_INVALID);
    auto lat = j.find("lat");
    auto lng = j.find("lng");
    if (lat == j.end() || lng == j.end() || !lat->is_number() || !lng->is_number()) {
        reject(errors::D2400_WAYPOINT_INVALID);
    }
    return Coordinate{ lat->get<double>(), lng->get<double>() };
}

StartSimulation decode_start(const json& msg) {
    StartSimulation out;
    auto wp = msg.find("waypoints");
    if (wp != msg.end() && !wp->is_null()) {
        if (!wp->is_array()) reject(errors::D2400_WAYPOINTS_NOT_ARRAY);
        out.waypoints.reserve(wp->size());
        for (const auto& p : *wp) out.waypoints.push_back(decode_coordinate(p));
    }
    auto speed = msg.find("speed");
    if (speed != msg.end() && !speed->is_null()) {
        if (!speed->is_number()) reject(errors::D2400_SPEED_NOT_NUMBER);
        out.speed = speed->get<double>();
    }
    return out;
}

UpdateSpeed decode_update_speed(const json& msg) {
    auto speed = msg.find("speed");
    if (speed == msg.end() || speed->is_null()) reject(errors::D2400_SPEED_MISSING);
    if (!speed->is_number()) reject(errors::D2400_SPEED_NOT_NUMBER);
    return UpdateSpeed{ speed->get<double>() };
}

} // namespace

InboundMessage decode(std::string_view text) {
    json msg = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (msg.is_discarded()) reject(errors::D2400_INVALID_JSON);
    return decode_json(msg);
}

InboundMessage decode_json(const json& msg) {
    if (!msg.is_object()) reject(errors::D2400_NOT_OBJECT);
    auto type_it = msg.find("type");
    if (type_it == msg.end() || !type_it->is_string()) reject(errors::D2400_MISSING_TYPE);

    const auto& type = type_it->get_ref<const std::string&>();
    if (type == START_SIMULATION) return decode_start(msg);
    if (type == PAUSE_SIMULATION) return PauseSimulation{};
    if (type == RESUME_SIMULATION) return ResumeSimulation{};
    if (type == STOP_SIMULATION) return StopSimulation{};
    if (type == UPDATE_SPEED) return decode_update_speed(msg);
    reject(errors::D2400_UNKNOWN_TYPE);
}

json build_simulation_started(const Coordinate& initial_position) {
    return {
        {"type", SIMULATION_STARTED},
        {"initialPosition", initial_position}
    };
}

json build_position_update(const PositionUpdate& update) {
    return {
        {"type", POSITION_UPDATE},
        {"position", update.position},
        {"progress", update.progress},
        {"currentWaypoint", update.current_waypoint},
        {"isComplete", update.is_complete}
    };
}

json build_error(std::string_view message) {
    return {
        {"type", ERROR_MESSAGE},
        {"message", std::string(message)}
    };
}

} // namespace routesim::protocol

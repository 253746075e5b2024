#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "types.hpp"
#include "transport.hpp"
#include "config.hpp"

namespace roomcast {

class ScenarioError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class StepType {
    CONNECT,
    DISCONNECT,
    REGISTER,
    JOIN,
    LEAVE,
    REMOVE,
    BROADCAST,
    FETCH,
    ADD_SOCKETS,
    DEL_SOCKETS,
    DISCONNECT_SOCKETS
};

struct ScenarioStep {
    StepType type{StepType::JOIN};
    SocketId socket;
    std::vector<Room> rooms;     // join rooms / leave room / bulk join-leave rooms
    BroadcastOptions filter;     // target filter for broadcast and bulk steps
    Packet packet;
    bool close{false};
};

/**
 * A scripted sequence of membership and broadcast steps.
 *
 * {
 *   "sockets": ["a", "b"],
 *   "steps": [
 *     {"op": "join", "socket": "a", "rooms": ["r1", "r2"]},
 *     {"op": "broadcast", "rooms": ["r1"], "except": ["r2"], "merge": [],
 *      "flags": {"volatile": true}, "packet": {"type": "event", "data": ["hi"]}},
 *     {"op": "disconnect_sockets", "rooms": ["r1"], "close": true}
 *   ]
 * }
 */
struct Scenario {
    std::vector<SocketId> sockets;
    std::vector<ScenarioStep> steps;
};

Scenario parse_scenario(const nlohmann::json& j, const DispatchConfig& defaults = {});
Scenario load_scenario(const std::string& path, const DispatchConfig& defaults = {});

/**
 * Replays a scenario against a fresh namespace of LocalSockets and reports
 * the lifecycle events, fetch results, deliveries and final membership as JSON.
 */
nlohmann::json run_scenario(const Scenario& scenario, const NamespaceConfig& nsp_cfg);

} // namespace roomcast

#include "scenario.hpp"
#include "namespace.hpp"
#include "local_socket.hpp"
#include <algorithm>
#include <fstream>
#include <map>
#include <unordered_map>
#include <vector>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace roomcast {

namespace {

const std::unordered_map<std::string, StepType> kStepTypes = {
    {"connect", StepType::CONNECT},
    {"disconnect", StepType::DISCONNECT},
    {"register", StepType::REGISTER},
    {"join", StepType::JOIN},
    {"leave", StepType::LEAVE},
    {"remove", StepType::REMOVE},
    {"broadcast", StepType::BROADCAST},
    {"fetch", StepType::FETCH},
    {"add_sockets", StepType::ADD_SOCKETS},
    {"del_sockets", StepType::DEL_SOCKETS},
    {"disconnect_sockets", StepType::DISCONNECT_SOCKETS},
};

std::string step_error(size_t idx, const std::string& what) {
    return "scenario step " + std::to_string(idx) + ": " + what;
}

std::vector<std::string> string_list(const json& j, const char* key, size_t idx) {
    std::vector<std::string> out;
    if (!j.contains(key)) return out;
    const auto& arr = j.at(key);
    if (!arr.is_array()) {
        throw ScenarioError(step_error(idx, std::string("'") + key + "' must be an array"));
    }
    for (const auto& v : arr) {
        if (!v.is_string()) {
            throw ScenarioError(step_error(idx, std::string("'") + key + "' must contain strings"));
        }
        out.push_back(v.get<std::string>());
    }
    return out;
}

std::string required_string(const json& j, const char* key, size_t idx) {
    if (!j.contains(key) || !j.at(key).is_string() || j.at(key).get<std::string>().empty()) {
        throw ScenarioError(step_error(idx, std::string("missing '") + key + "'"));
    }
    return j.at(key).get<std::string>();
}

BroadcastOptions parse_filter(const json& j, size_t idx, const DispatchConfig& defaults) {
    BroadcastOptions opts;
    opts.rooms = string_list(j, "rooms", idx);
    for (auto& r : string_list(j, "except", idx)) opts.except.insert(std::move(r));
    for (auto& r : string_list(j, "merge", idx)) opts.merge.insert(std::move(r));

    opts.flags.is_volatile = defaults.default_volatile;
    opts.flags.compress = defaults.default_compress;
    if (j.contains("flags")) {
        const auto& f = j.at("flags");
        if (!f.is_object()) throw ScenarioError(step_error(idx, "'flags' must be an object"));
        opts.flags.is_volatile = f.value("volatile", opts.flags.is_volatile);
        opts.flags.compress = f.value("compress", opts.flags.compress);
        opts.flags.local = f.value("local", opts.flags.local);
        opts.flags.broadcast = f.value("broadcast", opts.flags.broadcast);
        opts.flags.binary = f.value("binary", opts.flags.binary);
    }
    return opts;
}

json sorted(std::vector<std::string> v) {
    std::sort(v.begin(), v.end());
    return json(v);
}

} // namespace

Scenario parse_scenario(const json& j, const DispatchConfig& defaults) {
    if (!j.is_object()) throw ScenarioError("scenario must be a JSON object");

    Scenario sc;
    if (j.contains("sockets")) {
        const auto& arr = j.at("sockets");
        if (!arr.is_array()) throw ScenarioError("'sockets' must be an array");
        for (const auto& v : arr) {
            if (!v.is_string()) throw ScenarioError("'sockets' must contain strings");
            sc.sockets.push_back(v.get<std::string>());
        }
    }
    if (!j.contains("steps")) return sc;
    if (!j.at("steps").is_array()) throw ScenarioError("'steps' must be an array");

    size_t idx = 0;
    for (const auto& s : j.at("steps")) {
        if (!s.is_object()) throw ScenarioError(step_error(idx, "step must be an object"));
        auto op = required_string(s, "op", idx);
        auto it = kStepTypes.find(op);
        if (it == kStepTypes.end()) throw ScenarioError(step_error(idx, "unknown op '" + op + "'"));

        ScenarioStep step;
        step.type = it->second;
        switch (step.type) {
            case StepType::CONNECT:
            case StepType::DISCONNECT:
            case StepType::REGISTER:
            case StepType::REMOVE:
                step.socket = required_string(s, "socket", idx);
                break;
            case StepType::JOIN:
                step.socket = required_string(s, "socket", idx);
                step.rooms = string_list(s, "rooms", idx);
                break;
            case StepType::LEAVE:
                step.socket = required_string(s, "socket", idx);
                step.rooms.push_back(required_string(s, "room", idx));
                break;
            case StepType::BROADCAST:
                step.filter = parse_filter(s, idx, defaults);
                step.packet = s.value("packet", json::object());
                break;
            case StepType::FETCH:
                step.filter = parse_filter(s, idx, defaults);
                break;
            case StepType::ADD_SOCKETS:
                step.filter = parse_filter(s, idx, defaults);
                step.rooms = string_list(s, "join", idx);
                break;
            case StepType::DEL_SOCKETS:
                step.filter = parse_filter(s, idx, defaults);
                step.rooms = string_list(s, "leave", idx);
                break;
            case StepType::DISCONNECT_SOCKETS:
                step.filter = parse_filter(s, idx, defaults);
                step.close = s.value("close", false);
                break;
        }
        sc.steps.push_back(std::move(step));
        ++idx;
    }
    return sc;
}

Scenario load_scenario(const std::string& path, const DispatchConfig& defaults) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ScenarioError("cannot open scenario file " + path);
    }
    json j;
    try {
        j = json::parse(f, nullptr, true, true);
    } catch (const json::parse_error& e) {
        throw ScenarioError("scenario " + path + " is not valid JSON: " + e.what());
    }
    return parse_scenario(j, defaults);
}

json run_scenario(const Scenario& scenario, const NamespaceConfig& nsp_cfg) {
    Namespace nsp(nsp_cfg.name, std::make_shared<JsonPacketEncoder>(), nsp_cfg.join_own_room);
    // Every connection made under an id, oldest first; a reconnect appends.
    std::map<SocketId, std::vector<std::shared_ptr<LocalSocket>>> locals;

    json events = json::array();
    nsp.registry().subscribe([&events](const LifecycleEvent& ev) {
        json e = {{"type", to_string(ev.type)}, {"room", ev.room}};
        if (!ev.socket_id.empty()) e["socket"] = ev.socket_id;
        events.push_back(std::move(e));
    });

    auto add_socket = [&](const SocketId& id) {
        auto sock = std::make_shared<LocalSocket>(id, nsp);
        if (nsp.connect(sock)) locals[id].push_back(std::move(sock));
    };
    for (const auto& id : scenario.sockets) add_socket(id);

    json fetches = json::array();
    size_t delivered = 0;
    for (const auto& step : scenario.steps) {
        switch (step.type) {
            case StepType::CONNECT:
                add_socket(step.socket);
                break;
            case StepType::DISCONNECT: {
                auto it = locals.find(step.socket);
                if (it != locals.end()) {
                    it->second.back()->disconnect(false);
                } else {
                    nsp.disconnect(step.socket);
                }
                break;
            }
            case StepType::REGISTER:
                nsp.registry().register_socket(step.socket);
                break;
            case StepType::JOIN:
                nsp.registry().join(step.socket, step.rooms);
                break;
            case StepType::LEAVE:
                nsp.registry().leave(step.socket, step.rooms.front());
                break;
            case StepType::REMOVE:
                nsp.registry().remove_socket(step.socket);
                break;
            case StepType::BROADCAST:
                delivered += nsp.adapter().broadcast(step.packet, step.filter);
                break;
            case StepType::FETCH: {
                std::vector<std::string> ids;
                for (const auto& s : nsp.adapter().fetch_sockets(step.filter)) ids.push_back(s->id());
                fetches.push_back(sorted(std::move(ids)));
                break;
            }
            case StepType::ADD_SOCKETS:
                nsp.adapter().add_sockets(step.filter, step.rooms);
                break;
            case StepType::DEL_SOCKETS:
                nsp.adapter().del_sockets(step.filter, step.rooms);
                break;
            case StepType::DISCONNECT_SOCKETS:
                nsp.adapter().disconnect_sockets(step.filter, step.close);
                break;
        }
    }

    json deliveries = json::object();
    for (const auto& kv : locals) {
        json frames = json::array();
        for (const auto& sock : kv.second) {
            for (const auto& d : sock->deliveries()) {
                frames.push_back({{"frames", d.frames},
                                  {"volatile", d.opts.is_volatile},
                                  {"compress", d.opts.compress}});
            }
        }
        deliveries[kv.first] = std::move(frames);
    }

    json rooms = json::object();
    for (const auto& room : nsp.registry().room_names()) {
        rooms[room] = sorted(nsp.registry().members(room));
    }

    spdlog::info("[{}] scenario finished: {} steps, {} lifecycle events, {} deliveries",
                 nsp.name(), scenario.steps.size(), events.size(), delivered);

    return json{{"namespace", nsp.name()},
                {"events", events},
                {"fetches", fetches},
                {"deliveries", deliveries},
                {"rooms", rooms},
                {"sockets", sorted(nsp.registry().socket_ids())}};
}

} // namespace roomcast

#pragma once

#include <string>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace roomcast {

using json = nlohmann::json;

struct LoggingConfig {
    std::string level{"info"};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v"};
};

struct NamespaceConfig {
    std::string name{"/"};
    bool join_own_room{true};   // each socket also joins a room named after its id
};

/**
 * Flags used for scenario broadcasts that do not specify their own.
 */
struct DispatchConfig {
    bool default_volatile{false};
    bool default_compress{true};
};

struct ScenarioConfig {
    std::string path{};
};

struct Config {
    LoggingConfig logging;
    NamespaceConfig nsp;          // "namespace" in JSON
    DispatchConfig dispatch;
    ScenarioConfig scenario;
};

inline void load_config(Config& cfg, const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("Config file {} not found, using defaults", path);
        return;
    }
    json j = json::parse(f, nullptr, true, true);
    if (j.contains("logging")) {
        auto& l = j["logging"];
        cfg.logging.level = l.value("level", cfg.logging.level);
        cfg.logging.pattern = l.value("pattern", cfg.logging.pattern);
    }
    if (j.contains("namespace")) {
        auto& n = j["namespace"];
        cfg.nsp.name = n.value("name", cfg.nsp.name);
        cfg.nsp.join_own_room = n.value("join_own_room", cfg.nsp.join_own_room);
    }
    if (j.contains("dispatch")) {
        auto& d = j["dispatch"];
        cfg.dispatch.default_volatile = d.value("default_volatile", cfg.dispatch.default_volatile);
        cfg.dispatch.default_compress = d.value("default_compress", cfg.dispatch.default_compress);
    }
    if (j.contains("scenario")) {
        auto& s = j["scenario"];
        cfg.scenario.path = s.value("path", cfg.scenario.path);
    }
}

inline void apply_logging_config(const LoggingConfig& cfg) {
    auto level = spdlog::level::from_str(cfg.level);
    if (level == spdlog::level::off && cfg.level != "off") {
        spdlog::warn("Unknown log level '{}', keeping info", cfg.level);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
    if (!cfg.pattern.empty()) {
        spdlog::set_pattern(cfg.pattern);
    }
}

} // namespace roomcast

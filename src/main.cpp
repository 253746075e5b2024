#include <iostream>
#include <spdlog/spdlog.h>
#include "core/config.hpp"
#include "core/scenario.hpp"

int main(int argc, char* argv[]) {
    std::string config_path = "config/settings.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    roomcast::Config cfg;
    try {
        roomcast::load_config(cfg, config_path);
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config {}: {}", config_path, e.what());
        return 1;
    }
    if (argc > 2) {
        cfg.scenario.path = argv[2];
    }
    roomcast::apply_logging_config(cfg.logging);

    if (cfg.scenario.path.empty()) {
        spdlog::error("No scenario given. Usage: {} [config.json] [scenario.json]", argv[0]);
        return 1;
    }

    spdlog::info("roomcast starting. namespace={} scenario={}", cfg.nsp.name, cfg.scenario.path);
    try {
        auto scenario = roomcast::load_scenario(cfg.scenario.path, cfg.dispatch);
        auto report = roomcast::run_scenario(scenario, cfg.nsp);
        std::cout << report.dump(2) << std::endl;
    } catch (const std::exception& e) {
        spdlog::error("Scenario failed: {}", e.what());
        return 1;
    }
    return 0;
}

// common/config/engine_config.cpp
#include "common/config/engine_config.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

namespace funcmodel {

EngineConfig load_engine_config(const std::string& config_path) {
    EngineConfig config;

    std::ifstream file(config_path);
    if (!file.is_open()) {
        return config;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (j.contains("max_context_depth") && j["max_context_depth"].is_number_integer()) {
            int depth = j["max_context_depth"].get<int>();
            config.max_context_depth = depth > 0 ? depth : config.max_context_depth;
        }
        if (j.contains("default_merge_strategy") && j["default_merge_strategy"].is_string()) {
            auto strategy = parse_merge_strategy(j["default_merge_strategy"].get<std::string>());
            if (strategy.is_success()) {
                config.default_merge_strategy = strategy.value();
            } else {
                std::cerr << "[WARNING] " << config_path << ": " << strategy.message() << std::endl;
            }
        }
        if (j.contains("ancestors_can_write") && j["ancestors_can_write"].is_boolean()) {
            config.ancestors_can_write = j["ancestors_can_write"].get<bool>();
        }
        if (j.contains("default_escalation") && j["default_escalation"].is_string()) {
            auto escalation = parse_escalation(j["default_escalation"].get<std::string>());
            if (escalation.is_success()) {
                config.default_escalation = escalation.value();
            } else {
                std::cerr << "[WARNING] " << config_path << ": " << escalation.message() << std::endl;
            }
        }
        if (j.contains("dry_run") && j["dry_run"].is_boolean()) {
            config.dry_run = j["dry_run"].get<bool>();
        }
        if (j.contains("default_action_duration_sec") && j["default_action_duration_sec"].is_number()) {
            double duration = j["default_action_duration_sec"].get<double>();
            config.default_action_duration_sec = duration > 0 ? duration : config.default_action_duration_sec;
        }
        if (j.contains("trace_enabled") && j["trace_enabled"].is_boolean()) {
            config.trace_enabled = j["trace_enabled"].get<bool>();
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[WARNING] Ignoring malformed config " << config_path << ": " << e.what() << std::endl;
        return EngineConfig{};
    }

    return config;
}

} // namespace funcmodel

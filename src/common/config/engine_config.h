// common/config/engine_config.h
#ifndef FUNCMODEL_COMMON_CONFIG_ENGINE_CONFIG_H
#define FUNCMODEL_COMMON_CONFIG_ENGINE_CONFIG_H

#include "core/types/enums.h"
#include <string>

namespace funcmodel {

struct EngineConfig {
    int max_context_depth = 10;
    MergeStrategy default_merge_strategy = MergeStrategy::FIRST_WINS;
    bool ancestors_can_write = false;
    Escalation default_escalation = Escalation::FAILED;
    bool dry_run = false;
    double default_action_duration_sec = 60.0;
    bool trace_enabled = true;
};

// Missing file: defaults. Malformed file or field: warning on stderr, defaults for what could not be read.
EngineConfig load_engine_config(const std::string& config_path = "funcmodel_config.json");

} // namespace funcmodel

#endif // FUNCMODEL_COMMON_CONFIG_ENGINE_CONFIG_H

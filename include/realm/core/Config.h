#pragma once
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "realm/ai/AgentBrain.h"
#include "realm/core/Log.h"

namespace realm::core {

// Engine/driver settings. Every field has a default, so an empty JSON object
// is a valid config.
//
//   {
//     "log":   { "level": "debug", "file": "logs/realm.log" },
//     "brain": { "restThreshold": 30, "attackDamage": 8, "gatherResource": "wood" },
//     "steps": 10, "recentEvents": 20, "brainAll": false
//   }
struct EngineConfig {
    logsys::LogConfig log;
    ai::BrainConfig   brain;
    int  steps        = 10;
    int  recentEvents = 20;
    bool brainAll     = false;   // drive every entity, not just "player"-tagged ones
};

ai::BrainConfig ParseBrainConfig(const nlohmann::json& j);
EngineConfig    ParseEngineConfig(const nlohmann::json& j);

// Throws std::runtime_error if the file cannot be opened; JSON syntax errors
// propagate as nlohmann::json::parse_error.
EngineConfig LoadEngineConfig(const std::filesystem::path& jsonPath);

} // namespace realm::core

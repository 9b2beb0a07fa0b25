#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace realm::world {
class WorldState;
}

namespace realm::logsys {

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string file;   // empty -> console only
};

void init(const LogConfig& cfg);                    // installs "realm" as the spdlog default
std::shared_ptr<spdlog::logger> get();              // "realm" (initialized on first use)

// Echo every event the world appends at trace level.
void mirrorWorldEvents(world::WorldState& world);

// Unknown names map to info.
spdlog::level::level_enum ParseLogLevel(const std::string& name);

} // namespace realm::logsys

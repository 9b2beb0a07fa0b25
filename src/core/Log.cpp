#include "realm/core/Log.h"

#include "realm/world/WorldState.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;
static std::shared_ptr<spdlog::logger> g_logger;

namespace {

void echo_event(const realm::world::WorldEvent& e)
{
    spdlog::trace("[t{}] {}: {}", e.tick, e.kind, e.detail);
}

} // namespace

void realm::logsys::init(const LogConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!cfg.file.empty()) {
        const fs::path path(cfg.file);
        std::error_code ec;
        if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(cfg.file, 1 << 20, 4)); // 1MB * 4
    }

    g_logger = std::make_shared<spdlog::logger>("realm", sinks.begin(), sinks.end());
    g_logger->set_level(cfg.level);
    spdlog::set_default_logger(g_logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");
    spdlog::debug("Logging started");
}

std::shared_ptr<spdlog::logger> realm::logsys::get() {
    if (!g_logger) init(LogConfig{});
    return g_logger;
}

void realm::logsys::mirrorWorldEvents(world::WorldState& world) {
    world.onEvent().connect<&echo_event>();
}

spdlog::level::level_enum realm::logsys::ParseLogLevel(const std::string& name) {
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn")     return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    return spdlog::level::info;
}

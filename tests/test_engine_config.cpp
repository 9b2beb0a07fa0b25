// tests/test_engine_config.cpp
//
// Tests for src/core/Config.{h,cpp} and the level parsing in src/core/Log.cpp.
//
// Goals:
//   - An empty object yields the documented defaults
//   - Values present in the JSON override defaults, absent ones do not
//   - A missing file throws instead of silently running with defaults

#include <doctest/doctest.h>

#include "realm/core/Config.h"
#include "realm/core/Log.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

fs::path make_unique_temp_dir()
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / ("realm_engine_config_tests_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    if (ec)
        return base;

    return dir;
}

} // namespace

TEST_CASE("core::ParseEngineConfig: empty object keeps defaults")
{
    const realm::core::EngineConfig cfg = realm::core::ParseEngineConfig(json::object());

    CHECK(cfg.steps == 10);
    CHECK(cfg.recentEvents == 20);
    CHECK_FALSE(cfg.brainAll);
    CHECK(cfg.log.level == spdlog::level::info);
    CHECK(cfg.log.file.empty());
    CHECK(cfg.brain.restThreshold == 30);
    CHECK(cfg.brain.gatherResource == "wood");
}

TEST_CASE("core::ParseEngineConfig: present values override defaults")
{
    const json j = json::parse(R"({
        "log":   { "level": "debug", "file": "logs/run.log" },
        "brain": { "restThreshold": 45, "gatherResource": "ore", "gatherAmount": 3 },
        "steps": 3,
        "brainAll": true
    })");

    const realm::core::EngineConfig cfg = realm::core::ParseEngineConfig(j);
    CHECK(cfg.steps == 3);
    CHECK(cfg.recentEvents == 20);
    CHECK(cfg.brainAll);
    CHECK(cfg.log.level == spdlog::level::debug);
    CHECK(cfg.log.file == "logs/run.log");

    CHECK(cfg.brain.restThreshold == 45);
    CHECK(cfg.brain.gatherResource == "ore");
    CHECK(cfg.brain.gatherAmount == 3);
    CHECK(cfg.brain.attackDamage == 8);
}

TEST_CASE("core::ParseEngineConfig: non-object input falls back to defaults")
{
    const realm::core::EngineConfig cfg = realm::core::ParseEngineConfig(json::array({1, 2, 3}));
    CHECK(cfg.steps == 10);
    CHECK(realm::core::ParseBrainConfig(json("nope")).attackDamage == 8);
}

TEST_CASE("core::LoadEngineConfig reads a file written to disk")
{
    const fs::path dir = make_unique_temp_dir() / "load";
    std::error_code ec;
    fs::create_directories(dir, ec);

    const fs::path file = dir / "engine.json";
    {
        std::ofstream out(file);
        out << R"({ "steps": 42, "recentEvents": 5 })";
    }

    const realm::core::EngineConfig cfg = realm::core::LoadEngineConfig(file);
    CHECK(cfg.steps == 42);
    CHECK(cfg.recentEvents == 5);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadEngineConfig throws for a missing file")
{
    const fs::path dir = make_unique_temp_dir() / "missing";
    CHECK_THROWS_AS(realm::core::LoadEngineConfig(dir / "engine.json"), std::runtime_error);
}

TEST_CASE("logsys::ParseLogLevel maps names and defaults to info")
{
    using realm::logsys::ParseLogLevel;
    CHECK(ParseLogLevel("trace") == spdlog::level::trace);
    CHECK(ParseLogLevel("warn") == spdlog::level::warn);
    CHECK(ParseLogLevel("error") == spdlog::level::err);
    CHECK(ParseLogLevel("off") == spdlog::level::off);
    CHECK(ParseLogLevel("loud") == spdlog::level::info);
}

// realm_sim: load a scenario, drive it with rule-based brains, print results.
//
//   realm_sim <scenario.json> [--config engine.json] [--steps N]
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "realm/ai/AgentBrain.h"
#include "realm/core/Config.h"
#include "realm/core/Log.h"
#include "realm/engine/GameEngine.h"
#include "realm/tools/DevToolkit.h"
#include "realm/tools/MethodLibrary.h"
#include "realm/world/WorldState.h"

using namespace realm;

static void usage() {
    std::fprintf(stderr, "usage: realm_sim <scenario.json> [--config engine.json] [--steps N]\n");
}

int main(int argc, char** argv) {
    std::string scenarioPath;
    std::string configPath;
    int stepsOverride = -1;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc)      configPath = argv[++i];
        else if (arg == "--steps" && i + 1 < argc)  stepsOverride = std::atoi(argv[++i]);
        else if (arg == "--help" || arg == "-h")    { usage(); return 0; }
        else if (scenarioPath.empty())              scenarioPath = arg;
        else                                        { usage(); return 2; }
    }

    if (scenarioPath.empty()) {
        usage();
        return 2;
    }

    try {
        core::EngineConfig cfg = configPath.empty() ? core::EngineConfig{} : core::LoadEngineConfig(configPath);
        if (stepsOverride >= 0) cfg.steps = stepsOverride;

        logsys::init(cfg.log);

        world::WorldState state;
        tools::MethodLibrary methods;
        tools::DevToolkit toolkit(state, methods);
        logsys::mirrorWorldEvents(state);

        tools::LoadScenarioFile(scenarioPath, toolkit);

        engine::GameEngine sim(state);
        state.entities().forEach([&](const world::Entity& e) {
            if (cfg.brainAll || e.hasTag("player"))
                sim.registerBrain(e.id, std::make_unique<ai::RuleBasedBrain>(cfg.brain));
        });
        spdlog::info("{} brains registered, running {} steps", sim.brainCount(), cfg.steps);

        for (int s = 0; s < cfg.steps; ++s) {
            const auto tick = state.clock();
            for (const auto& r : sim.step())
                std::printf("[t%llu] %-5s %s\n", static_cast<unsigned long long>(tick),
                            action::ActionStatusName(r.status), r.detail.c_str());
        }

        std::printf("-- last %d events --\n", cfg.recentEvents);
        for (const auto& e : state.getRecentEvents(cfg.recentEvents))
            std::printf("[t%llu] %s: %s\n", static_cast<unsigned long long>(e.tick), e.kind.c_str(), e.detail.c_str());
    } catch (const std::exception& ex) {
        spdlog::critical("realm_sim: {}", ex.what());
        return 1;
    }

    return 0;
}

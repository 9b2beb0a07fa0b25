#include "realm/core/Config.h"

#include <fstream>
#include <stdexcept>

namespace realm::core {

using json = nlohmann::json;

ai::BrainConfig ParseBrainConfig(const json& j)
{
    ai::BrainConfig b;
    if (!j.is_object())
        return b;

    b.restThreshold  = j.value("restThreshold", b.restThreshold);
    b.restHp         = j.value("restHp", b.restHp);
    b.restMana       = j.value("restMana", b.restMana);
    b.attackDamage   = j.value("attackDamage", b.attackDamage);
    b.gatherResource = j.value("gatherResource", b.gatherResource);
    b.gatherAmount   = j.value("gatherAmount", b.gatherAmount);
    return b;
}

EngineConfig ParseEngineConfig(const json& j)
{
    EngineConfig cfg;
    if (!j.is_object())
        return cfg;

    if (j.contains("log") && j["log"].is_object())
    {
        const auto& l = j["log"];
        cfg.log.level = logsys::ParseLogLevel(l.value("level", std::string("info")));
        cfg.log.file  = l.value("file", cfg.log.file);
    }

    if (j.contains("brain"))
        cfg.brain = ParseBrainConfig(j["brain"]);

    cfg.steps        = j.value("steps", cfg.steps);
    cfg.recentEvents = j.value("recentEvents", cfg.recentEvents);
    cfg.brainAll     = j.value("brainAll", cfg.brainAll);
    return cfg;
}

EngineConfig LoadEngineConfig(const std::filesystem::path& jsonPath)
{
    std::ifstream f(jsonPath);
    if (!f.is_open()) throw std::runtime_error("Could not open " + jsonPath.string());
    json J; f >> J;
    return ParseEngineConfig(J);
}

} // namespace realm::core

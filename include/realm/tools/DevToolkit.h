#pragma once

#include "realm/tools/MethodLibrary.h"
#include "realm/world/Types.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace realm::world {
class WorldState;
}

namespace realm::tools {

// Authoring front-end: builds records and registers them into the world (or
// the method library). Usable while a simulation is running.
class DevToolkit
{
public:
    DevToolkit(world::WorldState& world, MethodLibrary& methods) : m_world(world), m_methods(methods) {}

    world::Area& createArea(const std::string& name, const std::string& description,
                            std::vector<std::string> neighbors, std::map<std::string, int> resources = {});

    world::Entity& spawnEntity(const std::string& id, const std::string& name, const std::string& area,
                               std::vector<std::string> tags = {});

    world::Quest& addQuest(const std::string& id, const std::string& title, const std::string& description,
                           std::map<std::string, int> objectives);

    bool assignQuestToEntity(const std::string& entityId, const std::string& questId);

    world::ItemDefinition& addItem(const std::string& id, const std::string& name, const std::string& description,
                                   bool stackable = true);

    // Seeds `amount` of `resource` into the area; returns the area's new total.
    int addResourceNode(const std::string& area, const std::string& resource, int amount);

    world::Faction& addFaction(const std::string& id, const std::string& name, const std::string& description);

    world::Skill& addSkill(const std::string& id, const std::string& name, int manaCost, world::SkillEffect effect);

    void registerMethod(std::string name, std::string description, std::vector<std::string> tags,
                        MethodHandler handler);

    [[nodiscard]] world::WorldState& world() noexcept { return m_world; }
    [[nodiscard]] MethodLibrary& methods() noexcept { return m_methods; }

private:
    world::WorldState& m_world;
    MethodLibrary& m_methods;
};

// -----------------------------------------------------------------------------
// Built-in skill effects
// -----------------------------------------------------------------------------
// Damages the target (clamped at 0). "damaged:<id>:<n>", or "no_target".
world::SkillEffect MakeDamageEffect(int amount);

// Heals the target, or the caster when cast without one. "healed:<id>:<n>".
world::SkillEffect MakeHealEffect(int amount);

// -----------------------------------------------------------------------------
// Scenario loading
// -----------------------------------------------------------------------------
// Reads authoring input of the form
//
//   {
//     "areas":    [ { "name", "description", "neighbors": [], "resources": { "wood": 5 } } ],
//     "entities": [ { "id", "name", "area", "tags": [], "hp", "mana", "inventory": {} } ],
//     "quests":   [ { "id", "title", "description", "objectives": { "gather:wood": 2 } } ],
//     "items":    [ { "id", "name", "description", "stackable" } ],
//     "factions": [ { "id", "name", "description" } ],
//     "skills":   [ { "id", "name", "manaCost", "effect": { "type": "damage", "amount": 12 } } ],
//     "assignments": [ { "entity", "quest" } ]
//   }
//
// Every section is optional. An unknown skill effect type throws
// std::runtime_error.
void LoadScenario(const nlohmann::json& j, DevToolkit& toolkit);

// Throws std::runtime_error if the file cannot be opened.
void LoadScenarioFile(const std::filesystem::path& jsonPath, DevToolkit& toolkit);

} // namespace realm::tools

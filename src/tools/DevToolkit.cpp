#include "realm/tools/DevToolkit.h"

#include "realm/world/WorldState.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace realm::tools {

using json = nlohmann::json;

world::Area& DevToolkit::createArea(const std::string& name, const std::string& description,
                                    std::vector<std::string> neighbors, std::map<std::string, int> resources)
{
    world::Area a;
    a.name = name;
    a.description = description;
    a.neighbors = std::move(neighbors);

    // Negative seeds would break the non-negative resource invariant.
    for (auto& [kind, qty] : resources)
        a.resources[kind] = std::max(0, qty);

    return m_world.addArea(std::move(a));
}

world::Entity& DevToolkit::spawnEntity(const std::string& id, const std::string& name, const std::string& area,
                                       std::vector<std::string> tags)
{
    world::Entity e;
    e.id = id;
    e.name = name;
    e.area = area;
    e.tags = std::move(tags);

    if (!m_world.getArea(area))
        spdlog::warn("spawnEntity: '{}' placed in unknown area '{}'", id, area);

    return m_world.addEntity(std::move(e));
}

world::Quest& DevToolkit::addQuest(const std::string& id, const std::string& title, const std::string& description,
                                   std::map<std::string, int> objectives)
{
    world::Quest q;
    q.id = id;
    q.title = title;
    q.description = description;
    q.objectives = std::move(objectives);
    return m_world.addQuest(std::move(q));
}

bool DevToolkit::assignQuestToEntity(const std::string& entityId, const std::string& questId)
{
    return m_world.assignQuest(entityId, questId);
}

world::ItemDefinition& DevToolkit::addItem(const std::string& id, const std::string& name,
                                           const std::string& description, bool stackable)
{
    world::ItemDefinition item;
    item.id = id;
    item.name = name;
    item.description = description;
    item.stackable = stackable;
    return m_world.addItem(std::move(item));
}

int DevToolkit::addResourceNode(const std::string& area, const std::string& resource, int amount)
{
    if (!m_world.getArea(area))
        spdlog::warn("addResourceNode: unknown area '{}'", area);
    return m_world.adjustAreaResource(area, resource, amount);
}

world::Faction& DevToolkit::addFaction(const std::string& id, const std::string& name, const std::string& description)
{
    world::Faction f;
    f.id = id;
    f.name = name;
    f.description = description;
    return m_world.addFaction(std::move(f));
}

world::Skill& DevToolkit::addSkill(const std::string& id, const std::string& name, int manaCost,
                                   world::SkillEffect effect)
{
    world::Skill s;
    s.id = id;
    s.name = name;
    s.manaCost = manaCost;
    s.effect = std::move(effect);
    return m_world.addSkill(std::move(s));
}

void DevToolkit::registerMethod(std::string name, std::string description, std::vector<std::string> tags,
                                MethodHandler handler)
{
    m_methods.registerMethod(std::move(name), std::move(description), std::move(tags), std::move(handler));
}

world::SkillEffect MakeDamageEffect(int amount)
{
    return [amount](world::WorldState&, world::Entity&, world::Entity* target) -> std::string {
        if (!target)
            return "no_target";
        target->hp = std::clamp(target->hp - amount, 0, world::kMaxHp);
        return "damaged:" + target->id + ":" + std::to_string(amount);
    };
}

world::SkillEffect MakeHealEffect(int amount)
{
    return [amount](world::WorldState&, world::Entity& caster, world::Entity* target) -> std::string {
        world::Entity& who = target ? *target : caster;
        who.hp = std::clamp(who.hp + amount, 0, world::kMaxHp);
        return "healed:" + who.id + ":" + std::to_string(amount);
    };
}

namespace {

world::SkillEffect effect_from_json(const json& e)
{
    const std::string type = e.value("type", std::string());
    const int amount = e.value("amount", 0);

    if (type == "damage") return MakeDamageEffect(amount);
    if (type == "heal")   return MakeHealEffect(amount);
    throw std::runtime_error("Unknown skill effect type: " + type);
}

} // namespace

void LoadScenario(const json& J, DevToolkit& toolkit)
{
    for (const auto& a : J.value("areas", json::array()))
    {
        toolkit.createArea(a.at("name").get<std::string>(),
                           a.value("description", std::string()),
                           a.value("neighbors", std::vector<std::string>{}),
                           a.value("resources", std::map<std::string, int>{}));
    }

    for (const auto& e : J.value("entities", json::array()))
    {
        world::Entity& ent = toolkit.spawnEntity(e.at("id").get<std::string>(),
                                                 e.value("name", e.at("id").get<std::string>()),
                                                 e.at("area").get<std::string>(),
                                                 e.value("tags", std::vector<std::string>{}));
        ent.hp   = std::clamp(e.value("hp", ent.hp), 0, world::kMaxHp);
        ent.mana = std::clamp(e.value("mana", ent.mana), 0, world::kMaxMana);
        for (const auto& [item, qty] : e.value("inventory", std::map<std::string, int>{}))
            ent.inventory[item] = std::max(0, qty);
    }

    for (const auto& q : J.value("quests", json::array()))
    {
        toolkit.addQuest(q.at("id").get<std::string>(),
                         q.value("title", std::string()),
                         q.value("description", std::string()),
                         q.value("objectives", std::map<std::string, int>{}));
    }

    for (const auto& i : J.value("items", json::array()))
    {
        toolkit.addItem(i.at("id").get<std::string>(),
                        i.value("name", std::string()),
                        i.value("description", std::string()),
                        i.value("stackable", true));
    }

    for (const auto& f : J.value("factions", json::array()))
    {
        toolkit.addFaction(f.at("id").get<std::string>(),
                           f.value("name", std::string()),
                           f.value("description", std::string()));
    }

    for (const auto& s : J.value("skills", json::array()))
    {
        world::SkillEffect effect;
        if (s.contains("effect"))
            effect = effect_from_json(s["effect"]);

        toolkit.addSkill(s.at("id").get<std::string>(),
                         s.value("name", s.at("id").get<std::string>()),
                         s.value("manaCost", 0),
                         std::move(effect));
    }

    for (const auto& a : J.value("assignments", json::array()))
    {
        const std::string entity = a.at("entity").get<std::string>();
        const std::string quest  = a.at("quest").get<std::string>();
        if (!toolkit.assignQuestToEntity(entity, quest))
            spdlog::warn("scenario: could not assign quest '{}' to '{}'", quest, entity);
    }

    spdlog::info("scenario loaded: {} areas, {} entities, {} quests, {} skills",
                 toolkit.world().areas().size(), toolkit.world().entities().size(),
                 toolkit.world().quests().size(), toolkit.world().skills().size());
}

void LoadScenarioFile(const std::filesystem::path& jsonPath, DevToolkit& toolkit)
{
    std::ifstream f(jsonPath);
    if (!f.is_open()) throw std::runtime_error("Could not open " + jsonPath.string());
    json J; f >> J;
    LoadScenario(J, toolkit);
}

} // namespace realm::tools

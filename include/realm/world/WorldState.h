#pragma once

#include "realm/world/Registry.h"
#include "realm/world/Types.h"

#include <entt/signal/dispatcher.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace realm::world {

// Authoritative in-memory world: areas, entities, quests (and per-entity
// progress), skills, items, factions, the event log and the tick counter.
//
// Nothing here validates referential integrity on insert. An entity placed in
// an unknown area is accepted; the actions that touch it report the problem.
class WorldState
{
public:
    WorldState() = default;

    WorldState(const WorldState&) = delete;
    WorldState& operator=(const WorldState&) = delete;

    // ---------------------------------------------------------------------
    // Authoring (insert or overwrite by key)
    // ---------------------------------------------------------------------
    Area& addArea(Area area);
    Entity& addEntity(Entity entity);
    Quest& addQuest(Quest quest);
    Skill& addSkill(Skill skill);
    ItemDefinition& addItem(ItemDefinition item);
    Faction& addFaction(Faction faction);

    // ---------------------------------------------------------------------
    // Lookup (null when absent)
    // ---------------------------------------------------------------------
    [[nodiscard]] Entity* getEntity(const std::string& id) { return m_entities.find(id); }
    [[nodiscard]] const Entity* getEntity(const std::string& id) const { return m_entities.find(id); }

    [[nodiscard]] Area* getArea(const std::string& name) { return m_areas.find(name); }
    [[nodiscard]] const Area* getArea(const std::string& name) const { return m_areas.find(name); }

    [[nodiscard]] const Quest* getQuest(const std::string& id) const { return m_quests.find(id); }
    [[nodiscard]] const Skill* getSkill(const std::string& id) const { return m_skills.find(id); }
    [[nodiscard]] const ItemDefinition* getItem(const std::string& id) const { return m_items.find(id); }
    [[nodiscard]] const Faction* getFaction(const std::string& id) const { return m_factions.find(id); }

    [[nodiscard]] std::vector<const Entity*> getEntitiesInArea(const std::string& areaName) const;

    [[nodiscard]] const Registry<Area>& areas() const noexcept { return m_areas; }
    [[nodiscard]] const Registry<Entity>& entities() const noexcept { return m_entities; }
    [[nodiscard]] const Registry<Quest>& quests() const noexcept { return m_quests; }
    [[nodiscard]] const Registry<Skill>& skills() const noexcept { return m_skills; }

    // ---------------------------------------------------------------------
    // Quests
    // ---------------------------------------------------------------------
    // False if the entity or quest is unknown, or the quest is already in the
    // entity's log. Never resets existing progress.
    bool assignQuest(const std::string& entityId, const std::string& questId);

    // Adds `amount` to `objectiveKey` on every unfinished quest of the entity
    // that lists that key, then re-checks completion.
    void updateEntityQuestProgress(const std::string& entityId, const std::string& objectiveKey, int amount = 1);

    // ---------------------------------------------------------------------
    // Resources & reputation
    // ---------------------------------------------------------------------
    // Returns the stored quantity after clamping at zero; 0 for an unknown area.
    int adjustAreaResource(const std::string& areaName, const std::string& resourceKind, int delta);
    [[nodiscard]] int areaResource(const std::string& areaName, const std::string& resourceKind) const;

    int adjustReputation(const std::string& factionId, const std::string& entityId, int delta);

    // ---------------------------------------------------------------------
    // Event log & clock
    // ---------------------------------------------------------------------
    void logEvent(std::string kind, std::string detail, std::optional<std::string> actorId = std::nullopt);

    [[nodiscard]] const std::vector<WorldEvent>& events() const noexcept { return m_events; }
    [[nodiscard]] std::vector<WorldEvent> getRecentEvents(int limit) const;

    // Listeners see each event right after it is appended. They observe only.
    [[nodiscard]] auto onEvent() { return m_dispatcher.sink<WorldEvent>(); }

    void tick() noexcept { ++m_clock; }
    [[nodiscard]] std::uint64_t clock() const noexcept { return m_clock; }

private:
    Registry<Area> m_areas;
    Registry<Entity> m_entities;
    Registry<Quest> m_quests;
    Registry<Skill> m_skills;
    Registry<ItemDefinition> m_items;
    Registry<Faction> m_factions;

    std::vector<WorldEvent> m_events;
    entt::dispatcher m_dispatcher;
    std::uint64_t m_clock = 0;
};

} // namespace realm::world

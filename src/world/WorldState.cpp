#include "realm/world/WorldState.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <utility>

namespace realm::world {

Area& WorldState::addArea(Area area)
{
    const std::string key = area.name;
    return m_areas.put(key, std::move(area));
}

Entity& WorldState::addEntity(Entity entity)
{
    const std::string key = entity.id;
    return m_entities.put(key, std::move(entity));
}

Quest& WorldState::addQuest(Quest quest)
{
    const std::string key = quest.id;
    return m_quests.put(key, std::move(quest));
}

Skill& WorldState::addSkill(Skill skill)
{
    const std::string key = skill.id;
    return m_skills.put(key, std::move(skill));
}

ItemDefinition& WorldState::addItem(ItemDefinition item)
{
    const std::string key = item.id;
    return m_items.put(key, std::move(item));
}

Faction& WorldState::addFaction(Faction faction)
{
    const std::string key = faction.id;
    return m_factions.put(key, std::move(faction));
}

std::vector<const Entity*> WorldState::getEntitiesInArea(const std::string& areaName) const
{
    std::vector<const Entity*> out;
    m_entities.forEach([&](const Entity& e) {
        if (e.area == areaName)
            out.push_back(&e);
    });
    return out;
}

bool WorldState::assignQuest(const std::string& entityId, const std::string& questId)
{
    Entity* entity = m_entities.find(entityId);
    if (!entity || !m_quests.contains(questId))
        return false;

    if (entity->questLog.count(questId) != 0)
        return false;

    QuestProgress p;
    p.questId = questId;
    entity->questLog.emplace(questId, std::move(p));
    return true;
}

void WorldState::updateEntityQuestProgress(const std::string& entityId, const std::string& objectiveKey, int amount)
{
    Entity* entity = m_entities.find(entityId);
    if (!entity)
        return;

    for (auto& [questId, progress] : entity->questLog)
    {
        if (progress.completed)
            continue;

        const Quest* quest = m_quests.find(questId);
        if (!quest || quest->objectives.count(objectiveKey) == 0)
            continue;

        int& done = progress.progress[objectiveKey];
        done = SaturatingAdd(done, amount);

        if (quest->isSatisfiedBy(progress))
        {
            progress.completed = true;
            spdlog::info("quest '{}' completed by {}", questId, entityId);
        }
    }
}

int WorldState::adjustAreaResource(const std::string& areaName, const std::string& resourceKind, int delta)
{
    Area* area = m_areas.find(areaName);
    if (!area)
        return 0;

    int& qty = area->resources[resourceKind];
    qty = std::max(0, SaturatingAdd(qty, delta));
    return qty;
}

int WorldState::areaResource(const std::string& areaName, const std::string& resourceKind) const
{
    const Area* area = m_areas.find(areaName);
    if (!area)
        return 0;

    const auto it = area->resources.find(resourceKind);
    return it == area->resources.end() ? 0 : it->second;
}

int WorldState::adjustReputation(const std::string& factionId, const std::string& entityId, int delta)
{
    Faction* faction = m_factions.find(factionId);
    if (!faction)
        return 0;

    int& standing = faction->reputation[entityId];
    standing = SaturatingAdd(standing, delta);
    return standing;
}

void WorldState::logEvent(std::string kind, std::string detail, std::optional<std::string> actorId)
{
    WorldEvent e;
    e.tick = m_clock;
    e.kind = std::move(kind);
    e.detail = std::move(detail);
    e.actorId = std::move(actorId);

    m_events.push_back(std::move(e));
    m_dispatcher.trigger(m_events.back());
}

std::vector<WorldEvent> WorldState::getRecentEvents(int limit) const
{
    if (limit <= 0)
        return {};

    const std::size_t n = std::min(m_events.size(), static_cast<std::size_t>(limit));
    return std::vector<WorldEvent>(m_events.end() - static_cast<std::ptrdiff_t>(n), m_events.end());
}

} // namespace realm::world

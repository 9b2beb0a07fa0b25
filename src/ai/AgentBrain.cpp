#include "realm/ai/AgentBrain.h"

#include "realm/world/WorldState.h"

namespace realm::ai {

using namespace realm::action;

const world::Entity* RuleBasedBrain::findTarget(const world::WorldState& world, const world::Entity& actor)
{
    for (const world::Entity* other : world.getEntitiesInArea(actor.area))
    {
        if (other->id != actor.id && other->isAlive())
            return other;
    }
    return nullptr;
}

std::vector<Action> RuleBasedBrain::decide(const world::WorldState& world, const std::string& actorId) const
{
    const world::Entity* actor = world.getEntity(actorId);
    if (!actor || !actor->isAlive())
        return {};

    if (actor->hp <= m_cfg.restThreshold)
        return {Rest{actorId, m_cfg.restHp, m_cfg.restMana}};

    const world::Entity* target = findTarget(world, *actor);
    if (target)
    {
        for (const auto& skillId : world.skills().keys())
        {
            const world::Skill* skill = world.getSkill(skillId);
            if (skill && skill->manaCost <= actor->mana)
                return {UseSkill{actorId, target->id, skill->id}};
        }

        return {Attack{actorId, target->id, m_cfg.attackDamage}};
    }

    if (world.areaResource(actor->area, m_cfg.gatherResource) > 0)
        return {Gather{actorId, m_cfg.gatherResource, m_cfg.gatherAmount}};

    const world::Area* area = world.getArea(actor->area);
    if (area && !area->neighbors.empty())
        return {Move{actorId, area->neighbors.front()}};

    return {Observe{actorId}};
}

} // namespace realm::ai

#include "realm/engine/GameEngine.h"

#include "realm/world/WorldState.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace realm::engine {

using action::Action;
using action::ActionResult;

void GameEngine::registerBrain(std::string actorId, std::unique_ptr<ai::AgentBrain> brain)
{
    const auto it = std::find_if(m_brains.begin(), m_brains.end(),
                                 [&](const auto& entry) { return entry.first == actorId; });
    if (it != m_brains.end())
    {
        it->second = std::move(brain);
        return;
    }

    m_brains.emplace_back(std::move(actorId), std::move(brain));
}

bool GameEngine::unregisterBrain(const std::string& actorId)
{
    const auto it = std::find_if(m_brains.begin(), m_brains.end(),
                                 [&](const auto& entry) { return entry.first == actorId; });
    if (it == m_brains.end())
        return false;

    m_brains.erase(it);
    return true;
}

ActionResult GameEngine::applyAction(const Action& a)
{
    if (!action::CanExecute(a, m_world))
    {
        const std::string& actorId = action::ActorOf(a);
        m_world.logEvent("action_invalid",
                         std::string("action_invalid:") + action::ActionKindName(a) + ":" + actorId,
                         actorId);
        return ActionResult::Error(action::errc::kInvalidAction);
    }

    return action::Execute(a, m_world);
}

std::vector<ActionResult> GameEngine::step()
{
    std::vector<ActionResult> results;
    std::size_t failures = 0;

    try
    {
        for (const auto& [actorId, brain] : m_brains)
        {
            if (!brain)
                continue;

            for (const Action& a : brain->decide(m_world, actorId))
            {
                results.push_back(applyAction(a));
                if (!results.back().ok())
                {
                    ++failures;
                    spdlog::debug("tick {}: {} {} failed ({})", m_world.clock(), actorId,
                                  action::ActionKindName(a), results.back().detail);
                }
            }
        }
    }
    catch (...)
    {
        // The tick still ends; whatever the actors did before the throw stands.
        spdlog::error("tick {} aborted after {} results", m_world.clock(), results.size());
        m_world.tick();
        throw;
    }

    spdlog::debug("tick {} done: {} results, {} failed", m_world.clock(), results.size(), failures);
    m_world.tick();
    return results;
}

} // namespace realm::engine

#pragma once

#include "realm/action/Action.h"
#include "realm/ai/AgentBrain.h"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace realm::world {
class WorldState;
}

namespace realm::engine {

// Drives the simulation one tick at a time.
//
// step():
//   for each registered actor, in registration order
//     ask its brain for actions, apply them in the order returned
//   advance the world clock once
//
// Actors later in the order see everything earlier actors did this tick.
// The engine holds the world by reference and never copies it.
class GameEngine
{
public:
    explicit GameEngine(world::WorldState& world) : m_world(world) {}

    GameEngine(const GameEngine&) = delete;
    GameEngine& operator=(const GameEngine&) = delete;

    // Registering an actor twice swaps its brain but keeps its turn order.
    void registerBrain(std::string actorId, std::unique_ptr<ai::AgentBrain> brain);
    bool unregisterBrain(const std::string& actorId);

    [[nodiscard]] std::size_t brainCount() const noexcept { return m_brains.size(); }

    // Rejected actions (CanExecute == false) leave an "action_invalid" event
    // and come back as {error, invalid_action}.
    action::ActionResult applyAction(const action::Action& a);

    // Advances the clock exactly once, also when a brain or skill effect
    // throws; the exception is rethrown after the tick.
    std::vector<action::ActionResult> step();

    [[nodiscard]] world::WorldState& world() noexcept { return m_world; }
    [[nodiscard]] const world::WorldState& world() const noexcept { return m_world; }

private:
    world::WorldState& m_world;
    std::vector<std::pair<std::string, std::unique_ptr<ai::AgentBrain>>> m_brains;
};

} // namespace realm::engine

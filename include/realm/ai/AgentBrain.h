#pragma once

#include "realm/action/Action.h"

#include <string>
#include <utility>
#include <vector>

namespace realm::world {
class WorldState;
struct Entity;
}

namespace realm::ai {

// Decision policy for one actor. decide() sees a read-only world and returns
// the actions to attempt this tick, in order (possibly none).
class AgentBrain
{
public:
    virtual ~AgentBrain() = default;

    [[nodiscard]] virtual std::vector<action::Action> decide(const world::WorldState& world,
                                                             const std::string& actorId) const = 0;
};

struct BrainConfig
{
    int restThreshold = 30;   // rest when hp <= this
    int restHp        = 10;
    int restMana      = 5;
    int attackDamage  = 8;
    std::string gatherResource = "wood";
    int gatherAmount  = 1;
};

// Reference policy. First matching rule wins, one action per tick:
//   1. missing or dead actor      -> nothing
//   2. hp <= restThreshold        -> Rest
//   3. affordable skill + target  -> UseSkill (first skill in registration order)
//   4. target                     -> Attack
//   5. gatherResource in area > 0 -> Gather
//   6. area has a neighbor        -> Move to the first one
//   7.                            -> Observe
// A target is a live entity in the same area other than the actor, taken in
// spawn order.
class RuleBasedBrain final : public AgentBrain
{
public:
    RuleBasedBrain() = default;
    explicit RuleBasedBrain(BrainConfig cfg) : m_cfg(std::move(cfg)) {}

    [[nodiscard]] std::vector<action::Action> decide(const world::WorldState& world,
                                                     const std::string& actorId) const override;

    [[nodiscard]] const BrainConfig& config() const noexcept { return m_cfg; }

private:
    [[nodiscard]] static const world::Entity* findTarget(const world::WorldState& world, const world::Entity& actor);

    BrainConfig m_cfg;
};

} // namespace realm::ai

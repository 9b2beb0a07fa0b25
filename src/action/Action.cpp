#include "realm/action/Action.h"

#include "realm/world/WorldState.h"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <sstream>

namespace realm::action {

using world::Entity;
using world::WorldState;

const char* ActionStatusName(ActionStatus s) noexcept
{
    switch (s)
    {
    case ActionStatus::Ok: return "ok";
    case ActionStatus::Error: return "error";
    }
    return "?";
}

namespace {

bool SameArea(const Entity* a, const Entity* b) noexcept
{
    return a && b && a->area == b->area;
}

bool IsNeighbor(const world::Area& from, const std::string& to)
{
    return std::find(from.neighbors.begin(), from.neighbors.end(), to) != from.neighbors.end();
}

// Stats are clamped in 64-bit so a huge delta cannot wrap past the bounds.
int ClampStat(std::int64_t value, int maxValue) noexcept
{
    return static_cast<int>(std::clamp<std::int64_t>(value, 0, maxValue));
}

// -----------------------------------------------------------------------------
// Preconditions
// -----------------------------------------------------------------------------
bool canExecute(const Move& m, const WorldState& w)
{
    const Entity* actor = w.getEntity(m.actorId);
    if (!actor || !w.getArea(m.destination))
        return false;

    const world::Area* here = w.getArea(actor->area);
    return here && IsNeighbor(*here, m.destination);
}

bool canExecute(const Attack& a, const WorldState& w)
{
    const Entity* actor = w.getEntity(a.actorId);
    const Entity* target = w.getEntity(a.targetId);
    return SameArea(actor, target) && target->isAlive();
}

bool canExecute(const Gather& g, const WorldState& w)
{
    const Entity* actor = w.getEntity(g.actorId);
    if (!actor || !w.getArea(actor->area))
        return false;
    return g.amount > 0 && w.areaResource(actor->area, g.resource) > 0;
}

bool canExecute(const Craft& c, const WorldState& w)
{
    const Entity* actor = w.getEntity(c.actorId);
    if (!actor)
        return false;

    return std::all_of(c.requirements.begin(), c.requirements.end(), [&](const auto& req) {
        return actor->itemCount(req.first) >= req.second;
    });
}

bool canExecute(const Chat& c, const WorldState& w)
{
    return w.getEntity(c.actorId) != nullptr;
}

bool canExecute(const Rest& r, const WorldState& w)
{
    return w.getEntity(r.actorId) != nullptr;
}

bool canExecute(const Trade& t, const WorldState& w)
{
    return SameArea(w.getEntity(t.actorId), w.getEntity(t.targetId));
}

bool canExecute(const UseSkill& u, const WorldState& w)
{
    const Entity* actor = w.getEntity(u.actorId);
    const world::Skill* skill = w.getSkill(u.skillId);
    return actor && skill && actor->mana >= skill->manaCost;
}

bool canExecute(const Observe& o, const WorldState& w)
{
    const Entity* actor = w.getEntity(o.actorId);
    return actor && w.getArea(actor->area);
}

bool canExecute(const AcceptQuest& q, const WorldState& w)
{
    return w.getEntity(q.actorId) && w.getQuest(q.questId);
}

// -----------------------------------------------------------------------------
// Effects
// -----------------------------------------------------------------------------
ActionResult execute(const Move& m, WorldState& w)
{
    Entity* actor = w.getEntity(m.actorId);
    if (!actor)
        return ActionResult::Error(errc::kActorNotFound);
    if (!w.getArea(m.destination))
        return ActionResult::Error(errc::kAreaNotFound);

    actor->area = m.destination;
    w.logEvent("move", actor->name + " moved to " + m.destination, actor->id);
    w.updateEntityQuestProgress(actor->id, "travel:" + m.destination);
    return ActionResult::Ok("moved_to:" + m.destination);
}

ActionResult execute(const Attack& a, WorldState& w)
{
    Entity* actor = w.getEntity(a.actorId);
    if (!actor)
        return ActionResult::Error(errc::kActorNotFound);

    Entity* target = w.getEntity(a.targetId);
    if (!target || target->area != actor->area)
        return ActionResult::Error(errc::kTargetNotFound);
    if (!target->isAlive())
        return ActionResult::Error(errc::kTargetDefeated);

    target->hp = ClampStat(std::int64_t{target->hp} - a.damage, world::kMaxHp);
    const bool defeated = !target->isAlive();

    std::string detail = actor->name + " hits " + target->name + " for " + std::to_string(a.damage);
    if (defeated)
        detail += ", " + target->name + " is defeated";
    w.logEvent("attack", std::move(detail), actor->id);

    if (defeated)
    {
        w.updateEntityQuestProgress(actor->id, "defeat:" + target->id);
        for (const auto& tag : target->tags)
            w.updateEntityQuestProgress(actor->id, "defeat_tag:" + tag);
    }

    return ActionResult::Ok("hit:" + target->id + ":" + std::to_string(a.damage));
}

ActionResult execute(const Gather& g, WorldState& w)
{
    Entity* actor = w.getEntity(g.actorId);
    if (!actor)
        return ActionResult::Error(errc::kActorNotFound);
    if (!w.getArea(actor->area))
        return ActionResult::Error(errc::kAreaNotFound);
    if (g.amount <= 0)
        return ActionResult::Error(errc::kInvalidAmount);

    const int available = w.areaResource(actor->area, g.resource);
    if (available <= 0)
        return ActionResult::Error(errc::kResourceDepleted);

    // Pre-clamp so the area never reports more taken than it had.
    const int gathered = std::min(g.amount, available);
    w.adjustAreaResource(actor->area, g.resource, -gathered);
    int& held = actor->inventory[g.resource];
    held = world::SaturatingAdd(held, gathered);

    w.logEvent("gather", actor->name + " gathered " + std::to_string(gathered) + " " + g.resource, actor->id);
    w.updateEntityQuestProgress(actor->id, "gather:" + g.resource, gathered);
    return ActionResult::Ok("gathered:" + g.resource + ":" + std::to_string(gathered));
}

ActionResult execute(const Craft& c, WorldState& w)
{
    Entity* actor = w.getEntity(c.actorId);
    if (!actor)
        return ActionResult::Error(errc::kActorNotFound);

    // All-or-nothing: verify every requirement before touching the inventory.
    for (const auto& [item, qty] : c.requirements)
    {
        if (actor->itemCount(item) < qty)
            return ActionResult::Error(errc::kMissingMaterials);
    }

    for (const auto& [item, qty] : c.requirements)
    {
        if (qty > 0)
            actor->inventory[item] -= qty;
    }
    int& made = actor->inventory[c.output];
    made = world::SaturatingAdd(made, 1);

    w.logEvent("craft", actor->name + " crafted " + c.output, actor->id);
    w.updateEntityQuestProgress(actor->id, "craft:" + c.output);
    return ActionResult::Ok("crafted:" + c.output);
}

ActionResult execute(const Chat& c, WorldState& w)
{
    const Entity* actor = w.getEntity(c.actorId);
    if (!actor)
        return ActionResult::Error(errc::kActorNotFound);

    w.logEvent("chat", actor->name + " says: " + c.message, actor->id);
    return ActionResult::Ok("chat:" + actor->name + ":" + c.message);
}

ActionResult execute(const Rest& r, WorldState& w)
{
    Entity* actor = w.getEntity(r.actorId);
    if (!actor)
        return ActionResult::Error(errc::kActorNotFound);

    actor->hp = ClampStat(std::int64_t{actor->hp} + r.hpRestore, world::kMaxHp);
    actor->mana = ClampStat(std::int64_t{actor->mana} + r.manaRestore, world::kMaxMana);

    w.logEvent("rest", actor->name + " rests", actor->id);
    return ActionResult::Ok("rested:hp+" + std::to_string(r.hpRestore) + ":mana+" + std::to_string(r.manaRestore));
}

ActionResult execute(const Trade& t, WorldState& w)
{
    Entity* actor = w.getEntity(t.actorId);
    Entity* target = w.getEntity(t.targetId);
    if (!actor || !target)
        return ActionResult::Error(errc::kEntityNotFound);
    if (t.amount <= 0)
        return ActionResult::Error(errc::kInvalidAmount);
    if (actor->itemCount(t.item) < t.amount)
        return ActionResult::Error(errc::kInsufficientItems);

    actor->inventory[t.item] -= t.amount;
    int& received = target->inventory[t.item];
    received = world::SaturatingAdd(received, t.amount);

    w.logEvent("trade",
               actor->name + " traded " + std::to_string(t.amount) + " " + t.item + " to " + target->name,
               actor->id);
    return ActionResult::Ok("traded:" + t.item + ":" + std::to_string(t.amount));
}

ActionResult execute(const UseSkill& u, WorldState& w)
{
    Entity* actor = w.getEntity(u.actorId);
    if (!actor)
        return ActionResult::Error(errc::kActorNotFound);

    const world::Skill* skill = w.getSkill(u.skillId);
    if (!skill)
        return ActionResult::Error(errc::kSkillMissing);
    if (actor->mana < skill->manaCost)
        return ActionResult::Error(errc::kInsufficientMana);

    // The effect may re-register skills; work from a copy of the record.
    const world::Skill used = *skill;
    const std::string actorId = actor->id;
    const std::string actorName = actor->name;

    Entity* target = u.targetId ? w.getEntity(*u.targetId) : nullptr;
    const int manaBefore = actor->mana;
    actor->mana = ClampStat(std::int64_t{actor->mana} - used.manaCost, world::kMaxMana);

    std::string tag = "no_effect";
    if (used.effect)
    {
        try
        {
            tag = used.effect(w, *actor, target);
        }
        catch (...)
        {
            // Refund; the failure is the caller's to handle.
            if (Entity* payer = w.getEntity(actorId))
                payer->mana = manaBefore;
            throw;
        }
    }

    w.logEvent("use_skill", actorName + " used " + used.name + " (" + tag + ")", actorId);
    return ActionResult::Ok("skill:" + used.id + ":" + tag);
}

ActionResult execute(const Observe& o, WorldState& w)
{
    const Entity* actor = w.getEntity(o.actorId);
    if (!actor)
        return ActionResult::Error(errc::kActorNotFound);

    const world::Area* area = w.getArea(actor->area);
    if (!area)
        return ActionResult::Error(errc::kAreaNotFound);

    std::ostringstream oss;
    oss << "area:" << area->name << ";entities:";

    bool first = true;
    for (const Entity* other : w.getEntitiesInArea(area->name))
    {
        if (other->id == actor->id)
            continue;
        oss << (first ? "" : ",") << other->id;
        first = false;
    }

    oss << ";resources:";
    first = true;
    for (const auto& [kind, qty] : area->resources)
    {
        oss << (first ? "" : ",") << kind << '=' << qty;
        first = false;
    }

    std::string description = oss.str();
    w.logEvent("observe", description, actor->id);
    return ActionResult::Ok(std::move(description));
}

ActionResult execute(const AcceptQuest& q, WorldState& w)
{
    if (!w.assignQuest(q.actorId, q.questId))
        return ActionResult::Error(errc::kQuestUnavailable);

    const Entity* actor = w.getEntity(q.actorId);
    const world::Quest* quest = w.getQuest(q.questId);
    w.logEvent("quest_accept", actor->name + " accepted " + quest->title, actor->id);
    return ActionResult::Ok("quest_accepted:" + q.questId);
}

} // namespace

const char* ActionKindName(const Action& a) noexcept
{
    static constexpr const char* kNames[] = {
        "Move", "Attack", "Gather", "Craft", "Chat", "Rest", "Trade", "UseSkill", "Observe", "AcceptQuest",
    };
    static_assert(std::size(kNames) == std::variant_size_v<Action>, "ActionKindName out of sync with Action");

    const std::size_t idx = a.index();
    return idx < std::size(kNames) ? kNames[idx] : "?";
}

const std::string& ActorOf(const Action& a)
{
    return std::visit([](const auto& cmd) -> const std::string& { return cmd.actorId; }, a);
}

bool CanExecute(const Action& a, const WorldState& world)
{
    return std::visit([&](const auto& cmd) { return canExecute(cmd, world); }, a);
}

ActionResult Execute(const Action& a, WorldState& world)
{
    return std::visit([&](const auto& cmd) { return execute(cmd, world); }, a);
}

} // namespace realm::action

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace realm::world {

class WorldState;

inline constexpr int kMaxHp   = 100;
inline constexpr int kMaxMana = 50;

// a + b pinned to the int range. Quantities and counters are caller-supplied
// and must never wrap.
[[nodiscard]] int SaturatingAdd(int a, int b) noexcept;

// Named map node. Neighbors are one-way edges; a two-way road needs both
// areas to list each other.
struct Area
{
    std::string name;
    std::string description;
    std::vector<std::string> neighbors;

    // resource kind -> quantity available for gathering (never negative)
    std::map<std::string, int> resources;
};

struct QuestProgress
{
    std::string questId;
    std::map<std::string, int> progress;
    bool completed = false;
};

// Any actor: player, NPC or creature.
struct Entity
{
    std::string id;
    std::string name;
    std::string area;

    int hp   = kMaxHp;
    int mana = kMaxMana;

    std::map<std::string, int> inventory;
    std::vector<std::string> tags;

    // quest id -> progress; at most one entry per quest
    std::map<std::string, QuestProgress> questLog;

    [[nodiscard]] bool isAlive() const noexcept { return hp > 0; }
    [[nodiscard]] bool hasTag(const std::string& tag) const;
    [[nodiscard]] int itemCount(const std::string& item) const;
};

struct Quest
{
    std::string id;
    std::string title;
    std::string description;

    // objective key ("gather:wood", "travel:Forest", ...) -> required count
    std::map<std::string, int> objectives;

    [[nodiscard]] bool isSatisfiedBy(const QuestProgress& p) const;
};

struct WorldEvent
{
    std::uint64_t tick = 0;
    std::string kind;
    std::string detail;
    std::optional<std::string> actorId;
};

// Effect invoked by UseSkill after mana has been paid. `target` is null when
// the skill was cast without one (or the named target does not exist).
// Returns a short result tag that ends up in the action detail.
using SkillEffect = std::function<std::string(WorldState& world, Entity& caster, Entity* target)>;

struct Skill
{
    std::string id;
    std::string name;
    int manaCost = 0;
    SkillEffect effect;
};

struct ItemDefinition
{
    std::string id;
    std::string name;
    std::string description;
    bool stackable = true;
};

struct Faction
{
    std::string id;
    std::string name;
    std::string description;

    // entity id -> standing
    std::map<std::string, int> reputation;
};

} // namespace realm::world

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace realm::world {
class WorldState;
}

namespace realm::action {

enum class ActionStatus : std::uint8_t {
    Ok = 0,
    Error,
};

[[nodiscard]] const char* ActionStatusName(ActionStatus s) noexcept;

struct ActionResult
{
    ActionStatus status = ActionStatus::Ok;
    std::string detail;

    [[nodiscard]] bool ok() const noexcept { return status == ActionStatus::Ok; }

    [[nodiscard]] static ActionResult Ok(std::string detail) { return {ActionStatus::Ok, std::move(detail)}; }
    [[nodiscard]] static ActionResult Error(std::string detail) { return {ActionStatus::Error, std::move(detail)}; }
};

// Error codes reported in ActionResult::detail.
namespace errc {
inline constexpr const char* kActorNotFound     = "actor_not_found";
inline constexpr const char* kTargetNotFound    = "target_not_found";
inline constexpr const char* kTargetDefeated    = "target_defeated";
inline constexpr const char* kEntityNotFound    = "entity_not_found";
inline constexpr const char* kAreaNotFound      = "area_not_found";
inline constexpr const char* kResourceDepleted  = "resource_depleted";
inline constexpr const char* kMissingMaterials  = "missing_materials";
inline constexpr const char* kInsufficientItems = "insufficient_items";
inline constexpr const char* kInvalidAmount     = "invalid_amount";
inline constexpr const char* kSkillMissing      = "skill_missing";
inline constexpr const char* kInsufficientMana  = "insufficient_mana";
inline constexpr const char* kQuestUnavailable  = "quest_unavailable";
inline constexpr const char* kInvalidAction     = "invalid_action";
} // namespace errc

// -----------------------------------------------------------------------------
// Commands. Each one names its actor; everything else is a parameter supplied
// by whoever built it (usually a brain).
// -----------------------------------------------------------------------------
struct Move
{
    std::string actorId;
    std::string destination;
};

struct Attack
{
    std::string actorId;
    std::string targetId;
    int damage = 10;
};

struct Gather
{
    std::string actorId;
    std::string resource;
    int amount = 1;
};

struct Craft
{
    std::string actorId;
    std::map<std::string, int> requirements;
    std::string output;
};

struct Chat
{
    std::string actorId;
    std::string message;
};

struct Rest
{
    std::string actorId;
    int hpRestore = 10;
    int manaRestore = 5;
};

struct Trade
{
    std::string actorId;
    std::string targetId;
    std::string item;
    int amount = 1;
};

struct UseSkill
{
    std::string actorId;
    std::optional<std::string> targetId;
    std::string skillId;
};

struct Observe
{
    std::string actorId;
};

struct AcceptQuest
{
    std::string actorId;
    std::string questId;
};

using Action = std::variant<Move, Attack, Gather, Craft, Chat, Rest, Trade, UseSkill, Observe, AcceptQuest>;

// "Move", "Attack", ... (used in action_invalid audit events)
[[nodiscard]] const char* ActionKindName(const Action& a) noexcept;

[[nodiscard]] const std::string& ActorOf(const Action& a);

// Side-effect free gate. The engine only calls Execute() when this is true.
[[nodiscard]] bool CanExecute(const Action& a, const world::WorldState& world);

// Applies the action. On error nothing in the world has changed.
ActionResult Execute(const Action& a, world::WorldState& world);

} // namespace realm::action

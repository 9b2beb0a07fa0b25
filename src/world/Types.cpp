#include "realm/world/Types.h"

#include <algorithm>
#include <cstdint>
#include <limits>

namespace realm::world {

int SaturatingAdd(int a, int b) noexcept
{
    const std::int64_t sum = std::int64_t{a} + b;
    return static_cast<int>(std::clamp<std::int64_t>(sum, std::numeric_limits<int>::min(),
                                                     std::numeric_limits<int>::max()));
}

bool Entity::hasTag(const std::string& tag) const
{
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

int Entity::itemCount(const std::string& item) const
{
    const auto it = inventory.find(item);
    return it == inventory.end() ? 0 : it->second;
}

bool Quest::isSatisfiedBy(const QuestProgress& p) const
{
    return std::all_of(objectives.begin(), objectives.end(), [&](const auto& objective) {
        const auto it = p.progress.find(objective.first);
        const int have = it == p.progress.end() ? 0 : it->second;
        return have >= objective.second;
    });
}

} // namespace realm::world

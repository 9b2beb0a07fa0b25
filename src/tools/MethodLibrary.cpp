#include "realm/tools/MethodLibrary.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace realm::tools {

void MethodLibrary::registerMethod(std::string name, std::string description, std::vector<std::string> tags,
                                   MethodHandler handler)
{
    MethodEntry e;
    e.name = name;
    e.description = std::move(description);
    e.tags = std::move(tags);
    e.handler = std::move(handler);

    if (m_methods.contains(name))
        spdlog::warn("method '{}' re-registered", name);
    m_methods.put(name, std::move(e));
}

std::vector<const MethodEntry*> MethodLibrary::listByTag(const std::string& tag) const
{
    std::vector<const MethodEntry*> out;
    m_methods.forEach([&](const MethodEntry& e) {
        if (std::find(e.tags.begin(), e.tags.end(), tag) != e.tags.end())
            out.push_back(&e);
    });
    return out;
}

nlohmann::json MethodLibrary::run(const std::string& name, world::WorldState& world, const nlohmann::json& args) const
{
    const MethodEntry* e = m_methods.find(name);
    if (!e || !e->handler)
        throw UnknownMethod(name);

    // Copy: the handler may register methods and overwrite its own entry.
    const MethodHandler handler = e->handler;
    return handler(world, args);
}

} // namespace realm::tools

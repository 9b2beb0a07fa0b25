#pragma once

#include "realm/world/Registry.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace realm::world {
class WorldState;
}

namespace realm::tools {

// Thrown by MethodLibrary::run for a name nobody registered. That is a wiring
// bug in the caller, not a game condition, so it is not folded into a result.
class UnknownMethod : public std::runtime_error
{
public:
    explicit UnknownMethod(const std::string& name)
        : std::runtime_error("Unknown method: " + name), m_name(name) {}

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

private:
    std::string m_name;
};

using MethodHandler = std::function<nlohmann::json(world::WorldState& world, const nlohmann::json& args)>;

struct MethodEntry
{
    std::string name;
    std::string description;
    std::vector<std::string> tags;
    MethodHandler handler;
};

// Registry of ad hoc mechanics and AI tactics, looked up by name or tag.
class MethodLibrary
{
public:
    // Overwrites an existing entry with the same name.
    void registerMethod(std::string name, std::string description, std::vector<std::string> tags,
                        MethodHandler handler);

    [[nodiscard]] bool contains(const std::string& name) const { return m_methods.contains(name); }
    [[nodiscard]] const MethodEntry* find(const std::string& name) const { return m_methods.find(name); }
    [[nodiscard]] std::size_t size() const noexcept { return m_methods.size(); }

    // Registration order.
    [[nodiscard]] std::vector<const MethodEntry*> listByTag(const std::string& tag) const;

    nlohmann::json run(const std::string& name, world::WorldState& world,
                       const nlohmann::json& args = nlohmann::json::object()) const;

private:
    world::Registry<MethodEntry> m_methods;
};

} // namespace realm::tools

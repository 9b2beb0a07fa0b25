#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace realm::world {

// String-keyed store that iterates in first-insertion order.
//
// Records live in node-based storage, so pointers and references returned by
// find() stay valid across later insertions. Overwriting an existing key
// replaces the record in place and keeps its original position.
template <class T>
class Registry
{
public:
    T& put(const std::string& key, T value)
    {
        const auto it = m_items.find(key);
        if (it != m_items.end())
        {
            it->second = std::move(value);
            return it->second;
        }

        m_order.push_back(key);
        return m_items.emplace(key, std::move(value)).first->second;
    }

    [[nodiscard]] T* find(const std::string& key)
    {
        const auto it = m_items.find(key);
        return it == m_items.end() ? nullptr : &it->second;
    }

    [[nodiscard]] const T* find(const std::string& key) const
    {
        const auto it = m_items.find(key);
        return it == m_items.end() ? nullptr : &it->second;
    }

    [[nodiscard]] bool contains(const std::string& key) const { return m_items.count(key) != 0; }
    [[nodiscard]] std::size_t size() const noexcept { return m_order.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_order.empty(); }

    [[nodiscard]] const std::vector<std::string>& keys() const noexcept { return m_order; }

    template <class Fn>
    void forEach(Fn&& fn)
    {
        for (const auto& key : m_order)
            fn(m_items.at(key));
    }

    template <class Fn>
    void forEach(Fn&& fn) const
    {
        for (const auto& key : m_order)
            fn(m_items.at(key));
    }

private:
    std::unordered_map<std::string, T> m_items;
    std::vector<std::string> m_order;
};

} // namespace realm::world

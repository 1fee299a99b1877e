// File: src/bundle/NameSet.hpp
// Purpose: Set of binding names that iterates in first-insertion order.
// Key invariants: Each name appears once; iteration order is insertion order.
// Ownership/Lifetime: Owns copies of the names.
// Links: docs/codemap.md
#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace shake::bundle
{

/// @brief Ordered, duplicate-free collection of names.
/// @details Statement analysis discovers names in source order; expansion
///          walks them in that same order so bundles are deterministic.
class NameSet
{
  public:
    using const_iterator = std::vector<std::string>::const_iterator;

    /// @brief Add @p name unless present.
    /// @return True when the name was newly added.
    bool insert(const std::string &name)
    {
        if (!index_.insert(name).second)
            return false;
        order_.push_back(name);
        return true;
    }

    bool contains(const std::string &name) const
    {
        return index_.count(name) != 0;
    }

    std::size_t size() const
    {
        return order_.size();
    }

    bool empty() const
    {
        return order_.empty();
    }

    const_iterator begin() const
    {
        return order_.begin();
    }

    const_iterator end() const
    {
        return order_.end();
    }

    /// @brief Names in insertion order.
    const std::vector<std::string> &names() const
    {
        return order_;
    }

  private:
    std::vector<std::string> order_;
    std::unordered_set<std::string> index_;
};

} // namespace shake::bundle

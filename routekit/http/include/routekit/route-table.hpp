#pragma once

#include <algorithm>
#include <cstddef>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "routekit/route-entry.hpp"

namespace routekit {

// Append-only ordered list of routes registered under the same verb.
// Insertion order is kept. The same path may appear several times; which one wins is up to the dispatcher.
template <class Action>
class RouteTable {
 public:
  using value_type = RouteEntry<Action>;
  using const_iterator = typename std::vector<value_type>::const_iterator;

  void append(value_type entry) { _entries.push_back(std::move(entry)); }

  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }

  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

  [[nodiscard]] const value_type& operator[](std::size_t pos) const { return _entries[pos]; }

  [[nodiscard]] const_iterator begin() const noexcept { return _entries.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _entries.end(); }

  [[nodiscard]] std::span<const value_type> entries() const noexcept { return _entries; }

  // Tells whether at least one entry has exactly this (final) path.
  [[nodiscard]] bool contains(std::string_view path) const {
    return std::ranges::any_of(_entries, [path](const value_type& entry) { return entry.path() == path; });
  }

 private:
  std::vector<value_type> _entries;
};

}  // namespace routekit

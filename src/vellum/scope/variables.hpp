#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "vellum/scope/value.hpp"

namespace vellum::scope {

using variable_map = std::map<std::string, value, std::less<>>;

/**
 * In-memory variable provider.
 *
 * Values are owned; copying a provider yields an independent environment, so a
 * clone can be mutated without touching the provider it was copied from.
 */
class variables {
 public:
  variables() = default;
  explicit variables(variable_map initial) : values_(std::move(initial)) {}

  void add(std::string_view key, value v) {
    auto it = values_.find(key);
    if (it != values_.end()) {
      it->second = std::move(v);
      return;
    }
    values_.emplace(std::string(key), std::move(v));
  }

  // Returns undefined for unknown keys.
  value get(std::string_view key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
      return make_undefined();
    }
    return it->second;
  }

  const value * find(std::string_view key) const noexcept {
    auto it = values_.find(key);
    return it == values_.end() ? nullptr : &it->second;
  }

  bool exists(std::string_view key) const noexcept { return values_.find(key) != values_.end(); }

  bool remove(std::string_view key) {
    auto it = values_.find(key);
    if (it == values_.end()) {
      return false;
    }
    values_.erase(it);
    return true;
  }

  size_t size() const noexcept { return values_.size(); }

  std::vector<std::string> names() const {
    std::vector<std::string> out;
    out.reserve(values_.size());
    for (const auto & entry : values_) {
      out.push_back(entry.first);
    }
    return out;
  }

  const variable_map & all() const noexcept { return values_; }

  variables clone() const { return *this; }

  // New provider seeded from this one, with `overlay` entries taking precedence.
  variables scope_copy(const variable_map & overlay) const {
    variables copy = *this;
    for (const auto & entry : overlay) {
      copy.add(entry.first, entry.second);
    }
    return copy;
  }

 private:
  variable_map values_ = {};
};

}  // namespace vellum::scope

#pragma once

#include <compare>
#include <cstdint>
#include <string>

#include "vellum/vellum.h"

namespace vellum::view {

struct node;

enum class rendering_kind : uint8_t {
  template_ = VELLUM_RENDERING_TEMPLATE,
  partial = VELLUM_RENDERING_PARTIAL,
  layout = VELLUM_RENDERING_LAYOUT
};

inline constexpr const char * kind_name(const rendering_kind kind) noexcept {
  switch (kind) {
    case rendering_kind::template_:
      return "template";
    case rendering_kind::partial:
      return "partial";
    case rendering_kind::layout:
      return "layout";
  }
  return "unknown";
}

// `action` is empty for layouts and partials.
struct resolution_key {
  rendering_kind kind = rendering_kind::template_;
  std::string name = {};
  std::string action = {};

  auto operator<=>(const resolution_key &) const = default;
  bool operator==(const resolution_key &) const = default;
};

/**
 * Outcome of resolving a template by name.
 *
 * Exactly one of three shapes:
 * - `err == VELLUM_OK`, `passthrough == false`: `parsed` is the cached tree.
 * - `err == VELLUM_OK`, `passthrough == true`: `source` holds the raw content
 *   that must be returned unevaluated.
 * - `err != VELLUM_OK`: resolution failed, `parsed` is null.
 */
struct resolution {
  int32_t err = VELLUM_OK;
  bool passthrough = false;
  std::string source = {};
  const node * parsed = nullptr;
};

}  // namespace vellum::view

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "vellum/vellum.h"
#include "vellum/view/session.hpp"
#include "vellum/view/types.hpp"

namespace vellum::view::render::event {
struct render;
}  // namespace vellum::view::render::event

namespace vellum::view::render::action {

inline constexpr std::string_view k_layout_child = "layoutName";
inline constexpr std::string_view k_layout_argument = "name";

struct context {
  view::session * session = nullptr;

  const event::render * request = nullptr;
  std::string action_name = {};

  resolution template_resolved = {};
  std::string layout_name = {};
  resolution layout_resolved = {};
  std::string output = {};

  int32_t phase_error = VELLUM_OK;
  int32_t last_error = VELLUM_OK;
};

}  // namespace vellum::view::render::action

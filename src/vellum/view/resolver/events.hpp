#pragma once

#include <cstdint>
#include <string_view>

#include "vellum/view/types.hpp"

namespace vellum::view::resolver::event {

struct resolve {
  rendering_kind kind = rendering_kind::template_;
  // Controller name for templates, layout or partial name otherwise.
  std::string_view name = {};
  std::string_view action = {};
  view::resolution * resolution_out = nullptr;
  int32_t * error_out = nullptr;
};

}  // namespace vellum::view::resolver::event

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace vellum::view::render::event {

struct render {
  // Overrides the controller action when non-empty.
  std::string_view action_name = {};
  std::string * output_out = nullptr;
  bool * passthrough_out = nullptr;
  int32_t * error_out = nullptr;
};

}  // namespace vellum::view::render::event

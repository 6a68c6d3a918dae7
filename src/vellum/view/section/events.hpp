#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "vellum/scope/variables.hpp"

namespace vellum::view::section::event {

struct render_section {
  std::string_view section_name = {};
  // Overlaid on a clone of the current scope; unused inside a layout.
  const scope::variable_map * variables = nullptr;
  bool ignore_unknown = false;
  std::string * output_out = nullptr;
  bool * passthrough_out = nullptr;
  int32_t * error_out = nullptr;
};

}  // namespace vellum::view::section::event

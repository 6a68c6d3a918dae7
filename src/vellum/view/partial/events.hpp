#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "vellum/scope/variables.hpp"

namespace vellum::view::partial::event {

struct render_partial {
  std::string_view partial_name = {};
  // When set, only this section of the partial is rendered.
  std::optional<std::string_view> section_name = {};
  const scope::variable_map * variables = nullptr;
  bool ignore_unknown = false;
  std::string * output_out = nullptr;
  bool * passthrough_out = nullptr;
  int32_t * error_out = nullptr;
};

}  // namespace vellum::view::partial::event

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "vellum/scope/variables.hpp"
#include "vellum/vellum.h"
#include "vellum/view/rendering_context.hpp"
#include "vellum/view/session.hpp"
#include "vellum/view/types.hpp"

namespace vellum::view::partial::event {
struct render_partial;
}  // namespace vellum::view::partial::event

namespace vellum::view::partial::action {

struct context {
  view::session * session = nullptr;

  const event::render_partial * request = nullptr;
  std::string partial_name = {};
  std::optional<std::string> section_name = {};
  const scope::variable_map * variables = nullptr;
  bool ignore_unknown = false;

  // Partials never share the caller's scope object.
  std::unique_ptr<rendering_context> owned_scope = {};

  resolution resolved = {};
  std::string output = {};
  bool nested_passthrough = false;
  int32_t nested_error = VELLUM_OK;

  int32_t phase_error = VELLUM_OK;
  int32_t last_error = VELLUM_OK;
};

}  // namespace vellum::view::partial::action

#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "vellum/vellum.h"
#include "vellum/view/rendering_context.hpp"
#include "vellum/view/session.hpp"
#include "vellum/view/types.hpp"

namespace vellum::view::section::event {
struct render_section;
}  // namespace vellum::view::section::event

namespace vellum::view::section::action {

struct context {
  view::session * session = nullptr;

  const event::render_section * request = nullptr;
  std::string section_name = {};
  bool ignore_unknown = false;

  rendering_kind next_kind = rendering_kind::template_;
  rendering_context * scope = nullptr;
  // Set when the section renders in a clone rather than the caller's scope.
  std::unique_ptr<rendering_context> owned_scope = {};

  resolution resolved = {};
  const node * section = nullptr;
  std::string output = {};

  int32_t phase_error = VELLUM_OK;
  int32_t last_error = VELLUM_OK;
};

}  // namespace vellum::view::section::action

#pragma once

#include <string>

#include "vellum/scope/variables.hpp"
#include "vellum/view/error_handler.hpp"

namespace vellum::view {

class template_view;

/**
 * Variable environment plus the request-level settings evaluation needs.
 *
 * A plain value: copying it clones the variables, while the collaborator
 * pointers stay shared.
 */
struct rendering_context {
  std::string controller_name = "Default";
  std::string controller_action = "Default";
  scope::variables variables = {};
  error_handler * errors = nullptr;
  template_view * view = nullptr;

  rendering_context clone() const { return *this; }
};

}  // namespace vellum::view

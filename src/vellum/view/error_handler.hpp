#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "vellum/vellum.h"

namespace vellum::view {

/**
 * Last-resort renderer for recoverable view errors.
 *
 * Implementations must always return some output and must not throw.
 */
struct error_handler {
  virtual ~error_handler() = default;
  virtual std::string handle_view_error(int32_t err, std::string_view message) = 0;
};

// Logs the error and renders it inline.
struct tolerant_error_handler final : error_handler {
  std::string handle_view_error(const int32_t err, std::string_view message) override {
    spdlog::warn("view error ({}): {}", vellum_status_name(err), message);
    return fmt::format("View error: {}", message);
  }
};

// Shared by every context that names no handler, across all views.
inline tolerant_error_handler & default_error_handler() noexcept {
  static tolerant_error_handler handler;
  return handler;
}

}  // namespace vellum::view

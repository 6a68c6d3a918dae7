#pragma once

#include <cctype>
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "vellum/vellum.h"
#include "vellum/view/error_handler.hpp"
#include "vellum/view/rendering_context.hpp"
#include "vellum/view/session.hpp"

namespace vellum::view::detail {

// Writes the final outcome of an entry-point request through its out pointers.
template <class Request>
inline void publish(const Request * request,
                    std::string output,
                    const bool passthrough,
                    const int32_t err) {
  if (request == nullptr) {
    return;
  }
  if (request->output_out != nullptr) {
    *request->output_out = std::move(output);
  }
  if (request->passthrough_out != nullptr) {
    *request->passthrough_out = passthrough;
  }
  if (request->error_out != nullptr) {
    *request->error_out = err;
  }
}

inline std::string report_view_error(rendering_context & ctx,
                                     const int32_t err,
                                     std::string_view message) {
  error_handler * errors = ctx.errors != nullptr ? ctx.errors : &default_error_handler();
  return errors->handle_view_error(err, message);
}

inline std::string describe(const int32_t err, std::string_view what, std::string_view name) {
  return fmt::format("{} '{}': {}", what, name, vellum_status_name(err));
}

// Unpaired stop_rendering means the stack no longer mirrors the call depth.
inline void stop_rendering_or_terminate(session & s) noexcept {
  if (s.stop_rendering() != VELLUM_OK) {
    spdlog::critical("rendering stack underflow");
    std::terminate();
  }
}

/**
 * Pops the frame of the running entry point if evaluation unwinds past it.
 *
 * Released once evaluation returns, after which the machine's `popping` state
 * owns the pop.
 */
class frame_guard {
 public:
  explicit frame_guard(session & s) noexcept : session_(&s) {}
  ~frame_guard() {
    if (session_ != nullptr) {
      stop_rendering_or_terminate(*session_);
    }
  }

  frame_guard(const frame_guard &) = delete;
  frame_guard & operator=(const frame_guard &) = delete;

  void release() noexcept { session_ = nullptr; }

 private:
  session * session_ = nullptr;
};

// Runs `body` on a pushed frame. Standard exceptions become
// VELLUM_ERR_EVALUATION; anything else propagates with the frame popped.
template <class Body>
inline int32_t evaluate_on_frame(session & s, Body && body) {
  frame_guard guard{s};
  int32_t err = VELLUM_OK;
  try {
    err = body();
  } catch (const std::exception & e) {
    spdlog::error("evaluation threw: {}", e.what());
    err = VELLUM_ERR_EVALUATION;
  }
  guard.release();
  return err;
}

inline std::string upper_first(std::string_view text) {
  std::string out(text);
  if (!out.empty()) {
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
  }
  return out;
}

}  // namespace vellum::view::detail

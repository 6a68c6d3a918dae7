#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "vellum/vellum.h"
#include "vellum/view/rendering_context.hpp"
#include "vellum/view/resolver/sm.hpp"
#include "vellum/view/types.hpp"

namespace vellum::view {

inline constexpr size_t k_max_render_depth = 64;

struct frame {
  rendering_kind kind = rendering_kind::template_;
  const node * parsed = nullptr;
  rendering_context * scope = nullptr;
};

/**
 * Rendering stack of one view.
 *
 * Frames borrow their template and scope: trees belong to the resolver cache,
 * scopes to the base context or to the entry machine that cloned them. Every
 * start_rendering must be paired with exactly one stop_rendering.
 */
class session {
 public:
  session(resolver::sm & resolver, rendering_context & base) noexcept
      : resolver_(&resolver), base_(&base) {}

  session(const session &) = delete;
  session & operator=(const session &) = delete;

  void start_rendering(const rendering_kind kind,
                       const node * parsed,
                       rendering_context * scope) {
    frames_.push_back(frame{kind, parsed, scope});
  }

  int32_t stop_rendering() noexcept {
    if (frames_.empty()) {
      return VELLUM_ERR_STACK_UNDERFLOW;
    }
    frames_.pop_back();
    return VELLUM_OK;
  }

  rendering_kind current_kind() const noexcept {
    return frames_.empty() ? rendering_kind::template_ : frames_.back().kind;
  }

  rendering_context & current_context() noexcept {
    if (frames_.empty() || frames_.back().scope == nullptr) {
      return *base_;
    }
    return *frames_.back().scope;
  }

  /**
   * Template of the top frame, or the controller/action template of the
   * current context resolved on demand. Resolving does not push a frame.
   */
  int32_t current_template(resolution & out) {
    if (!frames_.empty() && frames_.back().parsed != nullptr) {
      out = resolution{.parsed = frames_.back().parsed};
      return VELLUM_OK;
    }
    const rendering_context & ctx = current_context();
    int32_t err = VELLUM_OK;
    resolver::event::resolve request{
      .kind = rendering_kind::template_,
      .name = ctx.controller_name,
      .action = ctx.controller_action,
      .resolution_out = &out,
      .error_out = &err,
    };
    if (!resolver_->process_event(request)) {
      out = resolution{.err = VELLUM_ERR_BACKEND};
      return VELLUM_ERR_BACKEND;
    }
    return err;
  }

  int32_t resolve(const rendering_kind kind, std::string_view name, resolution & out) {
    int32_t err = VELLUM_OK;
    resolver::event::resolve request{
      .kind = kind,
      .name = name,
      .resolution_out = &out,
      .error_out = &err,
    };
    if (!resolver_->process_event(request)) {
      out = resolution{.err = VELLUM_ERR_BACKEND};
      return VELLUM_ERR_BACKEND;
    }
    return err;
  }

  rendering_context & base_context() noexcept { return *base_; }

  size_t depth() const noexcept { return frames_.size(); }
  bool empty() const noexcept { return frames_.empty(); }
  const frame & top() const noexcept { return frames_.back(); }

 private:
  resolver::sm * resolver_ = nullptr;
  rendering_context * base_ = nullptr;
  std::vector<frame> frames_ = {};
};

}  // namespace vellum::view

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "vellum/scope/value.hpp"
#include "vellum/scope/variables.hpp"
#include "vellum/vellum.h"
#include "vellum/view/error_handler.hpp"
#include "vellum/view/partial/sm.hpp"
#include "vellum/view/render/sm.hpp"
#include "vellum/view/rendering_context.hpp"
#include "vellum/view/resolver/sm.hpp"
#include "vellum/view/section/sm.hpp"
#include "vellum/view/session.hpp"

namespace vellum::view {

/**
 * One view: a base rendering context, its rendering stack, and the three
 * render entry points.
 *
 * Each entry point runs a fresh machine on the caller's stack, so nodes may
 * call back into the view from `evaluate` through `rendering_context::view`.
 * The resolver may be shared between views; a view itself is used from one
 * thread at a time.
 *
 * Entry points always return output. `last_error()` and `last_passthrough()`
 * describe the most recent call to return. A context without an error handler
 * gets the shared `default_error_handler()`; any other handler is owned by the
 * caller and must outlive the view.
 */
class template_view {
 public:
  explicit template_view(resolver::sm & resolver) : session_(resolver, base_) {
    attach(base_);
  }

  template_view(resolver::sm & resolver, rendering_context base)
      : base_(std::move(base)), session_(resolver, base_) {
    attach(base_);
  }

  template_view(const template_view &) = delete;
  template_view & operator=(const template_view &) = delete;

  void set_rendering_context(rendering_context ctx) {
    base_ = std::move(ctx);
    attach(base_);
  }

  rendering_context & base_context() noexcept { return base_; }
  const rendering_context & base_context() const noexcept { return base_; }

  void assign(std::string_view key, scope::value v) { base_.variables.add(key, std::move(v)); }

  void assign_multiple(const scope::variable_map & values) {
    for (const auto & entry : values) {
      base_.variables.add(entry.first, entry.second);
    }
  }

  std::string render(std::string_view action_name = {}) {
    view::render::action::context ctx{};
    ctx.session = &session_;
    view::render::sm machine{ctx};

    std::string output;
    bool passthrough = false;
    int32_t err = VELLUM_OK;
    view::render::event::render request{
      .action_name = action_name,
      .output_out = &output,
      .passthrough_out = &passthrough,
      .error_out = &err,
    };
    finish(machine.process_event(request), passthrough, err);
    return output;
  }

  std::string render_section(std::string_view section_name,
                             const scope::variable_map & variables = {},
                             const bool ignore_unknown = false) {
    section::action::context ctx{};
    ctx.session = &session_;
    section::sm machine{ctx};

    std::string output;
    bool passthrough = false;
    int32_t err = VELLUM_OK;
    section::event::render_section request{
      .section_name = section_name,
      .variables = &variables,
      .ignore_unknown = ignore_unknown,
      .output_out = &output,
      .passthrough_out = &passthrough,
      .error_out = &err,
    };
    finish(machine.process_event(request), passthrough, err);
    return output;
  }

  std::string render_partial(std::string_view partial_name,
                             std::optional<std::string_view> section_name = std::nullopt,
                             const scope::variable_map & variables = {},
                             const bool ignore_unknown = false) {
    partial::action::context ctx{};
    ctx.session = &session_;
    partial::sm machine{ctx};

    std::string output;
    bool passthrough = false;
    int32_t err = VELLUM_OK;
    partial::event::render_partial request{
      .partial_name = partial_name,
      .section_name = section_name,
      .variables = &variables,
      .ignore_unknown = ignore_unknown,
      .output_out = &output,
      .passthrough_out = &passthrough,
      .error_out = &err,
    };
    finish(machine.process_event(request), passthrough, err);
    return output;
  }

  session & rendering_session() noexcept { return session_; }
  const session & rendering_session() const noexcept { return session_; }

  int32_t last_error() const noexcept { return last_error_; }
  bool last_passthrough() const noexcept { return last_passthrough_; }

 private:
  void attach(rendering_context & ctx) noexcept {
    ctx.view = this;
    if (ctx.errors == nullptr) {
      ctx.errors = &default_error_handler();
    }
  }

  void finish(const bool accepted, const bool passthrough, const int32_t err) noexcept {
    last_passthrough_ = passthrough;
    last_error_ = accepted ? err : VELLUM_ERR_BACKEND;
  }

  rendering_context base_ = {};
  session session_;
  int32_t last_error_ = VELLUM_OK;
  bool last_passthrough_ = false;
};

}  // namespace vellum::view

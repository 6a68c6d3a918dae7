#pragma once

#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "vellum/vellum.h"
#include "vellum/view/detail.hpp"
#include "vellum/view/node.hpp"
#include "vellum/view/render/context.hpp"
#include "vellum/view/render/events.hpp"

namespace vellum::view::render::action {

struct reject_invalid {
  void operator()(const event::render & ev, context & ctx) const {
    ctx.request = &ev;
    ctx.phase_error = VELLUM_ERR_INVALID_ARGUMENT;
    ctx.last_error = VELLUM_ERR_INVALID_ARGUMENT;
    detail::publish(&ev, std::string{}, false, VELLUM_ERR_INVALID_ARGUMENT);
  }
};

struct reject_depth {
  void operator()(const event::render & ev, context & ctx) const {
    ctx.request = &ev;
    ctx.phase_error = VELLUM_ERR_DEPTH_EXCEEDED;
    ctx.last_error = VELLUM_ERR_DEPTH_EXCEEDED;
    rendering_context & current = ctx.session->current_context();
    detail::publish(&ev,
                    detail::report_view_error(current,
                                              VELLUM_ERR_DEPTH_EXCEEDED,
                                              detail::describe(VELLUM_ERR_DEPTH_EXCEEDED,
                                                               "template",
                                                               current.controller_name)),
                    false,
                    VELLUM_ERR_DEPTH_EXCEEDED);
  }
};

/**
 * Applies the action override, resolves the controller/action template and
 * binds its arguments to the current context.
 */
struct begin_render {
  void operator()(const event::render & ev, context & ctx) const {
    ctx.request = &ev;
    ctx.action_name = detail::upper_first(ev.action_name);
    ctx.template_resolved = {};
    ctx.layout_name.clear();
    ctx.layout_resolved = {};
    ctx.output.clear();
    ctx.phase_error = VELLUM_OK;
    ctx.last_error = VELLUM_OK;

    rendering_context & current = ctx.session->current_context();
    if (!ctx.action_name.empty()) {
      current.controller_action = ctx.action_name;
    }

    const int32_t err = ctx.session->current_template(ctx.template_resolved);
    if (err != VELLUM_OK) {
      ctx.template_resolved.err = err;
      return;
    }
    if (ctx.template_resolved.passthrough || ctx.template_resolved.parsed == nullptr) {
      return;
    }
    ctx.template_resolved.err = ctx.template_resolved.parsed->bind_arguments(current);
  }
};

struct emit_template_passthrough {
  void operator()(context & ctx) const {
    spdlog::debug("template '{}/{}' short-circuited by passthrough source",
                  ctx.session->current_context().controller_name,
                  ctx.session->current_context().controller_action);
    detail::publish(ctx.request, ctx.template_resolved.source, true, VELLUM_OK);
  }
};

struct report_template_error {
  void operator()(context & ctx) const {
    const int32_t err =
        ctx.template_resolved.err != VELLUM_OK ? ctx.template_resolved.err : VELLUM_ERR_BACKEND;
    ctx.last_error = err;
    rendering_context & current = ctx.session->current_context();
    detail::publish(ctx.request,
                    detail::report_view_error(current,
                                              err,
                                              detail::describe(err,
                                                               "template",
                                                               current.controller_name + "/" +
                                                                   current.controller_action)),
                    false,
                    err);
  }
};

struct lookup_layout {
  void operator()(context & ctx) const {
    const node * declaration = ctx.template_resolved.parsed->named_child(k_layout_child);
    if (declaration == nullptr) {
      ctx.layout_name.clear();
      return;
    }
    ctx.layout_name = declaration->argument(k_layout_argument, ctx.session->current_context());
  }
};

struct resolve_layout {
  void operator()(context & ctx) const {
    const int32_t err =
        ctx.session->resolve(rendering_kind::layout, ctx.layout_name, ctx.layout_resolved);
    if (err != VELLUM_OK) {
      ctx.layout_resolved.err = err;
      return;
    }
    if (ctx.layout_resolved.passthrough || ctx.layout_resolved.parsed == nullptr) {
      return;
    }
    ctx.layout_resolved.err =
        ctx.layout_resolved.parsed->bind_arguments(ctx.session->current_context());
  }
};

struct emit_layout_passthrough {
  void operator()(context & ctx) const {
    spdlog::debug("layout '{}' short-circuited by passthrough source", ctx.layout_name);
    detail::publish(ctx.request, ctx.layout_resolved.source, true, VELLUM_OK);
  }
};

struct report_layout_error {
  void operator()(context & ctx) const {
    const int32_t err =
        ctx.layout_resolved.err != VELLUM_OK ? ctx.layout_resolved.err : VELLUM_ERR_BACKEND;
    ctx.last_error = err;
    detail::publish(ctx.request,
                    detail::report_view_error(ctx.session->base_context(),
                                              err,
                                              detail::describe(err, "layout", ctx.layout_name)),
                    false,
                    err);
  }
};

// The layout frame carries the template so sections resolve against it.
struct push_layout_frame {
  void operator()(context & ctx) const {
    ctx.session->start_rendering(rendering_kind::layout, ctx.template_resolved.parsed,
                                 &ctx.session->base_context());
  }
};

struct push_template_frame {
  void operator()(context & ctx) const {
    ctx.session->start_rendering(rendering_kind::template_, ctx.template_resolved.parsed,
                                 &ctx.session->base_context());
  }
};

struct evaluate_layout {
  void operator()(context & ctx) const {
    ctx.phase_error = detail::evaluate_on_frame(*ctx.session, [&ctx] {
      return ctx.layout_resolved.parsed->evaluate(ctx.session->base_context(), ctx.output);
    });
  }
};

struct evaluate_template {
  void operator()(context & ctx) const {
    ctx.phase_error = detail::evaluate_on_frame(*ctx.session, [&ctx] {
      return ctx.template_resolved.parsed->evaluate(ctx.session->base_context(), ctx.output);
    });
  }
};

struct pop_and_emit {
  void operator()(context & ctx) const {
    detail::stop_rendering_or_terminate(*ctx.session);
    detail::publish(ctx.request, std::move(ctx.output), false, VELLUM_OK);
    ctx.output.clear();
  }
};

struct pop_and_report {
  void operator()(context & ctx) const {
    detail::stop_rendering_or_terminate(*ctx.session);
    ctx.last_error = ctx.phase_error;
    rendering_context & base = ctx.session->base_context();
    const std::string what = ctx.layout_name.empty() ? base.controller_name + "/" +
                                                           base.controller_action
                                                     : ctx.layout_name;
    detail::publish(ctx.request,
                    detail::report_view_error(base,
                                              ctx.phase_error,
                                              detail::describe(ctx.phase_error,
                                                               ctx.layout_name.empty()
                                                                   ? "template"
                                                                   : "layout",
                                                               what)),
                    false,
                    ctx.phase_error);
  }
};

struct on_unexpected {
  template <class Event>
  void operator()(const Event &, context & ctx) const noexcept {
    ctx.phase_error = VELLUM_ERR_BACKEND;
    ctx.last_error = VELLUM_ERR_BACKEND;
  }
};

inline constexpr reject_invalid reject_invalid{};
inline constexpr reject_depth reject_depth{};
inline constexpr begin_render begin_render{};
inline constexpr emit_template_passthrough emit_template_passthrough{};
inline constexpr report_template_error report_template_error{};
inline constexpr lookup_layout lookup_layout{};
inline constexpr resolve_layout resolve_layout{};
inline constexpr emit_layout_passthrough emit_layout_passthrough{};
inline constexpr report_layout_error report_layout_error{};
inline constexpr push_layout_frame push_layout_frame{};
inline constexpr push_template_frame push_template_frame{};
inline constexpr evaluate_layout evaluate_layout{};
inline constexpr evaluate_template evaluate_template{};
inline constexpr pop_and_emit pop_and_emit{};
inline constexpr pop_and_report pop_and_report{};
inline constexpr on_unexpected on_unexpected{};

}  // namespace vellum::view::render::action

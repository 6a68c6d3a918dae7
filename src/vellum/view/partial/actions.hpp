#pragma once

#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "vellum/vellum.h"
#include "vellum/view/detail.hpp"
#include "vellum/view/node.hpp"
#include "vellum/view/partial/context.hpp"
#include "vellum/view/partial/events.hpp"
#include "vellum/view/section/sm.hpp"

namespace vellum::view::partial::action {

struct reject_invalid {
  void operator()(const event::render_partial & ev, context & ctx) const {
    ctx.request = &ev;
    ctx.phase_error = VELLUM_ERR_INVALID_ARGUMENT;
    ctx.last_error = VELLUM_ERR_INVALID_ARGUMENT;
    detail::publish(&ev, std::string{}, false, VELLUM_ERR_INVALID_ARGUMENT);
  }
};

struct reject_depth {
  void operator()(const event::render_partial & ev, context & ctx) const {
    ctx.request = &ev;
    ctx.phase_error = VELLUM_ERR_DEPTH_EXCEEDED;
    ctx.last_error = VELLUM_ERR_DEPTH_EXCEEDED;
    detail::publish(&ev,
                    detail::report_view_error(ctx.session->current_context(),
                                              VELLUM_ERR_DEPTH_EXCEEDED,
                                              detail::describe(VELLUM_ERR_DEPTH_EXCEEDED,
                                                               "partial",
                                                               ev.partial_name)),
                    false,
                    VELLUM_ERR_DEPTH_EXCEEDED);
  }
};

struct begin_partial {
  void operator()(const event::render_partial & ev, context & ctx) const {
    ctx.request = &ev;
    ctx.partial_name = std::string(ev.partial_name);
    ctx.section_name.reset();
    if (ev.section_name.has_value()) {
      ctx.section_name = std::string(*ev.section_name);
    }
    ctx.variables = ev.variables;
    ctx.ignore_unknown = ev.ignore_unknown;
    ctx.phase_error = VELLUM_OK;
    ctx.last_error = VELLUM_OK;
    ctx.resolved = {};
    ctx.output.clear();
    ctx.nested_passthrough = false;
    ctx.nested_error = VELLUM_OK;

    ctx.owned_scope = std::make_unique<rendering_context>(ctx.session->current_context().clone());

    const int32_t err =
        ctx.session->resolve(rendering_kind::partial, ctx.partial_name, ctx.resolved);
    if (err != VELLUM_OK) {
      ctx.resolved.err = err;
      return;
    }
    if (ctx.resolved.passthrough || ctx.resolved.parsed == nullptr) {
      return;
    }
    ctx.resolved.err = ctx.resolved.parsed->bind_arguments(*ctx.owned_scope);
  }
};

struct emit_passthrough {
  void operator()(context & ctx) const {
    spdlog::debug("partial '{}' short-circuited by passthrough source", ctx.partial_name);
    detail::publish(ctx.request, ctx.resolved.source, true, VELLUM_OK);
  }
};

struct emit_empty {
  void operator()(context & ctx) const {
    detail::publish(ctx.request, std::string{}, false, VELLUM_OK);
  }
};

struct report_partial_error {
  void operator()(context & ctx) const {
    const int32_t err = ctx.resolved.err != VELLUM_OK ? ctx.resolved.err : VELLUM_ERR_BACKEND;
    ctx.last_error = err;
    detail::publish(ctx.request,
                    detail::report_view_error(*ctx.owned_scope,
                                              err,
                                              detail::describe(err, "partial", ctx.partial_name)),
                    false,
                    err);
  }
};

struct push_frame {
  void operator()(context & ctx) const {
    ctx.session->start_rendering(rendering_kind::partial, ctx.resolved.parsed,
                                 ctx.owned_scope.get());
  }
};

// Runs a nested section request inside the partial's own frame.
struct render_nested_section {
  void operator()(context & ctx) const {
    section::action::context nested_ctx{};
    nested_ctx.session = ctx.session;
    section::sm nested{nested_ctx};

    std::string section_name = ctx.section_name.value_or(std::string{});
    section::event::render_section request{
      .section_name = section_name,
      .variables = ctx.variables,
      .ignore_unknown = ctx.ignore_unknown,
      .output_out = &ctx.output,
      .passthrough_out = &ctx.nested_passthrough,
      .error_out = &ctx.nested_error,
    };
    ctx.phase_error = detail::evaluate_on_frame(*ctx.session, [&] {
      return nested.process_event(request) ? static_cast<int32_t>(VELLUM_OK)
                                           : static_cast<int32_t>(VELLUM_ERR_BACKEND);
    });
  }
};

struct evaluate_partial {
  void operator()(context & ctx) const {
    if (ctx.variables != nullptr) {
      ctx.owned_scope->variables = ctx.owned_scope->variables.scope_copy(*ctx.variables);
    }
    ctx.phase_error = detail::evaluate_on_frame(*ctx.session, [&ctx] {
      return ctx.resolved.parsed->evaluate(*ctx.owned_scope, ctx.output);
    });
  }
};

struct pop_and_emit {
  void operator()(context & ctx) const {
    detail::stop_rendering_or_terminate(*ctx.session);
    detail::publish(ctx.request, std::move(ctx.output), ctx.nested_passthrough,
                    ctx.nested_error);
    ctx.output.clear();
  }
};

struct pop_and_report {
  void operator()(context & ctx) const {
    detail::stop_rendering_or_terminate(*ctx.session);
    ctx.last_error = ctx.phase_error;
    detail::publish(ctx.request,
                    detail::report_view_error(*ctx.owned_scope,
                                              ctx.phase_error,
                                              detail::describe(ctx.phase_error,
                                                               "partial",
                                                               ctx.partial_name)),
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
inline constexpr begin_partial begin_partial{};
inline constexpr emit_passthrough emit_passthrough{};
inline constexpr emit_empty emit_empty{};
inline constexpr report_partial_error report_partial_error{};
inline constexpr push_frame push_frame{};
inline constexpr render_nested_section render_nested_section{};
inline constexpr evaluate_partial evaluate_partial{};
inline constexpr pop_and_emit pop_and_emit{};
inline constexpr pop_and_report pop_and_report{};
inline constexpr on_unexpected on_unexpected{};

}  // namespace vellum::view::partial::action

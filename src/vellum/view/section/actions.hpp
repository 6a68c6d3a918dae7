#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "vellum/vellum.h"
#include "vellum/view/detail.hpp"
#include "vellum/view/node.hpp"
#include "vellum/view/section/context.hpp"
#include "vellum/view/section/events.hpp"

namespace vellum::view::section::action {

struct reject_invalid {
  void operator()(const event::render_section & ev, context & ctx) const {
    ctx.request = &ev;
    ctx.phase_error = VELLUM_ERR_INVALID_ARGUMENT;
    ctx.last_error = VELLUM_ERR_INVALID_ARGUMENT;
    detail::publish(&ev, std::string{}, false, VELLUM_ERR_INVALID_ARGUMENT);
  }
};

struct reject_depth {
  void operator()(const event::render_section & ev, context & ctx) const {
    ctx.request = &ev;
    ctx.phase_error = VELLUM_ERR_DEPTH_EXCEEDED;
    ctx.last_error = VELLUM_ERR_DEPTH_EXCEEDED;
    detail::publish(&ev,
                    detail::report_view_error(ctx.session->current_context(),
                                              VELLUM_ERR_DEPTH_EXCEEDED,
                                              detail::describe(VELLUM_ERR_DEPTH_EXCEEDED,
                                                               "section",
                                                               ev.section_name)),
                    false,
                    VELLUM_ERR_DEPTH_EXCEEDED);
  }
};

/**
 * Picks the scope and kind for the next nesting level, then resolves the
 * template the section lives in.
 *
 * Inside a layout the section belongs to the template and shares the
 * layout's scope as is. Anywhere else it keeps the current kind and renders
 * in a clone of the current scope with the request variables overlaid.
 */
struct begin_section {
  void operator()(const event::render_section & ev, context & ctx) const {
    ctx.request = &ev;
    ctx.section_name = std::string(ev.section_name);
    ctx.ignore_unknown = ev.ignore_unknown;
    ctx.phase_error = VELLUM_OK;
    ctx.last_error = VELLUM_OK;
    ctx.resolved = {};
    ctx.section = nullptr;
    ctx.output.clear();
    ctx.owned_scope.reset();

    rendering_context & current = ctx.session->current_context();
    switch (ctx.session->current_kind()) {
      case rendering_kind::layout:
        ctx.next_kind = rendering_kind::template_;
        ctx.scope = &current;
        break;
      case rendering_kind::template_:
      case rendering_kind::partial:
        ctx.next_kind = ctx.session->current_kind();
        ctx.owned_scope = std::make_unique<rendering_context>(current.clone());
        if (ev.variables != nullptr) {
          ctx.owned_scope->variables = ctx.owned_scope->variables.scope_copy(*ev.variables);
        }
        ctx.scope = ctx.owned_scope.get();
        break;
    }

    const int32_t err = ctx.session->current_template(ctx.resolved);
    if (err != VELLUM_OK) {
      ctx.resolved.err = err;
    }
  }
};

struct emit_passthrough {
  void operator()(context & ctx) const {
    spdlog::debug("section '{}' short-circuited by passthrough source", ctx.section_name);
    detail::publish(ctx.request, ctx.resolved.source, true, VELLUM_OK);
  }
};

struct emit_empty {
  void operator()(context & ctx) const {
    detail::publish(ctx.request, std::string{}, false, VELLUM_OK);
  }
};

struct report_template_error {
  void operator()(context & ctx) const {
    const int32_t err = ctx.resolved.err != VELLUM_OK ? ctx.resolved.err : VELLUM_ERR_BACKEND;
    ctx.last_error = err;
    detail::publish(ctx.request,
                    detail::report_view_error(*ctx.scope,
                                              err,
                                              detail::describe(err, "section", ctx.section_name)),
                    false,
                    err);
  }
};

struct lookup_section {
  void operator()(context & ctx) const {
    ctx.section = ctx.resolved.parsed->named_child(ctx.section_name);
    if (ctx.section == nullptr) {
      ctx.phase_error = VELLUM_ERR_CHILD_NOT_FOUND;
    }
  }
};

struct report_missing_section {
  void operator()(context & ctx) const {
    ctx.last_error = VELLUM_ERR_CHILD_NOT_FOUND;
    detail::publish(ctx.request,
                    detail::report_view_error(*ctx.scope,
                                              VELLUM_ERR_CHILD_NOT_FOUND,
                                              detail::describe(VELLUM_ERR_CHILD_NOT_FOUND,
                                                               "section",
                                                               ctx.section_name)),
                    false,
                    VELLUM_ERR_CHILD_NOT_FOUND);
  }
};

struct push_frame {
  void operator()(context & ctx) const {
    ctx.session->start_rendering(ctx.next_kind, ctx.resolved.parsed, ctx.scope);
  }
};

struct evaluate_section {
  void operator()(context & ctx) const {
    ctx.phase_error = detail::evaluate_on_frame(
        *ctx.session, [&ctx] { return ctx.section->evaluate(*ctx.scope, ctx.output); });
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
    detail::publish(ctx.request,
                    detail::report_view_error(*ctx.scope,
                                              ctx.phase_error,
                                              detail::describe(ctx.phase_error,
                                                               "section",
                                                               ctx.section_name)),
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
inline constexpr begin_section begin_section{};
inline constexpr emit_passthrough emit_passthrough{};
inline constexpr emit_empty emit_empty{};
inline constexpr report_template_error report_template_error{};
inline constexpr lookup_section lookup_section{};
inline constexpr report_missing_section report_missing_section{};
inline constexpr push_frame push_frame{};
inline constexpr evaluate_section evaluate_section{};
inline constexpr pop_and_emit pop_and_emit{};
inline constexpr pop_and_report pop_and_report{};
inline constexpr on_unexpected on_unexpected{};

}  // namespace vellum::view::section::action

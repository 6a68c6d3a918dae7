#pragma once

#include "vellum/view/partial/context.hpp"
#include "vellum/view/partial/events.hpp"

namespace vellum::view::partial::guard {

struct valid_request {
  bool operator()(const event::render_partial & ev, const action::context & ctx) const noexcept {
    return ev.output_out != nullptr && ctx.session != nullptr;
  }
};

struct invalid_request {
  bool operator()(const event::render_partial & ev, const action::context & ctx) const noexcept {
    return !valid_request{}(ev, ctx);
  }
};

struct depth_available {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.session != nullptr && ctx.session->depth() < k_max_render_depth;
  }
};

struct depth_exhausted {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.session != nullptr && ctx.session->depth() >= k_max_render_depth;
  }
};

struct partial_passthrough {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.resolved.err == VELLUM_OK && ctx.resolved.passthrough;
  }
};

// Unknown partials and unaddressable sections are the ignorable failures.
struct partial_missing_ignored {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.ignore_unknown && (ctx.resolved.err == VELLUM_ERR_TEMPLATE_NOT_FOUND ||
                                  ctx.resolved.err == VELLUM_ERR_INVALID_SECTION);
  }
};

struct partial_resolved {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.resolved.err == VELLUM_OK && !ctx.resolved.passthrough &&
           ctx.resolved.parsed != nullptr;
  }
};

struct partial_failed {
  bool operator()(const action::context & ctx) const noexcept {
    return !partial_passthrough{}(ctx) && !partial_missing_ignored{}(ctx) &&
           !partial_resolved{}(ctx);
  }
};

struct has_section {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.section_name.has_value();
  }
};

struct no_section {
  bool operator()(const action::context & ctx) const noexcept {
    return !ctx.section_name.has_value();
  }
};

struct evaluation_ok {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.phase_error == VELLUM_OK;
  }
};

struct evaluation_failed {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.phase_error != VELLUM_OK;
  }
};

}  // namespace vellum::view::partial::guard

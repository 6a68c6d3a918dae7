#pragma once

#include "vellum/view/section/context.hpp"
#include "vellum/view/section/events.hpp"

namespace vellum::view::section::guard {

struct valid_request {
  bool operator()(const event::render_section & ev, const action::context & ctx) const noexcept {
    return ev.output_out != nullptr && ctx.session != nullptr;
  }
};

struct invalid_request {
  bool operator()(const event::render_section & ev, const action::context & ctx) const noexcept {
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

struct template_passthrough {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.resolved.err == VELLUM_OK && ctx.resolved.passthrough;
  }
};

struct template_missing_ignored {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.resolved.err == VELLUM_ERR_TEMPLATE_NOT_FOUND && ctx.ignore_unknown;
  }
};

struct template_resolved {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.resolved.err == VELLUM_OK && !ctx.resolved.passthrough &&
           ctx.resolved.parsed != nullptr;
  }
};

struct template_failed {
  bool operator()(const action::context & ctx) const noexcept {
    return !template_passthrough{}(ctx) && !template_missing_ignored{}(ctx) &&
           !template_resolved{}(ctx);
  }
};

struct section_found {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.section != nullptr;
  }
};

struct section_missing_ignored {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.section == nullptr && ctx.ignore_unknown;
  }
};

struct section_missing_reported {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.section == nullptr && !ctx.ignore_unknown;
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

}  // namespace vellum::view::section::guard

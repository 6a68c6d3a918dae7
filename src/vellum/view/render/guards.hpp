#pragma once

#include "vellum/view/render/context.hpp"
#include "vellum/view/render/events.hpp"

namespace vellum::view::render::guard {

struct valid_request {
  bool operator()(const event::render & ev, const action::context & ctx) const noexcept {
    return ev.output_out != nullptr && ctx.session != nullptr;
  }
};

struct invalid_request {
  bool operator()(const event::render & ev, const action::context & ctx) const noexcept {
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
    return ctx.template_resolved.err == VELLUM_OK && ctx.template_resolved.passthrough;
  }
};

struct template_resolved {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.template_resolved.err == VELLUM_OK && !ctx.template_resolved.passthrough &&
           ctx.template_resolved.parsed != nullptr;
  }
};

struct template_failed {
  bool operator()(const action::context & ctx) const noexcept {
    return !template_passthrough{}(ctx) && !template_resolved{}(ctx);
  }
};

// An absent `layoutName` child and an empty name both mean no layout.
struct has_layout {
  bool operator()(const action::context & ctx) const noexcept {
    return !ctx.layout_name.empty();
  }
};

struct no_layout {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.layout_name.empty();
  }
};

struct layout_passthrough {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.layout_resolved.err == VELLUM_OK && ctx.layout_resolved.passthrough;
  }
};

struct layout_resolved {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.layout_resolved.err == VELLUM_OK && !ctx.layout_resolved.passthrough &&
           ctx.layout_resolved.parsed != nullptr;
  }
};

struct layout_failed {
  bool operator()(const action::context & ctx) const noexcept {
    return !layout_passthrough{}(ctx) && !layout_resolved{}(ctx);
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

}  // namespace vellum::view::render::guard

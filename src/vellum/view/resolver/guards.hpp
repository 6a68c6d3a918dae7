#pragma once

#include "vellum/view/resolver/context.hpp"
#include "vellum/view/resolver/detail.hpp"
#include "vellum/view/resolver/events.hpp"

namespace vellum::view::resolver::guard {

struct valid_resolve {
  bool operator()(const event::resolve & ev, const action::context & ctx) const noexcept {
    return ev.resolution_out != nullptr && ctx.paths != nullptr && ctx.parser != nullptr;
  }
};

struct invalid_resolve {
  bool operator()(const event::resolve & ev, const action::context & ctx) const noexcept {
    return !valid_resolve{}(ev, ctx);
  }
};

struct cached {
  bool operator()(const event::resolve & ev, const action::context & ctx) const {
    return ctx.cache.find(detail::make_key(ev)) != ctx.cache.end();
  }
};

struct not_cached {
  bool operator()(const event::resolve & ev, const action::context & ctx) const {
    return !cached{}(ev, ctx);
  }
};

struct phase_ok {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.phase_error == VELLUM_OK;
  }
};

struct phase_failed {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.phase_error != VELLUM_OK;
  }
};

struct source_passthrough {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.phase_error == VELLUM_OK && ctx.pending_parse.passthrough;
  }
};

struct source_parsed {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.phase_error == VELLUM_OK && !ctx.pending_parse.passthrough;
  }
};

}  // namespace vellum::view::resolver::guard

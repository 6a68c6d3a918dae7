#pragma once

#include <spdlog/spdlog.h>
#include <utility>

#include "vellum/vellum.h"
#include "vellum/view/resolver/context.hpp"
#include "vellum/view/resolver/detail.hpp"
#include "vellum/view/resolver/events.hpp"

namespace vellum::view::resolver::action {

struct reject_invalid {
  void operator()(const event::resolve & ev, context & ctx) const {
    ctx.request = &ev;
    ctx.phase_error = VELLUM_ERR_INVALID_ARGUMENT;
    ctx.last_error = VELLUM_ERR_INVALID_ARGUMENT;
    if (ev.resolution_out != nullptr) {
      *ev.resolution_out = resolution{.err = VELLUM_ERR_INVALID_ARGUMENT};
    }
    if (ev.error_out != nullptr) {
      *ev.error_out = VELLUM_ERR_INVALID_ARGUMENT;
    }
  }
};

struct serve_cached {
  void operator()(const event::resolve & ev, context & ctx) const {
    ctx.request = &ev;
    ctx.phase_error = VELLUM_OK;
    ctx.last_error = VELLUM_OK;
    ctx.cache_hits += 1;
    auto it = ctx.cache.find(detail::make_key(ev));
    detail::write_result(ctx, resolution{.parsed = it->second.get()});
  }
};

struct load_source {
  void operator()(const event::resolve & ev, context & ctx) const {
    ctx.request = &ev;
    ctx.phase_error = VELLUM_OK;
    ctx.last_error = VELLUM_OK;
    ctx.pending_key = detail::make_key(ev);
    ctx.pending_identifier = detail::identifier_for(*ctx.paths, ev);
    ctx.pending_source.clear();
    ctx.pending_parse = {};

    const int32_t err = detail::source_for(*ctx.paths, ev, ctx.pending_source);
    if (err != VELLUM_OK) {
      ctx.phase_error = err;
    }
  }
};

struct parse_source {
  void operator()(context & ctx) const {
    ctx.parses += 1;
    ctx.pending_parse = ctx.parser->parse(ctx.pending_identifier, ctx.pending_source);
    if (ctx.pending_parse.err != VELLUM_OK) {
      ctx.phase_error = ctx.pending_parse.err;
      return;
    }
    if (!ctx.pending_parse.passthrough && ctx.pending_parse.tree == nullptr) {
      ctx.phase_error = VELLUM_ERR_PARSE_FAILED;
    }
  }
};

struct store_parsed {
  void operator()(context & ctx) const {
    spdlog::debug("parsed {} '{}' as {}",
                  kind_name(ctx.pending_key.kind),
                  ctx.pending_key.name,
                  ctx.pending_identifier);
    auto inserted = ctx.cache.emplace(ctx.pending_key, std::move(ctx.pending_parse.tree));
    ctx.pending_parse = {};
    detail::write_result(ctx, resolution{.parsed = inserted.first->second.get()});
  }
};

struct finalize_passthrough {
  void operator()(context & ctx) const {
    spdlog::debug("{} '{}' is not templated, passing source through",
                  kind_name(ctx.pending_key.kind),
                  ctx.pending_key.name);
    resolution out;
    out.passthrough = true;
    out.source = std::move(ctx.pending_source);
    ctx.pending_source.clear();
    ctx.pending_parse = {};
    detail::write_result(ctx, out);
  }
};

struct finalize_error {
  void operator()(context & ctx) const {
    ctx.last_error = ctx.phase_error;
    ctx.pending_parse = {};
    detail::write_result(ctx, resolution{.err = ctx.phase_error});
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
inline constexpr serve_cached serve_cached{};
inline constexpr load_source load_source{};
inline constexpr parse_source parse_source{};
inline constexpr store_parsed store_parsed{};
inline constexpr finalize_passthrough finalize_passthrough{};
inline constexpr finalize_error finalize_error{};
inline constexpr on_unexpected on_unexpected{};

}  // namespace vellum::view::resolver::action

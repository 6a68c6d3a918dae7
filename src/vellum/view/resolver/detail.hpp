#pragma once

#include <string>

#include "vellum/vellum.h"
#include "vellum/view/resolver/context.hpp"
#include "vellum/view/resolver/events.hpp"

namespace vellum::view::resolver::detail {

inline resolution_key make_key(const event::resolve & ev) {
  resolution_key key;
  key.kind = ev.kind;
  key.name = std::string(ev.name);
  if (ev.kind == rendering_kind::template_) {
    key.action = std::string(ev.action);
  }
  return key;
}

inline std::string identifier_for(const template_paths & paths, const event::resolve & ev) {
  switch (ev.kind) {
    case rendering_kind::template_:
      return paths.template_identifier(ev.name, ev.action);
    case rendering_kind::layout:
      return paths.layout_identifier(ev.name);
    case rendering_kind::partial:
      return paths.partial_identifier(ev.name);
  }
  return {};
}

inline int32_t source_for(const template_paths & paths,
                          const event::resolve & ev,
                          std::string & source_out) {
  switch (ev.kind) {
    case rendering_kind::template_:
      return paths.template_source(ev.name, ev.action, source_out);
    case rendering_kind::layout:
      return paths.layout_source(ev.name, source_out);
    case rendering_kind::partial:
      return paths.partial_source(ev.name, source_out);
  }
  return VELLUM_ERR_INVALID_ARGUMENT;
}

inline void write_result(const action::context & ctx, const resolution & result) {
  const event::resolve * ev = ctx.request;
  if (ev == nullptr) {
    return;
  }
  if (ev->resolution_out != nullptr) {
    *ev->resolution_out = result;
  }
  if (ev->error_out != nullptr) {
    *ev->error_out = result.err;
  }
}

}  // namespace vellum::view::resolver::detail

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "vellum/vellum.h"

namespace vellum::view {

struct rendering_context;

/**
 * A parsed template tree, or any named child of one.
 *
 * Trees are produced by a `template_parser` and shared read-only between
 * render calls. `evaluate` may re-enter the view through
 * `rendering_context::view` to render sections and partials.
 */
struct node {
  virtual ~node() = default;

  // nullptr when no child carries that name.
  virtual const node * named_child(std::string_view name) const noexcept = 0;

  virtual int32_t bind_arguments(rendering_context &) const { return VELLUM_OK; }

  virtual std::string argument(std::string_view, rendering_context &) const { return {}; }

  virtual int32_t evaluate(rendering_context & ctx, std::string & out) const = 0;
};

struct parsed_source {
  int32_t err = VELLUM_OK;
  // Source is not templated content and must be emitted verbatim.
  bool passthrough = false;
  std::shared_ptr<const node> tree = {};
};

struct template_parser {
  virtual ~template_parser() = default;
  virtual parsed_source parse(std::string_view identifier, std::string_view source) = 0;
};

/**
 * Maps logical names to cache identifiers and raw sources.
 *
 * The `*_source` calls return VELLUM_ERR_TEMPLATE_NOT_FOUND when nothing
 * exists under the name.
 */
struct template_paths {
  virtual ~template_paths() = default;

  virtual std::string template_identifier(std::string_view controller,
                                          std::string_view action) const = 0;
  virtual std::string layout_identifier(std::string_view name) const = 0;
  virtual std::string partial_identifier(std::string_view name) const = 0;

  virtual int32_t template_source(std::string_view controller,
                                  std::string_view action,
                                  std::string & source_out) const = 0;
  virtual int32_t layout_source(std::string_view name, std::string & source_out) const = 0;
  virtual int32_t partial_source(std::string_view name, std::string & source_out) const = 0;
};

}  // namespace vellum::view

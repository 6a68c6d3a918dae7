#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "vellum/scope/variables.hpp"
#include "vellum/vellum.h"
#include "vellum/view/error_handler.hpp"
#include "vellum/view/node.hpp"
#include "vellum/view/rendering_context.hpp"
#include "vellum/view/template_view.hpp"

namespace vellum::tests {

using source_map = std::map<std::string, std::string, std::less<>>;

// Sources keyed by "Controller/Action", layout name and partial name.
struct memory_paths final : view::template_paths {
  source_map templates = {};
  source_map layouts = {};
  source_map partials = {};
  // Partial names answered with VELLUM_ERR_INVALID_SECTION.
  source_map invalid_partials = {};
  mutable int32_t source_calls = 0;

  std::string template_identifier(std::string_view controller,
                                  std::string_view action) const override {
    return "template:" + std::string(controller) + "/" + std::string(action);
  }

  std::string layout_identifier(std::string_view name) const override {
    return "layout:" + std::string(name);
  }

  std::string partial_identifier(std::string_view name) const override {
    return "partial:" + std::string(name);
  }

  int32_t template_source(std::string_view controller,
                          std::string_view action,
                          std::string & source_out) const override {
    return lookup(templates, std::string(controller) + "/" + std::string(action), source_out);
  }

  int32_t layout_source(std::string_view name, std::string & source_out) const override {
    return lookup(layouts, name, source_out);
  }

  int32_t partial_source(std::string_view name, std::string & source_out) const override {
    if (invalid_partials.find(name) != invalid_partials.end()) {
      source_calls += 1;
      return VELLUM_ERR_INVALID_SECTION;
    }
    return lookup(partials, name, source_out);
  }

 private:
  int32_t lookup(const source_map & sources,
                 std::string_view key,
                 std::string & source_out) const {
    source_calls += 1;
    auto it = sources.find(key);
    if (it == sources.end()) {
      return VELLUM_ERR_TEMPLATE_NOT_FOUND;
    }
    source_out = it->second;
    return VELLUM_OK;
  }
};

/**
 * Node whose behavior is a test-supplied callback.
 *
 * Children are addressable by name, arguments are fixed strings, and
 * `bind_status` is returned from every bind.
 */
struct script_node final : view::node {
  using body_fn = std::function<int32_t(view::rendering_context &, std::string &)>;

  body_fn body = {};
  std::map<std::string, std::shared_ptr<script_node>, std::less<>> children = {};
  std::map<std::string, std::string, std::less<>> arguments = {};
  int32_t bind_status = VELLUM_OK;

  mutable int32_t bind_calls = 0;
  mutable int32_t evaluations = 0;
  mutable const view::rendering_context * bound_to = nullptr;

  const view::node * named_child(std::string_view name) const noexcept override {
    auto it = children.find(name);
    return it == children.end() ? nullptr : it->second.get();
  }

  int32_t bind_arguments(view::rendering_context & ctx) const override {
    bind_calls += 1;
    bound_to = &ctx;
    return bind_status;
  }

  std::string argument(std::string_view name, view::rendering_context &) const override {
    auto it = arguments.find(name);
    return it == arguments.end() ? std::string{} : it->second;
  }

  int32_t evaluate(view::rendering_context & ctx, std::string & out) const override {
    evaluations += 1;
    if (!body) {
      return VELLUM_OK;
    }
    return body(ctx, out);
  }

  script_node & add_child(const std::string & name, body_fn child_body) {
    auto child = std::make_shared<script_node>();
    child->body = std::move(child_body);
    children[name] = child;
    return *child;
  }

  void declare_layout(const std::string & layout_name) {
    add_child("layoutName", {}).arguments["name"] = layout_name;
  }
};

/**
 * Parser that maps source text to prepared trees.
 *
 * Sources starting with "RAW:" are reported as passthrough, unknown sources
 * fail to parse.
 */
struct scripted_parser final : view::template_parser {
  std::map<std::string, std::shared_ptr<script_node>, std::less<>> trees = {};
  int32_t parses = 0;
  std::string last_identifier = {};

  view::parsed_source parse(std::string_view identifier, std::string_view source) override {
    parses += 1;
    last_identifier = std::string(identifier);
    view::parsed_source out;
    if (source.substr(0, 4) == "RAW:") {
      out.passthrough = true;
      return out;
    }
    auto it = trees.find(source);
    if (it == trees.end()) {
      out.err = VELLUM_ERR_PARSE_FAILED;
      return out;
    }
    out.tree = it->second;
    return out;
  }

  script_node & add(const std::string & source, script_node::body_fn body = {}) {
    auto tree = std::make_shared<script_node>();
    tree->body = std::move(body);
    trees[source] = tree;
    return *tree;
  }
};

struct counting_error_handler final : view::error_handler {
  int32_t calls = 0;
  int32_t last_err = VELLUM_OK;
  std::string last_message = {};

  std::string handle_view_error(const int32_t err, std::string_view message) override {
    calls += 1;
    last_err = err;
    last_message = std::string(message);
    return "<error>";
  }
};

inline script_node::body_fn emit(std::string text) {
  return [text = std::move(text)](view::rendering_context &, std::string & out) {
    out += text;
    return static_cast<int32_t>(VELLUM_OK);
  };
}

inline script_node::body_fn emit_variable(std::string key) {
  return [key = std::move(key)](view::rendering_context & ctx, std::string & out) {
    out += ctx.variables.get(key).string_v;
    return static_cast<int32_t>(VELLUM_OK);
  };
}

inline script_node::body_fn fail_with(const int32_t err) {
  return [err](view::rendering_context &, std::string &) { return err; };
}

// Paths, parser, resolver and a view wired together with a counting handler.
struct view_fixture {
  memory_paths paths = {};
  scripted_parser parser = {};
  counting_error_handler errors = {};
  view::resolver::sm resolver{paths, parser};
  view::template_view page{resolver, make_base()};

  view::rendering_context make_base() {
    view::rendering_context base;
    base.controller_name = "Blog";
    base.controller_action = "Index";
    base.errors = &errors;
    return base;
  }

  size_t depth() { return page.rendering_session().depth(); }
};

}  // namespace vellum::tests

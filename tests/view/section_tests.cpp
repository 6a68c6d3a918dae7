#include <stdexcept>
#include <string>

#include "doctest/doctest.h"

#include "vellum/vellum.h"
#include "vellum/view/section/sm.hpp"
#include "vellum/view/template_view.hpp"
#include "view/fixtures.hpp"

namespace {

using vellum::scope::make_string;
using vellum::view::rendering_context;
using vellum::view::rendering_kind;

vellum::tests::script_node & index_template(vellum::tests::view_fixture & f) {
  f.paths.templates["Blog/Index"] = "index";
  return f.parser.add("index", vellum::tests::emit("index body"));
}

}  // namespace

TEST_CASE("render_section ignores a missing section when asked to") {
  vellum::tests::view_fixture f;
  index_template(f);

  CHECK(f.page.render_section("missing", {}, true).empty());
  CHECK(f.page.last_error() == VELLUM_OK);
  CHECK(f.errors.calls == 0);
  CHECK(f.depth() == 0);
}

TEST_CASE("render_section reports a missing section exactly once") {
  vellum::tests::view_fixture f;
  index_template(f);

  CHECK(f.page.render_section("missing", {}, false) == "<error>");
  CHECK(f.page.last_error() == VELLUM_ERR_CHILD_NOT_FOUND);
  CHECK(f.errors.calls == 1);
  CHECK(f.errors.last_err == VELLUM_ERR_CHILD_NOT_FOUND);
  CHECK(f.errors.last_message.find("missing") != std::string::npos);
  CHECK(f.depth() == 0);
}

TEST_CASE("render_section resolves the controller template on demand") {
  vellum::tests::view_fixture f;
  auto & tree = index_template(f);
  size_t depth = 0;
  rendering_kind kind = rendering_kind::layout;
  tree.add_child("header", [&](rendering_context & ctx, std::string & out) {
    depth = ctx.view->rendering_session().depth();
    kind = ctx.view->rendering_session().current_kind();
    out += "header";
    return static_cast<int32_t>(VELLUM_OK);
  });

  CHECK(f.page.render_section("header") == "header");
  CHECK(depth == 1);
  CHECK(kind == rendering_kind::template_);
  CHECK(tree.evaluations == 0);
  CHECK(f.depth() == 0);
}

TEST_CASE("render_section overlays variables on a clone of the current scope") {
  vellum::tests::view_fixture f;
  auto & tree = index_template(f);
  const rendering_context * seen = nullptr;
  tree.add_child("title", [&](rendering_context & ctx, std::string & out) {
    seen = &ctx;
    out += ctx.variables.get("title").string_v + "/" + ctx.variables.get("user").string_v;
    ctx.variables.add("user", make_string("changed"));
    return static_cast<int32_t>(VELLUM_OK);
  });
  f.page.assign("title", make_string("page"));
  f.page.assign("user", make_string("ada"));

  CHECK(f.page.render_section("title", {{"title", make_string("X")}}) == "X/ada");
  CHECK(seen != nullptr);
  CHECK(seen != &f.page.base_context());
  CHECK(f.page.base_context().variables.get("title").string_v == "page");
  CHECK(f.page.base_context().variables.get("user").string_v == "ada");
}

TEST_CASE("render_section nested in a template keeps the template kind") {
  vellum::tests::view_fixture f;
  f.paths.templates["Blog/Index"] = "index";
  auto & tree = f.parser.add("index", [](rendering_context & ctx, std::string & out) {
    out += "<main>" + ctx.view->render_section("sidebar", {{"item", make_string("one")}}) +
           "</main>" + ctx.variables.get("item").string_v;
    return static_cast<int32_t>(VELLUM_OK);
  });
  rendering_kind kind = rendering_kind::layout;
  size_t depth = 0;
  tree.add_child("sidebar", [&](rendering_context & ctx, std::string & out) {
    kind = ctx.view->rendering_session().current_kind();
    depth = ctx.view->rendering_session().depth();
    out += ctx.variables.get("item").string_v;
    return static_cast<int32_t>(VELLUM_OK);
  });

  CHECK(f.page.render() == "<main>one</main>");
  CHECK(kind == rendering_kind::template_);
  CHECK(depth == 2);
  CHECK(f.depth() == 0);
}

TEST_CASE("render_section ignores or reports a missing template") {
  vellum::tests::view_fixture f;

  CHECK(f.page.render_section("header", {}, true).empty());
  CHECK(f.errors.calls == 0);

  CHECK(f.page.render_section("header", {}, false) == "<error>");
  CHECK(f.page.last_error() == VELLUM_ERR_TEMPLATE_NOT_FOUND);
  CHECK(f.errors.calls == 1);
  CHECK(f.depth() == 0);
}

TEST_CASE("render_section reports parse failures even when ignoring unknowns") {
  vellum::tests::view_fixture f;
  f.paths.templates["Blog/Index"] = "unparseable";

  CHECK(f.page.render_section("header", {}, true) == "<error>");
  CHECK(f.page.last_error() == VELLUM_ERR_PARSE_FAILED);
  CHECK(f.errors.calls == 1);
}

TEST_CASE("render_section returns a passthrough template verbatim") {
  vellum::tests::view_fixture f;
  f.paths.templates["Blog/Index"] = "RAW:plain";

  CHECK(f.page.render_section("header") == "RAW:plain");
  CHECK(f.page.last_passthrough());
  CHECK(f.errors.calls == 0);
  CHECK(f.depth() == 0);
}

TEST_CASE("render_section pops the frame when evaluation fails") {
  vellum::tests::view_fixture f;
  auto & tree = index_template(f);
  tree.add_child("broken", vellum::tests::fail_with(VELLUM_ERR_EVALUATION));

  CHECK(f.page.render_section("broken") == "<error>");
  CHECK(f.page.last_error() == VELLUM_ERR_EVALUATION);
  CHECK(f.errors.calls == 1);
  CHECK(f.depth() == 0);
}

TEST_CASE("render_section stops self-recursive sections at the nesting limit") {
  vellum::tests::view_fixture f;
  auto & tree = index_template(f);
  size_t deepest = 0;
  tree.add_child("loop", [&](rendering_context & ctx, std::string & out) {
    const size_t depth = ctx.view->rendering_session().depth();
    deepest = depth > deepest ? depth : deepest;
    out += ctx.view->render_section("loop");
    return static_cast<int32_t>(VELLUM_OK);
  });

  CHECK(f.page.render_section("loop") == "<error>");
  CHECK(deepest == vellum::view::k_max_render_depth);
  CHECK(f.errors.calls == 1);
  CHECK(f.errors.last_err == VELLUM_ERR_DEPTH_EXCEEDED);
  CHECK(f.page.last_error() == VELLUM_OK);
  CHECK(f.depth() == 0);
}

TEST_CASE("section machine rejects requests without an output") {
  vellum::tests::view_fixture f;
  vellum::view::section::action::context ctx{};
  ctx.session = &f.page.rendering_session();
  vellum::view::section::sm machine{ctx};

  int32_t err = VELLUM_OK;
  vellum::view::section::event::render_section request{
    .section_name = "header",
    .error_out = &err,
  };
  CHECK(machine.process_event(request));
  CHECK(err == VELLUM_ERR_INVALID_ARGUMENT);
  CHECK(machine.is(boost::sml::state<vellum::view::section::errored>));
}

TEST_CASE("section machine ends in done for an ignored miss and accepts the next request") {
  vellum::tests::view_fixture f;
  auto & tree = index_template(f);
  tree.add_child("header", vellum::tests::emit("header"));

  vellum::view::section::action::context ctx{};
  ctx.session = &f.page.rendering_session();
  vellum::view::section::sm machine{ctx};

  std::string output = "stale";
  int32_t err = VELLUM_ERR_BACKEND;
  vellum::view::section::event::render_section missing{
    .section_name = "missing",
    .ignore_unknown = true,
    .output_out = &output,
    .error_out = &err,
  };
  CHECK(machine.process_event(missing));
  CHECK(machine.is(boost::sml::state<vellum::view::section::done>));
  CHECK(output.empty());
  CHECK(err == VELLUM_OK);

  vellum::view::section::event::render_section header{
    .section_name = "header",
    .output_out = &output,
    .error_out = &err,
  };
  CHECK(machine.process_event(header));
  CHECK(machine.is(boost::sml::state<vellum::view::section::done>));
  CHECK(output == "header");
}

TEST_CASE("render_section reports a throwing section as an evaluation error") {
  vellum::tests::view_fixture f;
  auto & tree = index_template(f);
  tree.add_child("broken", [](rendering_context &, std::string &) -> int32_t {
    throw std::runtime_error("section exploded");
  });
  tree.add_child("header", vellum::tests::emit("header"));

  CHECK(f.page.render_section("broken") == "<error>");
  CHECK(f.page.last_error() == VELLUM_ERR_EVALUATION);
  CHECK(f.errors.calls == 1);
  CHECK(f.depth() == 0);

  CHECK(f.page.render_section("header") == "header");
  CHECK(f.depth() == 0);
}

TEST_CASE("render_section pops its frame before a foreign exception escapes") {
  vellum::tests::view_fixture f;
  auto & tree = index_template(f);
  tree.add_child("broken", [](rendering_context &, std::string &) -> int32_t { throw 42; });
  tree.add_child("header", vellum::tests::emit("header"));

  CHECK_THROWS_AS(f.page.render_section("broken"), int);
  CHECK(f.depth() == 0);
  CHECK(&f.page.rendering_session().current_context() == &f.page.base_context());

  CHECK(f.page.render_section("header") == "header");
  CHECK(f.depth() == 0);
}

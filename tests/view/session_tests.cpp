#include "doctest/doctest.h"

#include "vellum/vellum.h"
#include "vellum/view/session.hpp"
#include "view/fixtures.hpp"

namespace {

using vellum::view::rendering_kind;

struct session_fixture {
  vellum::tests::memory_paths paths = {};
  vellum::tests::scripted_parser parser = {};
  vellum::view::resolver::sm resolver{paths, parser};
  vellum::view::rendering_context base = {};
  vellum::view::session session{resolver, base};
};

}  // namespace

TEST_CASE("session defaults to the base scope and template kind when empty") {
  session_fixture f;
  CHECK(f.session.empty());
  CHECK(f.session.depth() == 0);
  CHECK(f.session.current_kind() == rendering_kind::template_);
  CHECK(&f.session.current_context() == &f.base);
  CHECK(&f.session.base_context() == &f.base);
}

TEST_CASE("session frames stack in LIFO order") {
  session_fixture f;
  auto & layout_tree = f.parser.add("layout");
  auto & partial_tree = f.parser.add("partial");
  vellum::view::rendering_context partial_scope = f.base.clone();

  f.session.start_rendering(rendering_kind::layout, &layout_tree, &f.base);
  f.session.start_rendering(rendering_kind::partial, &partial_tree, &partial_scope);
  CHECK(f.session.depth() == 2);
  CHECK(f.session.current_kind() == rendering_kind::partial);
  CHECK(&f.session.current_context() == &partial_scope);
  CHECK(f.session.top().parsed == &partial_tree);

  CHECK(f.session.stop_rendering() == VELLUM_OK);
  CHECK(f.session.current_kind() == rendering_kind::layout);
  CHECK(&f.session.current_context() == &f.base);

  CHECK(f.session.stop_rendering() == VELLUM_OK);
  CHECK(f.session.empty());
}

TEST_CASE("session reports underflow on an empty stack") {
  session_fixture f;
  CHECK(f.session.stop_rendering() == VELLUM_ERR_STACK_UNDERFLOW);
  CHECK(f.session.depth() == 0);
}

TEST_CASE("session current_template returns the top frame template") {
  session_fixture f;
  auto & tree = f.parser.add("tree");
  f.session.start_rendering(rendering_kind::template_, &tree, &f.base);

  vellum::view::resolution out;
  CHECK(f.session.current_template(out) == VELLUM_OK);
  CHECK(out.parsed == &tree);
  CHECK(f.parser.parses == 0);
  CHECK(f.session.stop_rendering() == VELLUM_OK);
}

TEST_CASE("session current_template resolves on demand without pushing") {
  session_fixture f;
  f.base.controller_name = "Blog";
  f.base.controller_action = "Show";
  f.paths.templates["Blog/Show"] = "show";
  auto & tree = f.parser.add("show");

  vellum::view::resolution out;
  CHECK(f.session.current_template(out) == VELLUM_OK);
  CHECK(out.parsed == &tree);
  CHECK(f.session.depth() == 0);

  vellum::view::resolution again;
  CHECK(f.session.current_template(again) == VELLUM_OK);
  CHECK(again.parsed == &tree);
  CHECK(f.parser.parses == 1);
}

TEST_CASE("session current_template reports missing templates") {
  session_fixture f;
  vellum::view::resolution out;
  CHECK(f.session.current_template(out) == VELLUM_ERR_TEMPLATE_NOT_FOUND);
  CHECK(out.parsed == nullptr);
  CHECK(f.session.depth() == 0);
}

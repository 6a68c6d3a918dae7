#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>

#include "vellum/sm.hpp"
#include "vellum/view/resolver/actions.hpp"
#include "vellum/view/resolver/events.hpp"
#include "vellum/view/resolver/guards.hpp"

namespace vellum::view::resolver {

struct initialized {};
struct loading {};
struct parsing {};
struct done {};
struct errored {};
struct unexpected {};

/**
 * template resolution model.
 *
 * state purposes:
 * - `initialized`: idle, accepts resolve requests.
 * - `loading`: source for a cache miss has been requested from the paths.
 * - `parsing`: the parser has produced a tree, a passthrough, or an error.
 * - `done`: the request was served (cached tree, fresh tree, or passthrough).
 * - `errored`: source lookup or parsing failed, or the request was invalid.
 * - `unexpected`: sequencing contract violation.
 *
 * guard semantics:
 * - `valid_resolve`/`invalid_resolve` check the output pointer and collaborators.
 * - `cached`/`not_cached` look the resolution key up in the cache.
 * - `source_passthrough`/`source_parsed` split a successful parse.
 *
 * action side effects:
 * - `serve_cached` answers from the cache without touching the collaborators.
 * - `load_source`/`parse_source` run the collaborators for a miss.
 * - `store_parsed` inserts the tree under its key; passthrough sources are
 *   never cached.
 */
struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    return sml::make_transition_table(
        *sml::state<initialized> +
            sml::event<event::resolve>[guard::valid_resolve{} && guard::cached{}] /
                action::serve_cached = sml::state<done>,
        sml::state<initialized> +
            sml::event<event::resolve>[guard::valid_resolve{} && guard::not_cached{}] /
                action::load_source = sml::state<loading>,
        sml::state<initialized> +
            sml::event<event::resolve>[guard::invalid_resolve{}] /
                action::reject_invalid = sml::state<errored>,

        sml::state<done> +
            sml::event<event::resolve>[guard::valid_resolve{} && guard::cached{}] /
                action::serve_cached = sml::state<done>,
        sml::state<done> +
            sml::event<event::resolve>[guard::valid_resolve{} && guard::not_cached{}] /
                action::load_source = sml::state<loading>,
        sml::state<done> +
            sml::event<event::resolve>[guard::invalid_resolve{}] /
                action::reject_invalid = sml::state<errored>,

        sml::state<errored> +
            sml::event<event::resolve>[guard::valid_resolve{} && guard::cached{}] /
                action::serve_cached = sml::state<done>,
        sml::state<errored> +
            sml::event<event::resolve>[guard::valid_resolve{} && guard::not_cached{}] /
                action::load_source = sml::state<loading>,
        sml::state<errored> +
            sml::event<event::resolve>[guard::invalid_resolve{}] /
                action::reject_invalid = sml::state<errored>,

        sml::state<unexpected> +
            sml::event<event::resolve>[guard::valid_resolve{} && guard::cached{}] /
                action::serve_cached = sml::state<done>,
        sml::state<unexpected> +
            sml::event<event::resolve>[guard::valid_resolve{} && guard::not_cached{}] /
                action::load_source = sml::state<loading>,
        sml::state<unexpected> +
            sml::event<event::resolve>[guard::invalid_resolve{}] /
                action::reject_invalid = sml::state<unexpected>,

        sml::state<loading>[guard::phase_failed{}] / action::finalize_error =
            sml::state<errored>,
        sml::state<loading>[guard::phase_ok{}] / action::parse_source = sml::state<parsing>,

        sml::state<parsing>[guard::phase_failed{}] / action::finalize_error =
            sml::state<errored>,
        sml::state<parsing>[guard::source_passthrough{}] / action::finalize_passthrough =
            sml::state<done>,
        sml::state<parsing>[guard::source_parsed{}] / action::store_parsed = sml::state<done>,

        sml::state<initialized> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<loading> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<parsing> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<done> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<errored> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<unexpected> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>);
  }
};

/**
 * Shared template cache.
 *
 * One resolver may back several views; requests are serialized so concurrent
 * misses on the same key parse once and converge on the same tree.
 */
struct sm : public vellum::sm<model> {
  using base_type = vellum::sm<model>;

  sm(template_paths & paths, template_parser & parser) : base_type(context_) {
    context_.paths = &paths;
    context_.parser = &parser;
  }

  bool process_event(const event::resolve & ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_type::process_event(ev);
  }

  template <class State>
  bool is(State state = {}) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_type::is(state);
  }

  size_t cached_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_.cache.size();
  }

  uint64_t cache_hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_.cache_hits;
  }

  uint64_t parses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_.parses;
  }

 private:
  action::context context_{};
  mutable std::mutex mutex_;
};

}  // namespace vellum::view::resolver

#pragma once

#include "vellum/sm.hpp"
#include "vellum/view/partial/actions.hpp"
#include "vellum/view/partial/events.hpp"
#include "vellum/view/partial/guards.hpp"

namespace vellum::view::partial {

struct initialized {};
struct resolving {};
struct dispatching {};
struct popping {};
struct done {};
struct errored {};
struct unexpected {};

/**
 * partial rendering model.
 *
 * state purposes:
 * - `initialized`: idle state awaiting a partial request.
 * - `resolving`: caller scope cloned, partial resolved and bound to the clone.
 * - `dispatching`: partial frame pushed; either a nested section or the whole
 *   partial is rendered.
 * - `popping`: partial frame popped.
 * - `done`: output, passthrough source, or ignored miss published.
 * - `errored`: delegated error output published, or invalid request.
 * - `unexpected`: sequencing contract violation.
 *
 * A nested section runs its own section machine on top of the partial frame
 * and its outcome (including passthrough) is forwarded unchanged.
 */
struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    return sml::make_transition_table(
        *sml::state<initialized> +
            sml::event<event::render_partial>[guard::valid_request{} &&
                                              guard::depth_available{}] /
                action::begin_partial = sml::state<resolving>,
        sml::state<initialized> +
            sml::event<event::render_partial>[guard::valid_request{} &&
                                              guard::depth_exhausted{}] /
                action::reject_depth = sml::state<errored>,
        sml::state<initialized> +
            sml::event<event::render_partial>[guard::invalid_request{}] /
                action::reject_invalid = sml::state<errored>,

        sml::state<done> +
            sml::event<event::render_partial>[guard::valid_request{} &&
                                              guard::depth_available{}] /
                action::begin_partial = sml::state<resolving>,
        sml::state<done> +
            sml::event<event::render_partial>[guard::valid_request{} &&
                                              guard::depth_exhausted{}] /
                action::reject_depth = sml::state<errored>,
        sml::state<done> +
            sml::event<event::render_partial>[guard::invalid_request{}] /
                action::reject_invalid = sml::state<errored>,

        sml::state<errored> +
            sml::event<event::render_partial>[guard::valid_request{} &&
                                              guard::depth_available{}] /
                action::begin_partial = sml::state<resolving>,
        sml::state<errored> +
            sml::event<event::render_partial>[guard::valid_request{} &&
                                              guard::depth_exhausted{}] /
                action::reject_depth = sml::state<errored>,
        sml::state<errored> +
            sml::event<event::render_partial>[guard::invalid_request{}] /
                action::reject_invalid = sml::state<errored>,

        sml::state<unexpected> +
            sml::event<event::render_partial>[guard::valid_request{} &&
                                              guard::depth_available{}] /
                action::begin_partial = sml::state<resolving>,
        sml::state<unexpected> +
            sml::event<event::render_partial>[guard::valid_request{} &&
                                              guard::depth_exhausted{}] /
                action::reject_depth = sml::state<errored>,
        sml::state<unexpected> +
            sml::event<event::render_partial>[guard::invalid_request{}] /
                action::reject_invalid = sml::state<unexpected>,

        sml::state<resolving>[guard::partial_passthrough{}] / action::emit_passthrough =
            sml::state<done>,
        sml::state<resolving>[guard::partial_missing_ignored{}] / action::emit_empty =
            sml::state<done>,
        sml::state<resolving>[guard::partial_failed{}] / action::report_partial_error =
            sml::state<errored>,
        sml::state<resolving>[guard::partial_resolved{}] / action::push_frame =
            sml::state<dispatching>,

        sml::state<dispatching>[guard::has_section{}] / action::render_nested_section =
            sml::state<popping>,
        sml::state<dispatching>[guard::no_section{}] / action::evaluate_partial =
            sml::state<popping>,

        sml::state<popping>[guard::evaluation_ok{}] / action::pop_and_emit = sml::state<done>,
        sml::state<popping>[guard::evaluation_failed{}] / action::pop_and_report =
            sml::state<errored>,

        sml::state<initialized> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<resolving> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<dispatching> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<popping> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<done> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<errored> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<unexpected> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>);
  }
};

struct sm : public vellum::sm<model> {
  using base_type = vellum::sm<model>;
  using base_type::base_type;
  using base_type::process_event;
};

}  // namespace vellum::view::partial

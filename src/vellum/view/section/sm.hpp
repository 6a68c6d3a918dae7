#pragma once

#include "vellum/sm.hpp"
#include "vellum/view/section/actions.hpp"
#include "vellum/view/section/events.hpp"
#include "vellum/view/section/guards.hpp"

namespace vellum::view::section {

struct initialized {};
struct resolving {};
struct locating {};
struct evaluating {};
struct popping {};
struct done {};
struct errored {};
struct unexpected {};

/**
 * section rendering model.
 *
 * state purposes:
 * - `initialized`: idle state awaiting a section request.
 * - `resolving`: scope chosen, template of the current frame obtained.
 * - `locating`: named child looked up on the template.
 * - `evaluating`: frame pushed, section body evaluated.
 * - `popping`: frame popped on both the success and the failure path.
 * - `done`: output, passthrough source, or ignored miss published.
 * - `errored`: delegated error output published, or invalid request.
 * - `unexpected`: sequencing contract violation.
 *
 * guard semantics:
 * - `template_*` branch on the resolution (passthrough, ignored miss, failure).
 * - `section_*` branch on the child lookup and the ignore flag.
 * - `evaluation_*` observe the status returned by the section body.
 *
 * Only `push_frame` pushes, and every path out of `evaluating` goes through
 * `popping`, so the session depth is the same before and after a request.
 */
struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    return sml::make_transition_table(
        *sml::state<initialized> +
            sml::event<event::render_section>[guard::valid_request{} &&
                                              guard::depth_available{}] /
                action::begin_section = sml::state<resolving>,
        sml::state<initialized> +
            sml::event<event::render_section>[guard::valid_request{} &&
                                              guard::depth_exhausted{}] /
                action::reject_depth = sml::state<errored>,
        sml::state<initialized> +
            sml::event<event::render_section>[guard::invalid_request{}] /
                action::reject_invalid = sml::state<errored>,

        sml::state<done> +
            sml::event<event::render_section>[guard::valid_request{} &&
                                              guard::depth_available{}] /
                action::begin_section = sml::state<resolving>,
        sml::state<done> +
            sml::event<event::render_section>[guard::valid_request{} &&
                                              guard::depth_exhausted{}] /
                action::reject_depth = sml::state<errored>,
        sml::state<done> +
            sml::event<event::render_section>[guard::invalid_request{}] /
                action::reject_invalid = sml::state<errored>,

        sml::state<errored> +
            sml::event<event::render_section>[guard::valid_request{} &&
                                              guard::depth_available{}] /
                action::begin_section = sml::state<resolving>,
        sml::state<errored> +
            sml::event<event::render_section>[guard::valid_request{} &&
                                              guard::depth_exhausted{}] /
                action::reject_depth = sml::state<errored>,
        sml::state<errored> +
            sml::event<event::render_section>[guard::invalid_request{}] /
                action::reject_invalid = sml::state<errored>,

        sml::state<unexpected> +
            sml::event<event::render_section>[guard::valid_request{} &&
                                              guard::depth_available{}] /
                action::begin_section = sml::state<resolving>,
        sml::state<unexpected> +
            sml::event<event::render_section>[guard::valid_request{} &&
                                              guard::depth_exhausted{}] /
                action::reject_depth = sml::state<errored>,
        sml::state<unexpected> +
            sml::event<event::render_section>[guard::invalid_request{}] /
                action::reject_invalid = sml::state<unexpected>,

        sml::state<resolving>[guard::template_passthrough{}] / action::emit_passthrough =
            sml::state<done>,
        sml::state<resolving>[guard::template_missing_ignored{}] / action::emit_empty =
            sml::state<done>,
        sml::state<resolving>[guard::template_failed{}] / action::report_template_error =
            sml::state<errored>,
        sml::state<resolving>[guard::template_resolved{}] / action::lookup_section =
            sml::state<locating>,

        sml::state<locating>[guard::section_missing_ignored{}] / action::emit_empty =
            sml::state<done>,
        sml::state<locating>[guard::section_missing_reported{}] /
            action::report_missing_section = sml::state<errored>,
        sml::state<locating>[guard::section_found{}] / action::push_frame =
            sml::state<evaluating>,

        sml::state<evaluating> / action::evaluate_section = sml::state<popping>,

        sml::state<popping>[guard::evaluation_ok{}] / action::pop_and_emit = sml::state<done>,
        sml::state<popping>[guard::evaluation_failed{}] / action::pop_and_report =
            sml::state<errored>,

        sml::state<initialized> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<resolving> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<locating> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<evaluating> + sml::unexpected_event<sml::_> /
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

}  // namespace vellum::view::section

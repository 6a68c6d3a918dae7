#pragma once

#include "vellum/sm.hpp"
#include "vellum/view/render/actions.hpp"
#include "vellum/view/render/events.hpp"
#include "vellum/view/render/guards.hpp"

namespace vellum::view::render {

struct initialized {};
struct resolving_template {};
struct choosing_layout {};
struct resolving_layout {};
struct evaluating_template {};
struct evaluating_layout {};
struct popping {};
struct done {};
struct errored {};
struct unexpected {};

/**
 * top-level render model.
 *
 * state purposes:
 * - `initialized`: idle state awaiting a render request.
 * - `resolving_template`: controller/action template resolved and bound.
 * - `choosing_layout`: `layoutName` declaration read from the template.
 * - `resolving_layout`: declared layout resolved and bound.
 * - `evaluating_template` / `evaluating_layout`: frame pushed, body evaluated
 *   against the base scope.
 * - `popping`: frame popped on both the success and the failure path.
 * - `done`: output or passthrough source published.
 * - `errored`: delegated error output published, or invalid request.
 * - `unexpected`: sequencing contract violation.
 *
 * Passthrough of either the template or the layout is published before any
 * frame is pushed.
 */
struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    return sml::make_transition_table(
        *sml::state<initialized> +
            sml::event<event::render>[guard::valid_request{} && guard::depth_available{}] /
                action::begin_render = sml::state<resolving_template>,
        sml::state<initialized> +
            sml::event<event::render>[guard::valid_request{} && guard::depth_exhausted{}] /
                action::reject_depth = sml::state<errored>,
        sml::state<initialized> + sml::event<event::render>[guard::invalid_request{}] /
                                      action::reject_invalid = sml::state<errored>,

        sml::state<done> +
            sml::event<event::render>[guard::valid_request{} && guard::depth_available{}] /
                action::begin_render = sml::state<resolving_template>,
        sml::state<done> +
            sml::event<event::render>[guard::valid_request{} && guard::depth_exhausted{}] /
                action::reject_depth = sml::state<errored>,
        sml::state<done> + sml::event<event::render>[guard::invalid_request{}] /
                               action::reject_invalid = sml::state<errored>,

        sml::state<errored> +
            sml::event<event::render>[guard::valid_request{} && guard::depth_available{}] /
                action::begin_render = sml::state<resolving_template>,
        sml::state<errored> +
            sml::event<event::render>[guard::valid_request{} && guard::depth_exhausted{}] /
                action::reject_depth = sml::state<errored>,
        sml::state<errored> + sml::event<event::render>[guard::invalid_request{}] /
                                  action::reject_invalid = sml::state<errored>,

        sml::state<unexpected> +
            sml::event<event::render>[guard::valid_request{} && guard::depth_available{}] /
                action::begin_render = sml::state<resolving_template>,
        sml::state<unexpected> +
            sml::event<event::render>[guard::valid_request{} && guard::depth_exhausted{}] /
                action::reject_depth = sml::state<errored>,
        sml::state<unexpected> + sml::event<event::render>[guard::invalid_request{}] /
                                     action::reject_invalid = sml::state<unexpected>,

        sml::state<resolving_template>[guard::template_passthrough{}] /
            action::emit_template_passthrough = sml::state<done>,
        sml::state<resolving_template>[guard::template_failed{}] /
            action::report_template_error = sml::state<errored>,
        sml::state<resolving_template>[guard::template_resolved{}] / action::lookup_layout =
            sml::state<choosing_layout>,

        sml::state<choosing_layout>[guard::has_layout{}] / action::resolve_layout =
            sml::state<resolving_layout>,
        sml::state<choosing_layout>[guard::no_layout{}] / action::push_template_frame =
            sml::state<evaluating_template>,

        sml::state<resolving_layout>[guard::layout_passthrough{}] /
            action::emit_layout_passthrough = sml::state<done>,
        sml::state<resolving_layout>[guard::layout_failed{}] / action::report_layout_error =
            sml::state<errored>,
        sml::state<resolving_layout>[guard::layout_resolved{}] / action::push_layout_frame =
            sml::state<evaluating_layout>,

        sml::state<evaluating_template> / action::evaluate_template = sml::state<popping>,
        sml::state<evaluating_layout> / action::evaluate_layout = sml::state<popping>,

        sml::state<popping>[guard::evaluation_ok{}] / action::pop_and_emit = sml::state<done>,
        sml::state<popping>[guard::evaluation_failed{}] / action::pop_and_report =
            sml::state<errored>,

        sml::state<initialized> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<resolving_template> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<choosing_layout> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<resolving_layout> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<evaluating_template> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<evaluating_layout> + sml::unexpected_event<sml::_> /
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

}  // namespace vellum::view::render

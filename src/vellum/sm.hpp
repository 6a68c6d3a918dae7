#pragma once

#include <boost/sml.hpp>
#include <utility>

namespace vellum {

/**
 * Thin owner around a boost::sml machine.
 *
 * Dependencies (the per-machine action context) are forwarded to the sml
 * constructor and held by reference, so a machine must not outlive the
 * context it was built with.
 */
template <class Model, class... Policies>
class sm {
 public:
  using model_type = Model;
  using state_machine_type = boost::sml::sm<Model, Policies...>;

  sm() = default;
  ~sm() = default;

  sm(const sm &) = delete;
  sm & operator=(const sm &) = delete;
  sm(sm &&) = delete;
  sm & operator=(sm &&) = delete;

  template <class... Args>
  explicit sm(Args &&... args) : state_machine_(std::forward<Args>(args)...) {}

  template <class Event>
  bool process_event(const Event & ev) {
    return state_machine_.process_event(ev);
  }

  template <class State>
  bool is(State state = {}) const {
    return state_machine_.is(state);
  }

 private:
  state_machine_type state_machine_;
};

}  // namespace vellum

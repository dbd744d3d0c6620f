#pragma once

#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

#include "tinyfsm/behavior.hpp"
#include "tinyfsm/trace.hpp"

namespace tinyfsm {

// Placeholder for machines without auxiliary members.
struct no_members {};

// Owns the current state, the shared context and any auxiliary members.
//
// The context is only ever mutated from inside Behavior::handle, enter and
// exit, each of which receives it as the sole mutable reference. One instance
// is not synchronized: drive it from one thread at a time, and never from
// inside its own hooks.
template <typename State, StateBehavior Behavior = state_behavior<State>,
          typename Members = no_members, typename Tracer = null_tracer>
class StateMachine {
  static_assert(std::is_same_v<State, typename Behavior::state_type>,
                "Behavior::state_type must be the machine's State");

 public:
  using behavior_type = Behavior;
  using state_type = State;
  using event_type = typename Behavior::event_type;
  using context_type = typename Behavior::context_type;
  using members_type = Members;
  using tracer_type = Tracer;

  // Starts in Behavior's initial state with a default context. No hooks run.
  constexpr StateMachine()
      : current_state_(initial_state<Behavior>()),
        context_{},
        members_{},
        tracer_{} {}

  // Installs the given state and context as is. No hooks run; call
  // transition(initial) instead when entering the first state has to take
  // effect.
  constexpr StateMachine(state_type initial, context_type context,
                         members_type members = {}, tracer_type tracer = {})
      : current_state_(std::move(initial)),
        context_(std::move(context)),
        members_(std::move(members)),
        tracer_(std::move(tracer)) {}

  [[nodiscard]] constexpr state_type current_state() const {
    return current_state_;
  }

  [[nodiscard]] constexpr const context_type& context() const noexcept {
    return context_;
  }

  [[nodiscard]] constexpr members_type& members() noexcept { return members_; }
  [[nodiscard]] constexpr const members_type& members() const noexcept {
    return members_;
  }

  [[nodiscard]] constexpr tracer_type& tracer() noexcept { return tracer_; }

  [[nodiscard]] static constexpr std::string_view name() noexcept {
    return name_of<Behavior>();
  }

  // exit(current) -> commit -> enter(next). Both hooks fire on a
  // self-transition too. The tracer hears about the transition once exit has
  // returned, so a throwing exit leaves no trace of it.
  constexpr void transition(state_type next) {
    invoke_exit<Behavior>(current_state_, context_);
    tracer_.on_transition(name(), current_state_, next);
    current_state_ = std::move(next);
    invoke_enter<Behavior>(current_state_, context_);
  }

  // Replaces the current state without running any hook. The caller keeps
  // the context consistent with the new state.
  constexpr void force_state(state_type next) {
    tracer_.on_force(name(), current_state_, next);
    current_state_ = std::move(next);
  }

  // Lets the current state decide on the event. Returns true when a
  // transition was taken; false leaves the state as it was and the context
  // as Behavior::handle left it.
  constexpr bool handle(const event_type& event) {
    tracer_.on_handle(name(), current_state_, event);
    std::optional<state_type> next =
        Behavior::handle(current_state_, event, context_);
    if (!next) {
      tracer_.on_unhandled(name(), current_state_, event);
      return false;
    }
    transition(std::move(*next));
    return true;
  }

 private:
  state_type current_state_;
  context_type context_;
  [[no_unique_address]] members_type members_;
  [[no_unique_address]] tracer_type tracer_;
};

}  // namespace tinyfsm

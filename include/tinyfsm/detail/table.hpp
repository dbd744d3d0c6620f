#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "tinyfsm/detail/expressions.hpp"
#include "tinyfsm/detail/structural_tuple.hpp"

namespace tinyfsm::detail {

template <typename>
inline constexpr bool dependent_false_v = false;

// Calls an action, guard or computed target with as many of (context,
// argument) as it accepts. The argument is the event (or the alternative the
// transition is triggered by) for transitions, the state (or alternative) for
// entry and exit actions.
template <typename F, typename Context, typename Arg>
constexpr decltype(auto) call_with(const F& f, Context& context,
                                   const Arg& arg) {
  if constexpr (std::is_invocable_v<const F&, Context&, const Arg&>) {
    return f(context, arg);
  } else if constexpr (std::is_invocable_v<const F&, const Arg&>) {
    return f(arg);
  } else if constexpr (std::is_invocable_v<const F&, Context&>) {
    return f(context);
  } else if constexpr (std::is_invocable_v<const F&>) {
    return f();
  } else {
    static_assert(dependent_false_v<F>,
                  "callable must accept (Context&, const Arg&), (const Arg&), "
                  "(Context&) or ()");
  }
}

// --- State blocks ---

template <typename State, typename Value, typename... Partials>
constexpr bool state_matches(const state_expr<Value, Partials...>& block,
                             const State& state) {
  static_assert(std::is_convertible_v<Value, State>,
                "state(value) takes a value of the model's state_type");
  return state == static_cast<State>(block.value);
}

template <typename State, typename Alternative, typename... Partials>
constexpr bool state_matches(
    const alternative_state_expr<Alternative, Partials...>&,
    const State& state) {
  return std::holds_alternative<Alternative>(state);
}

template <typename State, typename... Partials>
constexpr bool state_matches(const any_state_expr<Partials...>&,
                             const State&) {
  return true;
}

// The state as seen by the actions of a Block: the held alternative for
// state<Alt>() blocks, the whole state otherwise.
template <typename Block, typename State>
constexpr decltype(auto) state_argument(const State& state) {
  using alternative = typename alternative_of<Block>::type;
  if constexpr (std::is_void_v<alternative>) {
    return (state);
  } else {
    return std::get<alternative>(state);
  }
}

// Runs every action of the Expr (entry_expr or exit_expr) parts of a block.
template <template <typename...> class Expr, typename Block, typename State,
          typename Context>
constexpr void run_state_actions(const Block& block, const State& state,
                                 Context& context) {
  detail::for_each(block.elements, [&](const auto& part) {
    using part_type = std::remove_cvref_t<decltype(part)>;
    if constexpr (is_instance_of_v<part_type, Expr>) {
      const auto& argument = state_argument<Block>(state);
      detail::for_each(part.actions, [&](const auto& action) {
        call_with(action, context, argument);
      });
    }
  });
}

// Entry or exit actions of every block matching the state: specific blocks
// first, any_state blocks after, each group in declaration order.
template <template <typename...> class Expr, typename Elements,
          typename State, typename Context>
constexpr void run_hooks(const Elements& elements, const State& state,
                         Context& context) {
  detail::for_each(elements, [&](const auto& node) {
    using node_type = std::remove_cvref_t<decltype(node)>;
    if constexpr (is_state_block<node_type>::value &&
                  !is_any_state<node_type>::value) {
      if (state_matches(node, state)) {
        run_state_actions<Expr>(node, state, context);
      }
    }
  });
  detail::for_each(elements, [&](const auto& node) {
    using node_type = std::remove_cvref_t<decltype(node)>;
    if constexpr (is_any_state<node_type>::value) {
      run_state_actions<Expr>(node, state, context);
    }
  });
}

// --- Transitions ---

template <typename Event, typename Part>
constexpr bool trigger_matches(const Part& part, const Event& event) {
  if constexpr (is_instance_of_v<Part, on_expr>) {
    return event == static_cast<Event>(part.value);
  } else if constexpr (is_trigger<Part>::value) {
    return std::holds_alternative<typename trigger_alternative<Part>::type>(
        event);
  } else {
    return true;
  }
}

template <typename State, typename Part, typename Context, typename Arg>
constexpr State make_target(const Part& part, const Context& context,
                            const Arg& argument) {
  if constexpr (is_instance_of_v<Part, target_expr>) {
    using value_type = std::remove_cvref_t<decltype(part.value)>;
    if constexpr (std::is_convertible_v<value_type, State>) {
      return static_cast<State>(part.value);
    } else {
      return State(call_with(part.value, context, argument));
    }
  } else {
    return State{typename alternative_of<Part>::type{}};
  }
}

// Tries one transition. Returns true when it is selected; `next` then holds
// its target, or stays empty for an internal transition.
template <typename State, typename Transition, typename Event,
          typename Context>
constexpr bool try_transition(const Transition& transition, const Event& event,
                              Context& context, std::optional<State>& next) {
  using traits = transition_traits<Transition>;

  const bool triggered =
      detail::all_of(transition.elements, [&](const auto& part) {
        return trigger_matches(part, event);
      });
  if (!triggered) {
    return false;
  }

  auto fire = [&](const auto& argument) {
    const Context& view = context;
    const bool allowed =
        detail::all_of(transition.elements, [&](const auto& part) {
          using part_type = std::remove_cvref_t<decltype(part)>;
          if constexpr (is_instance_of_v<part_type, guard_expr>) {
            return static_cast<bool>(call_with(part.predicate, view, argument));
          } else {
            return true;
          }
        });
    if (!allowed) {
      return false;
    }
    detail::for_each(transition.elements, [&](const auto& part) {
      using part_type = std::remove_cvref_t<decltype(part)>;
      if constexpr (is_instance_of_v<part_type, effect_expr>) {
        detail::for_each(part.actions, [&](const auto& action) {
          call_with(action, context, argument);
        });
      }
    });
    detail::for_each(transition.elements, [&](const auto& part) {
      using part_type = std::remove_cvref_t<decltype(part)>;
      if constexpr (is_target<part_type>::value) {
        next.emplace(make_target<State>(part, view, argument));
      }
    });
    return true;
  };

  if constexpr (std::is_void_v<typename traits::alternative>) {
    return fire(event);
  } else {
    return fire(std::get<typename traits::alternative>(event));
  }
}

template <typename State, typename Block, typename Event, typename Context>
constexpr bool select_in_block(const Block& block, const Event& event,
                               Context& context, std::optional<State>& next) {
  return detail::any_of(block.elements, [&](const auto& part) {
    using part_type = std::remove_cvref_t<decltype(part)>;
    if constexpr (is_transition<part_type>::value) {
      return try_transition<State>(part, event, context, next);
    } else {
      return false;
    }
  });
}

// Decision for (state, event): specific blocks first, then any_state blocks;
// the first selected transition wins.
template <typename State, typename Elements, typename Event, typename Context>
constexpr std::optional<State> select(const Elements& elements,
                                      const State& state, const Event& event,
                                      Context& context) {
  std::optional<State> next;
  const bool selected = detail::any_of(elements, [&](const auto& node) {
    using node_type = std::remove_cvref_t<decltype(node)>;
    if constexpr (is_state_block<node_type>::value &&
                  !is_any_state<node_type>::value) {
      return state_matches(node, state) &&
             select_in_block<State>(node, event, context, next);
    } else {
      return false;
    }
  });
  if (!selected) {
    detail::any_of(elements, [&](const auto& node) {
      using node_type = std::remove_cvref_t<decltype(node)>;
      if constexpr (is_any_state<node_type>::value) {
        return select_in_block<State>(node, event, context, next);
      } else {
        return false;
      }
    });
  }
  return next;
}

template <typename State, typename Elements>
constexpr State find_initial(const Elements& elements) {
  std::optional<State> initial;
  detail::for_each(elements, [&](const auto& node) {
    using node_type = std::remove_cvref_t<decltype(node)>;
    if constexpr (is_instance_of_v<node_type, initial_expr>) {
      initial.emplace(static_cast<State>(node.value));
    } else if constexpr (is_initial<node_type>::value) {
      initial.emplace(typename alternative_of<node_type>::type{});
    }
  });
  return *initial;
}

}  // namespace tinyfsm::detail

#pragma once

#include <cstddef>
#include <type_traits>

#include "tinyfsm/detail/structural_tuple.hpp"

namespace tinyfsm::detail {

template <typename State, typename... Partials>
struct state_expr {
  State value;
  structural_tuple<Partials...> elements;
};

// Matches a std::variant state currently holding Alternative.
template <typename Alternative, typename... Partials>
struct alternative_state_expr {
  structural_tuple<Partials...> elements;
};

template <typename... Partials>
struct any_state_expr {
  structural_tuple<Partials...> elements;
};

template <typename... Partials>
struct transition_expr {
  structural_tuple<Partials...> elements;
};

template <typename State>
struct initial_expr {
  State value;
};

template <typename Alternative>
struct initial_alternative_expr {};

template <typename... Actions>
struct entry_expr {
  structural_tuple<Actions...> actions;
};

template <typename... Actions>
struct exit_expr {
  structural_tuple<Actions...> actions;
};

template <typename... Actions>
struct effect_expr {
  structural_tuple<Actions...> actions;
};

template <typename Callable>
struct guard_expr {
  Callable predicate;
};

template <typename Event>
struct on_expr {
  Event value;
};

template <typename Alternative>
struct on_alternative_expr {};

// Either a state value or a callable producing one.
template <typename Target>
struct target_expr {
  Target value;
};

template <typename Alternative>
struct target_alternative_expr {};

// --- Node classification ---

template <typename T, template <typename...> class Template>
struct is_instance_of : std::false_type {};
template <template <typename...> class Template, typename... Args>
struct is_instance_of<Template<Args...>, Template> : std::true_type {};

template <typename T, template <typename...> class Template>
inline constexpr bool is_instance_of_v = is_instance_of<T, Template>::value;

template <typename T>
struct is_state_block : std::false_type {};
template <typename S, typename... Ps>
struct is_state_block<state_expr<S, Ps...>> : std::true_type {};
template <typename A, typename... Ps>
struct is_state_block<alternative_state_expr<A, Ps...>> : std::true_type {};
template <typename... Ps>
struct is_state_block<any_state_expr<Ps...>> : std::true_type {};

template <typename T>
struct is_any_state : std::false_type {};
template <typename... Ps>
struct is_any_state<any_state_expr<Ps...>> : std::true_type {};

template <typename T>
struct is_initial : std::false_type {};
template <typename S>
struct is_initial<initial_expr<S>> : std::true_type {};
template <typename A>
struct is_initial<initial_alternative_expr<A>> : std::true_type {};

template <typename T>
struct is_transition : std::false_type {};
template <typename... Ps>
struct is_transition<transition_expr<Ps...>> : std::true_type {};

template <typename T>
struct is_trigger : std::false_type {};
template <typename E>
struct is_trigger<on_expr<E>> : std::true_type {};
template <typename A>
struct is_trigger<on_alternative_expr<A>> : std::true_type {};

template <typename T>
struct is_target : std::false_type {};
template <typename T>
struct is_target<target_expr<T>> : std::true_type {};
template <typename A>
struct is_target<target_alternative_expr<A>> : std::true_type {};

// Event alternative a transition is triggered by, void when it takes the
// whole event.
template <typename T>
struct trigger_alternative {
  using type = void;
};
template <typename A>
struct trigger_alternative<on_alternative_expr<A>> {
  using type = A;
};

// Alternative referenced by state<Alt>(), target<Alt>() or initial<Alt>().
template <typename T>
struct alternative_of {
  using type = void;
};
template <typename A, typename... Ps>
struct alternative_of<alternative_state_expr<A, Ps...>> {
  using type = A;
};
template <typename A>
struct alternative_of<target_alternative_expr<A>> {
  using type = A;
};
template <typename A>
struct alternative_of<initial_alternative_expr<A>> {
  using type = A;
};

template <typename... Ts>
struct first_non_void {
  using type = void;
};
template <typename Head, typename... Tail>
struct first_non_void<Head, Tail...> {
  using type = std::conditional_t<!std::is_void_v<Head>, Head,
                                  typename first_non_void<Tail...>::type>;
};

template <typename Transition>
struct transition_traits;

template <typename... Partials>
struct transition_traits<transition_expr<Partials...>> {
  static constexpr std::size_t trigger_count =
      (std::size_t{0} + ... + std::size_t{is_trigger<Partials>::value});
  static constexpr std::size_t target_count =
      (std::size_t{0} + ... + std::size_t{is_target<Partials>::value});
  using alternative = typename first_non_void<
      typename trigger_alternative<Partials>::type...>::type;

  static_assert(trigger_count <= 1, "a transition takes at most one on()");
  static_assert(target_count <= 1, "a transition takes at most one target()");
};

template <typename State, typename Event, typename Context, typename Name,
          typename... Partials>
struct model_expression {
  using state_type = State;
  using event_type = Event;
  using context_type = Context;

  static constexpr std::size_t initial_count =
      (std::size_t{0} + ... + std::size_t{is_initial<Partials>::value});
  static_assert(initial_count <= 1, "a model takes at most one initial()");
  static constexpr bool has_initial = initial_count == 1;

  Name name;
  structural_tuple<Partials...> elements;
};

}  // namespace tinyfsm::detail

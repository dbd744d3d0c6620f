#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

#include "tinyfsm/behavior.hpp"
#include "tinyfsm/detail/expressions.hpp"
#include "tinyfsm/detail/fixed_string.hpp"
#include "tinyfsm/detail/structural_tuple.hpp"
#include "tinyfsm/detail/table.hpp"
#include "tinyfsm/machine.hpp"
#include "tinyfsm/match.hpp"
#include "tinyfsm/trace.hpp"

namespace tinyfsm {

// --- Model building blocks ---

template <typename State, typename... Partials>
[[nodiscard]] constexpr auto state(State value, Partials&&... partials) {
  return detail::state_expr<State, std::decay_t<Partials>...>{
      value,
      detail::make_structural_tuple(std::forward<Partials>(partials)...)};
}

template <typename Alternative, typename... Partials>
[[nodiscard]] constexpr auto state(Partials&&... partials) {
  return detail::alternative_state_expr<Alternative,
                                        std::decay_t<Partials>...>{
      detail::make_structural_tuple(std::forward<Partials>(partials)...)};
}

template <typename... Partials>
[[nodiscard]] constexpr auto any_state(Partials&&... partials) {
  return detail::any_state_expr<std::decay_t<Partials>...>{
      detail::make_structural_tuple(std::forward<Partials>(partials)...)};
}

template <typename... Partials>
[[nodiscard]] constexpr auto transition(Partials&&... partials) {
  return detail::transition_expr<std::decay_t<Partials>...>{
      detail::make_structural_tuple(std::forward<Partials>(partials)...)};
}

template <typename State>
[[nodiscard]] constexpr auto initial(State value) {
  return detail::initial_expr<State>{value};
}

template <typename Alternative>
[[nodiscard]] constexpr auto initial() {
  return detail::initial_alternative_expr<Alternative>{};
}

template <typename... Actions>
[[nodiscard]] constexpr auto entry(Actions&&... actions) {
  return detail::entry_expr<std::decay_t<Actions>...>{
      detail::make_structural_tuple(std::forward<Actions>(actions)...)};
}

template <typename... Actions>
[[nodiscard]] constexpr auto exit(Actions&&... actions) {
  return detail::exit_expr<std::decay_t<Actions>...>{
      detail::make_structural_tuple(std::forward<Actions>(actions)...)};
}

template <typename... Actions>
[[nodiscard]] constexpr auto effect(Actions&&... actions) {
  return detail::effect_expr<std::decay_t<Actions>...>{
      detail::make_structural_tuple(std::forward<Actions>(actions)...)};
}

template <typename Callable>
[[nodiscard]] constexpr auto guard(Callable&& callable) {
  return detail::guard_expr<std::decay_t<Callable>>{
      std::forward<Callable>(callable)};
}

template <typename Event>
[[nodiscard]] constexpr auto on(Event value) {
  return detail::on_expr<Event>{value};
}

template <typename Alternative>
[[nodiscard]] constexpr auto on() {
  return detail::on_alternative_expr<Alternative>{};
}

template <typename Target>
[[nodiscard]] constexpr auto target(Target&& value) {
  return detail::target_expr<std::decay_t<Target>>{
      std::forward<Target>(value)};
}

template <typename Alternative>
[[nodiscard]] constexpr auto target() {
  return detail::target_alternative_expr<Alternative>{};
}

// Assembles a transition table for the given state, event and context types.
//
//   constexpr auto model = tinyfsm::define<Door, Input, Lock>(
//       "door", tinyfsm::initial(Door::Closed),
//       tinyfsm::state(Door::Closed,
//                      tinyfsm::transition(tinyfsm::on(Input::Push),
//                                          tinyfsm::target(Door::Open))),
//       tinyfsm::state(Door::Open, ...));
//
// The result is meant to be passed as a template argument to table_behavior,
// so every value stored in it (states, events, callables) has to be usable
// as a non-type template argument: enums, integers, captureless lambdas.
template <typename State, typename Event, typename Context, std::size_t N,
          typename... Partials>
[[nodiscard]] constexpr auto define(const char (&name)[N],
                                    Partials&&... partials) noexcept {
  using name_type = detail::fixed_string<N>;
  using expression_type =
      detail::model_expression<State, Event, Context, name_type,
                               std::decay_t<Partials>...>;
  return expression_type{
      name_type{name},
      detail::make_structural_tuple(std::forward<Partials>(partials)...)};
}

// StateBehavior driven by a model built with define().
template <auto Model>
struct table_behavior {
  using model_type = std::remove_cvref_t<decltype(Model)>;
  using state_type = typename model_type::state_type;
  using event_type = typename model_type::event_type;
  using context_type = typename model_type::context_type;

  static constexpr std::string_view name() noexcept {
    return Model.name.view();
  }

  static constexpr state_type initial()
    requires(model_type::has_initial)
  {
    return detail::find_initial<state_type>(Model.elements);
  }

  static constexpr std::optional<state_type> handle(const state_type& state,
                                                    const event_type& event,
                                                    context_type& context) {
    return detail::select(Model.elements, state, event, context);
  }

  static constexpr void enter(const state_type& state, context_type& context) {
    detail::run_hooks<detail::entry_expr>(Model.elements, state, context);
  }

  static constexpr void exit(const state_type& state, context_type& context) {
    detail::run_hooks<detail::exit_expr>(Model.elements, state, context);
  }
};

}  // namespace tinyfsm

#pragma once

#include <cstddef>
#include <type_traits>
#include <utility>

namespace tinyfsm::detail {

// Tuple usable as (part of) a non-type template parameter: every member is
// public, so a model built from it stays a structural type.
template <typename... Ts>
struct structural_tuple;

template <>
struct structural_tuple<> {};

template <typename Head, typename... Tail>
struct structural_tuple<Head, Tail...> {
  Head head;
  structural_tuple<Tail...> tail;
};

namespace tuple_detail {

template <std::size_t I, typename Tuple>
struct get_impl;

template <std::size_t I, typename Head, typename... Tail>
struct get_impl<I, structural_tuple<Head, Tail...>> {
  static constexpr const auto& value(const structural_tuple<Head, Tail...>& t) {
    return get_impl<I - 1, structural_tuple<Tail...>>::value(t.tail);
  }
};

template <typename Head, typename... Tail>
struct get_impl<0, structural_tuple<Head, Tail...>> {
  static constexpr const Head& value(const structural_tuple<Head, Tail...>& t) {
    return t.head;
  }
};

}  // namespace tuple_detail

template <std::size_t I, typename... Ts>
constexpr const auto& get(const structural_tuple<Ts...>& t) {
  return tuple_detail::get_impl<I, structural_tuple<Ts...>>::value(t);
}

constexpr structural_tuple<> make_structural_tuple() { return {}; }

template <typename Head, typename... Tail>
constexpr structural_tuple<Head, Tail...> make_structural_tuple(Head h,
                                                                Tail... t) {
  return {h, make_structural_tuple(t...)};
}

template <typename... Ts, typename F, std::size_t... Is>
constexpr void for_each_impl(const structural_tuple<Ts...>& t, F&& f,
                             std::index_sequence<Is...>) {
  (f(detail::get<Is>(t)), ...);
}

// Calls f on every element, front to back.
template <typename... Ts, typename F>
constexpr void for_each(const structural_tuple<Ts...>& t, F&& f) {
  for_each_impl(t, f, std::index_sequence_for<Ts...>{});
}

template <typename... Ts, typename F, std::size_t... Is>
constexpr bool any_of_impl(const structural_tuple<Ts...>& t, F&& f,
                           std::index_sequence<Is...>) {
  return (static_cast<bool>(f(detail::get<Is>(t))) || ...);
}

// Front to back; stops at the first element for which f returns true.
template <typename... Ts, typename F>
constexpr bool any_of(const structural_tuple<Ts...>& t, F&& f) {
  return any_of_impl(t, f, std::index_sequence_for<Ts...>{});
}

template <typename... Ts, typename F, std::size_t... Is>
constexpr bool all_of_impl(const structural_tuple<Ts...>& t, F&& f,
                           std::index_sequence<Is...>) {
  return (static_cast<bool>(f(detail::get<Is>(t))) && ...);
}

template <typename... Ts, typename F>
constexpr bool all_of(const structural_tuple<Ts...>& t, F&& f) {
  return all_of_impl(t, f, std::index_sequence_for<Ts...>{});
}

}  // namespace tinyfsm::detail


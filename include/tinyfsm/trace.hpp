#pragma once

#include <iostream>
#include <ostream>
#include <string_view>
#include <type_traits>
#include <variant>

#include "tinyfsm/detail/type_name.hpp"

namespace tinyfsm {

namespace detail {

template <typename T>
concept streamable = requires(std::ostream& os, const T& value) {
  os << value;
};

template <typename T>
struct is_variant : std::false_type {};

template <typename... Ts>
struct is_variant<std::variant<Ts...>> : std::true_type {};

// Best effort text for a state or event value.
template <typename T>
void describe(std::ostream& os, const T& value) {
  if constexpr (streamable<T>) {
    os << value;
  } else if constexpr (std::is_enum_v<T>) {
    os << type_name<T>() << '('
       << +static_cast<std::underlying_type_t<T>>(value) << ')';
  } else if constexpr (is_variant<T>::value) {
    std::visit([&os](const auto& alternative) { describe(os, alternative); },
               value);
  } else {
    os << type_name<T>();
  }
}

}  // namespace detail

// Default tracer, compiles away.
struct null_tracer {
  template <typename State, typename Event>
  constexpr void on_handle(std::string_view, const State&,
                           const Event&) noexcept {}

  template <typename State, typename Event>
  constexpr void on_unhandled(std::string_view, const State&,
                              const Event&) noexcept {}

  template <typename State>
  constexpr void on_transition(std::string_view, const State&,
                               const State&) noexcept {}

  template <typename State>
  constexpr void on_force(std::string_view, const State&,
                          const State&) noexcept {}
};

// Writes one line per notification:
//   [mario] SmallMario <- Hit
//   [mario] SmallMario -> DeadMario
//   [mario] DeadMario ignores Hit
//   [mario] DeadMario => SmallMario (forced)
class stream_tracer {
 public:
  stream_tracer() noexcept : os_(&std::cerr) {}
  explicit stream_tracer(std::ostream& os) noexcept : os_(&os) {}

  template <typename State, typename Event>
  void on_handle(std::string_view name, const State& state,
                 const Event& event) {
    prefix(name);
    detail::describe(*os_, state);
    *os_ << " <- ";
    detail::describe(*os_, event);
    *os_ << '\n';
  }

  template <typename State, typename Event>
  void on_unhandled(std::string_view name, const State& state,
                    const Event& event) {
    prefix(name);
    detail::describe(*os_, state);
    *os_ << " ignores ";
    detail::describe(*os_, event);
    *os_ << '\n';
  }

  template <typename State>
  void on_transition(std::string_view name, const State& from,
                     const State& to) {
    prefix(name);
    detail::describe(*os_, from);
    *os_ << " -> ";
    detail::describe(*os_, to);
    *os_ << '\n';
  }

  template <typename State>
  void on_force(std::string_view name, const State& from, const State& to) {
    prefix(name);
    detail::describe(*os_, from);
    *os_ << " => ";
    detail::describe(*os_, to);
    *os_ << " (forced)\n";
  }

  [[nodiscard]] std::ostream& stream() const noexcept { return *os_; }

 private:
  void prefix(std::string_view name) { *os_ << '[' << name << "] "; }

  std::ostream* os_;
};

}  // namespace tinyfsm

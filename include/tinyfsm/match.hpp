#pragma once

#include <variant>

namespace tinyfsm {

// Visitor assembled from lambdas, for std::visit over variant states/events:
//
//   std::visit(tinyfsm::overloaded{
//                  [&](const Idle&, const Start&) -> Next { ... },
//                  [](const auto&, const auto&) -> Next { return {}; }},
//              state, event);
template <typename... Fs>
struct overloaded : Fs... {
  using Fs::operator()...;
};

template <typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

template <typename Alternative, typename... Ts>
[[nodiscard]] constexpr bool holds(const std::variant<Ts...>& value) noexcept {
  return std::holds_alternative<Alternative>(value);
}

}  // namespace tinyfsm

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <string_view>

namespace tinyfsm::detail {

// Model name held by value. A string literal pointer can't be part of a
// template argument, its characters can.
template <std::size_t N>
struct fixed_string {
  std::array<char, N> value{};

  constexpr fixed_string(const char (&text)[N]) noexcept {
    std::copy_n(text, N, value.begin());
  }

  // Drops the literal's terminator.
  [[nodiscard]] constexpr std::string_view view() const noexcept {
    return {value.data(), N - 1};
  }
};

template <std::size_t N>
fixed_string(const char (&)[N]) -> fixed_string<N>;

}  // namespace tinyfsm::detail

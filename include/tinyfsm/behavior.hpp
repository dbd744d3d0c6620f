#pragma once

#include <concepts>
#include <optional>
#include <string_view>
#include <type_traits>

#include "tinyfsm/detail/type_name.hpp"

namespace tinyfsm {

// Behavior attached to a state type. Specialize for your State:
//
//   template <>
//   struct tinyfsm::state_behavior<Light> {
//     using state_type = Light;
//     using event_type = Switch;
//     using context_type = Room;
//     static std::optional<Light> handle(const Light&, const Switch&, Room&);
//     static void enter(const Light&, Room&);  // optional
//     static void exit(const Light&, Room&);   // optional
//   };
template <typename State>
struct state_behavior;

namespace detail {

template <typename B>
using hook_pointer = void (*)(const typename B::state_type&,
                              typename B::context_type&);

// An enter/exit that exists must take (const state_type&, context_type&) and
// return void; anything else is rejected rather than skipped.
template <typename B>
concept declares_enter = requires { &B::enter; };

template <typename B>
concept has_enter =
    requires { static_cast<hook_pointer<B>>(&B::enter); };

template <typename B>
concept declares_exit = requires { &B::exit; };

template <typename B>
concept has_exit = requires { static_cast<hook_pointer<B>>(&B::exit); };

template <typename B>
concept has_initial = requires {
  { B::initial() } -> std::convertible_to<typename B::state_type>;
};

template <typename B>
concept declares_name = requires { B::name(); };

// The name is kept as a string_view, so name() must hand out storage that
// outlives the call: a string_view or a C string, never an owning string.
template <typename B>
concept has_name = requires {
  requires std::same_as<std::remove_cvref_t<decltype(B::name())>,
                        std::string_view> ||
               std::same_as<std::decay_t<decltype(B::name())>, const char*>;
};

}  // namespace detail

template <typename B>
concept StateBehavior =
    requires {
      typename B::state_type;
      typename B::event_type;
      typename B::context_type;
    } &&
    std::copyable<typename B::state_type> &&
    std::equality_comparable<typename B::state_type> &&
    std::copyable<typename B::event_type> &&
    std::equality_comparable<typename B::event_type> &&
    std::default_initializable<typename B::context_type> &&
    requires(const typename B::state_type& s, const typename B::event_type& e,
             typename B::context_type& c) {
      {
        B::handle(s, e, c)
      } -> std::same_as<std::optional<typename B::state_type>>;
    } &&
    (!detail::declares_enter<B> || detail::has_enter<B>) &&
    (!detail::declares_exit<B> || detail::has_exit<B>) &&
    (!detail::declares_name<B> || detail::has_name<B>);

// Hooks are optional; a behavior without them gets no-ops.
template <StateBehavior B>
constexpr void invoke_enter(const typename B::state_type& state,
                            typename B::context_type& context) {
  if constexpr (detail::has_enter<B>) {
    B::enter(state, context);
  }
}

template <StateBehavior B>
constexpr void invoke_exit(const typename B::state_type& state,
                           typename B::context_type& context) {
  if constexpr (detail::has_exit<B>) {
    B::exit(state, context);
  }
}

// State of a default constructed machine: B::initial() if declared, else the
// value initialized state (first enumerator, first variant alternative).
template <StateBehavior B>
[[nodiscard]] constexpr typename B::state_type initial_state() {
  if constexpr (detail::has_initial<B>) {
    return B::initial();
  } else {
    static_assert(std::is_default_constructible_v<typename B::state_type>,
                  "state_type needs a default value or B::initial()");
    return typename B::state_type{};
  }
}

template <StateBehavior B>
[[nodiscard]] constexpr std::string_view name_of() {
  if constexpr (detail::has_name<B>) {
    return std::string_view(B::name());
  } else {
    return detail::type_name<typename B::state_type>();
  }
}

}  // namespace tinyfsm

#include <iostream>
#include <optional>
#include <ostream>
#include <variant>

#include "tinyfsm/tinyfsm.hpp"

enum class Consumable { Mushroom, Flower, Feather };
enum class Size { Small, Large };
enum class Mario { Dead, Small, Super, Fire, Cape };

std::ostream& operator<<(std::ostream& os, Mario mario) {
  switch (mario) {
    case Mario::Dead:
      return os << "DeadMario";
    case Mario::Small:
      return os << "SmallMario";
    case Mario::Super:
      return os << "SuperMario";
    case Mario::Fire:
      return os << "FireMario";
    case Mario::Cape:
      return os << "CapeMario";
  }
  return os;
}

struct GetConsumable {
  Consumable item;
  bool operator==(const GetConsumable&) const = default;
};

struct Hit {
  bool operator==(const Hit&) const = default;
};

using Event = std::variant<GetConsumable, Hit>;

struct Context {
  Size size = Size::Small;
  bool alive = true;
};

template <>
struct tinyfsm::state_behavior<Mario> {
  using state_type = Mario;
  using event_type = Event;
  using context_type = Context;

  static constexpr std::string_view name() { return "mario"; }

  static std::optional<Mario> handle(const Mario& mario, const Event& event,
                                     Context&) {
    if (std::holds_alternative<Hit>(event)) {
      switch (mario) {
        case Mario::Small:
          return Mario::Dead;
        case Mario::Super:
        case Mario::Fire:
        case Mario::Cape:
          return Mario::Small;
        case Mario::Dead:
          break;
      }
      return std::nullopt;
    }

    const Consumable item = std::get<GetConsumable>(event).item;
    switch (mario) {
      case Mario::Small:
        if (item == Consumable::Mushroom) return Mario::Super;
        return item == Consumable::Flower ? Mario::Fire : Mario::Cape;
      case Mario::Super:
        if (item == Consumable::Flower) return Mario::Fire;
        if (item == Consumable::Feather) return Mario::Cape;
        return std::nullopt;
      case Mario::Fire:
        if (item == Consumable::Feather) return Mario::Cape;
        return std::nullopt;
      case Mario::Cape:
        if (item == Consumable::Flower) return Mario::Fire;
        return std::nullopt;
      case Mario::Dead:
        return std::nullopt;
    }
    return std::nullopt;
  }

  static void enter(const Mario& mario, Context& context) {
    switch (mario) {
      case Mario::Dead:
        context.alive = false;
        break;
      case Mario::Small:
        context.size = Size::Small;
        break;
      default:
        context.size = Size::Large;
        break;
    }
  }
};

int main() {
  tinyfsm::StateMachine<Mario, tinyfsm::state_behavior<Mario>,
                        tinyfsm::no_members, tinyfsm::stream_tracer>
      mario{Mario::Small, Context{}, {}, tinyfsm::stream_tracer{std::cout}};

  mario.handle(GetConsumable{Consumable::Mushroom});
  mario.handle(GetConsumable{Consumable::Flower});
  mario.handle(GetConsumable{Consumable::Feather});
  mario.handle(Hit{});
  mario.handle(Hit{});
  mario.handle(Hit{});

  std::cout << "mario ends as " << mario.current_state() << ", alive: "
            << std::boolalpha << mario.context().alive << '\n';
  return 0;
}

#include <iostream>
#include <ostream>

#include "tinyfsm/tinyfsm.hpp"

namespace {

enum class Gate { Locked, Unlocked };
enum class Input { Coin, Push };

std::ostream& operator<<(std::ostream& os, Gate gate) {
  return os << (gate == Gate::Locked ? "Locked" : "Unlocked");
}

std::ostream& operator<<(std::ostream& os, Input input) {
  return os << (input == Input::Coin ? "Coin" : "Push");
}

struct Till {
  int coins = 0;
  int passes = 0;
  int refused = 0;
};

constexpr auto turnstile = tinyfsm::define<Gate, Input, Till>(
    "turnstile", tinyfsm::initial(Gate::Locked),
    tinyfsm::state(
        Gate::Locked,
        tinyfsm::transition(
            tinyfsm::on(Input::Coin),
            tinyfsm::effect([](Till& till) { ++till.coins; }),
            tinyfsm::target(Gate::Unlocked)),
        tinyfsm::transition(
            tinyfsm::on(Input::Push),
            tinyfsm::effect([](Till& till) { ++till.refused; }))),
    tinyfsm::state(
        Gate::Unlocked,
        tinyfsm::entry([] { std::cout << "  gate opens\n"; }),
        tinyfsm::exit([] { std::cout << "  gate closes\n"; }),
        tinyfsm::transition(
            tinyfsm::on(Input::Push),
            tinyfsm::effect([](Till& till) { ++till.passes; }),
            tinyfsm::target(Gate::Locked))));

}  // namespace

int main() {
  tinyfsm::StateMachine<Gate, tinyfsm::table_behavior<turnstile>,
                        tinyfsm::no_members, tinyfsm::stream_tracer>
      gate{Gate::Locked, Till{}, {}, tinyfsm::stream_tracer{std::cout}};

  for (Input input : {Input::Push, Input::Coin, Input::Coin, Input::Push,
                      Input::Push}) {
    gate.handle(input);
  }

  const Till& till = gate.context();
  std::cout << "coins: " << till.coins << ", passes: " << till.passes
            << ", refused: " << till.refused << '\n';
  return 0;
}

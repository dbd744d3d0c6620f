#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <optional>
#include <variant>

#include "tinyfsm/tinyfsm.hpp"

namespace {

enum class Consumable { Mushroom, Flower, Feather };
enum class Size { Small, Large };
enum class Form { Dead, Small, Super, Fire, Cape };

struct GetConsumable {
  Consumable item;
  bool operator==(const GetConsumable&) const = default;
};

struct Hit {
  bool operator==(const Hit&) const = default;
};

using Event = std::variant<GetConsumable, Hit>;

struct Status {
  Size size = Size::Small;
  bool alive = true;
};

// Decision table written out by hand.
struct HandWritten {
  using state_type = Form;
  using event_type = Event;
  using context_type = Status;

  static std::optional<Form> handle(const Form& form, const Event& event,
                                    Status&) {
    return std::visit(
        tinyfsm::overloaded{
            [&](const GetConsumable& pickup) { return grab(form, pickup.item); },
            [&](const Hit&) { return hit(form); }},
        event);
  }

  static void enter(const Form& form, Status& status) {
    switch (form) {
      case Form::Dead:
        status.alive = false;
        break;
      case Form::Small:
        status.size = Size::Small;
        break;
      case Form::Super:
      case Form::Fire:
      case Form::Cape:
        status.size = Size::Large;
        break;
    }
  }

 private:
  static std::optional<Form> grab(Form form, Consumable item) {
    switch (form) {
      case Form::Small:
        switch (item) {
          case Consumable::Mushroom:
            return Form::Super;
          case Consumable::Flower:
            return Form::Fire;
          case Consumable::Feather:
            return Form::Cape;
        }
        break;
      case Form::Super:
        if (item == Consumable::Flower) return Form::Fire;
        if (item == Consumable::Feather) return Form::Cape;
        break;
      case Form::Fire:
        if (item == Consumable::Feather) return Form::Cape;
        break;
      case Form::Cape:
        if (item == Consumable::Flower) return Form::Fire;
        break;
      case Form::Dead:
        break;
    }
    return std::nullopt;
  }

  static std::optional<Form> hit(Form form) {
    switch (form) {
      case Form::Small:
        return Form::Dead;
      case Form::Super:
      case Form::Fire:
      case Form::Cape:
        return Form::Small;
      case Form::Dead:
        break;
    }
    return std::nullopt;
  }
};

struct picks {
  Consumable item;

  constexpr bool operator()(const GetConsumable& pickup) const {
    return pickup.item == item;
  }
};

constexpr auto shrink = [](Status& status) { status.size = Size::Small; };
constexpr auto grow = [](Status& status) { status.size = Size::Large; };

// Same machine as a declarative table.
constexpr auto mario_model = tinyfsm::define<Form, Event, Status>(
    "mario", tinyfsm::initial(Form::Small),
    tinyfsm::state(Form::Dead,
                   tinyfsm::entry([](Status& status) { status.alive = false; })),
    tinyfsm::state(
        Form::Small, tinyfsm::entry(shrink),
        tinyfsm::transition(tinyfsm::on<GetConsumable>(),
                            tinyfsm::guard(picks{Consumable::Mushroom}),
                            tinyfsm::target(Form::Super)),
        tinyfsm::transition(tinyfsm::on<GetConsumable>(),
                            tinyfsm::guard(picks{Consumable::Flower}),
                            tinyfsm::target(Form::Fire)),
        tinyfsm::transition(tinyfsm::on<GetConsumable>(),
                            tinyfsm::guard(picks{Consumable::Feather}),
                            tinyfsm::target(Form::Cape)),
        tinyfsm::transition(tinyfsm::on<Hit>(), tinyfsm::target(Form::Dead))),
    tinyfsm::state(
        Form::Super, tinyfsm::entry(grow),
        tinyfsm::transition(tinyfsm::on<GetConsumable>(),
                            tinyfsm::guard(picks{Consumable::Flower}),
                            tinyfsm::target(Form::Fire)),
        tinyfsm::transition(tinyfsm::on<GetConsumable>(),
                            tinyfsm::guard(picks{Consumable::Feather}),
                            tinyfsm::target(Form::Cape))),
    tinyfsm::state(
        Form::Fire, tinyfsm::entry(grow),
        tinyfsm::transition(tinyfsm::on<GetConsumable>(),
                            tinyfsm::guard(picks{Consumable::Feather}),
                            tinyfsm::target(Form::Cape))),
    tinyfsm::state(
        Form::Cape, tinyfsm::entry(grow),
        tinyfsm::transition(tinyfsm::on<GetConsumable>(),
                            tinyfsm::guard(picks{Consumable::Flower}),
                            tinyfsm::target(Form::Fire))),
    // Every powered-up form drops back to Small on a hit.
    tinyfsm::state(Form::Super,
                   tinyfsm::transition(tinyfsm::on<Hit>(),
                                       tinyfsm::target(Form::Small))),
    tinyfsm::state(Form::Fire,
                   tinyfsm::transition(tinyfsm::on<Hit>(),
                                       tinyfsm::target(Form::Small))),
    tinyfsm::state(Form::Cape,
                   tinyfsm::transition(tinyfsm::on<Hit>(),
                                       tinyfsm::target(Form::Small))));

using TableDriven = tinyfsm::table_behavior<mario_model>;

static_assert(tinyfsm::StateBehavior<HandWritten>);
static_assert(tinyfsm::StateBehavior<TableDriven>);

}  // namespace

TEST_CASE_TEMPLATE("mario powers up, gets hit and dies", Behavior, HandWritten,
                   TableDriven) {
  tinyfsm::StateMachine<Form, Behavior> mario{Form::Small,
                                              Status{Size::Small, true}};

  CHECK(mario.current_state() == Form::Small);
  CHECK(mario.context().size == Size::Small);
  CHECK(mario.context().alive);

  CHECK(mario.handle(GetConsumable{Consumable::Mushroom}));
  CHECK(mario.current_state() == Form::Super);
  CHECK(mario.context().size == Size::Large);
  CHECK(mario.context().alive);

  CHECK(mario.handle(GetConsumable{Consumable::Flower}));
  CHECK(mario.current_state() == Form::Fire);
  CHECK(mario.context().size == Size::Large);
  CHECK(mario.context().alive);

  CHECK(mario.handle(GetConsumable{Consumable::Feather}));
  CHECK(mario.current_state() == Form::Cape);
  CHECK(mario.context().size == Size::Large);
  CHECK(mario.context().alive);

  CHECK(mario.handle(Hit{}));
  CHECK(mario.current_state() == Form::Small);
  CHECK(mario.context().size == Size::Small);
  CHECK(mario.context().alive);

  CHECK(mario.handle(Hit{}));
  CHECK(mario.current_state() == Form::Dead);
  CHECK_FALSE(mario.context().alive);

  CHECK_FALSE(mario.handle(Hit{}));
  CHECK_FALSE(mario.handle(GetConsumable{Consumable::Mushroom}));
  CHECK(mario.current_state() == Form::Dead);
  CHECK_FALSE(mario.context().alive);
}

TEST_CASE_TEMPLATE("powered-up forms ignore weaker items", Behavior,
                   HandWritten, TableDriven) {
  tinyfsm::StateMachine<Form, Behavior> mario{Form::Fire,
                                              Status{Size::Large, true}};

  CHECK_FALSE(mario.handle(GetConsumable{Consumable::Mushroom}));
  CHECK_FALSE(mario.handle(GetConsumable{Consumable::Flower}));
  CHECK(mario.current_state() == Form::Fire);
  CHECK(mario.context().size == Size::Large);
}

TEST_CASE("default construction picks the declared initial state") {
  tinyfsm::StateMachine<Form, HandWritten> hand_written;
  CHECK(hand_written.current_state() == Form::Dead);

  tinyfsm::StateMachine<Form, TableDriven> table_driven;
  CHECK(table_driven.current_state() == Form::Small);
  CHECK(table_driven.context().alive);
  CHECK(table_driven.name() == "mario");
}

TEST_CASE("entering the initial state is up to the caller") {
  tinyfsm::StateMachine<Form, TableDriven> mario{Form::Super, Status{}};
  CHECK(mario.context().size == Size::Small);

  mario.transition(mario.current_state());
  CHECK(mario.current_state() == Form::Super);
  CHECK(mario.context().size == Size::Large);
}

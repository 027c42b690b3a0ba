#include <catch2/catch.hpp>
#include <bhv/event.hpp>

#include <string>

namespace {

BHV_MARKER_EVENT(Tick);
BHV_MARKER_EVENT(Exit);

namespace game {
BHV_MARKER_EVENT_NAMED(Exit, "game::Exit");
}  // namespace game

// Value-dependent event: each variant is its own kind.
class Input final : public bhv::Event {
 public:
  enum class Key { kUp, kDown };

  explicit Input(Key key) noexcept : key_(key) {}

  const char* name() const noexcept override {
    return (key_ == Key::kUp) ? "Input::Up" : "Input::Down";
  }

 private:
  Key key_;
};

}  // namespace

TEST_CASE("EventKind is a constexpr fingerprint", "[event]") {
  constexpr bhv::EventKind a = bhv::EventKind::FromName("Exit");
  constexpr bhv::EventKind b = bhv::EventKind::FromName("Exit");
  static_assert(a == b, "same name, same kind");
  static_assert(a != bhv::EventKind::FromName("Tick"), "");
  REQUIRE(a == b);
}

TEST_CASE("EventKind uses 64-bit FNV-1a", "[event]") {
  // Reference values of FNV-1a 64.
  REQUIRE(bhv::EventKind::FromName("").value() == 0xcbf29ce484222325ULL);
  REQUIRE(bhv::EventKind::FromName("a").value() == 0xaf63dc4c8601ec8cULL);
  REQUIRE(bhv::EventKind::FromName(nullptr) == bhv::EventKind::FromName(""));
}

TEST_CASE("Marker events are named after their type", "[event]") {
  Exit exit_event;
  REQUIRE(std::string(exit_event.name()) == "Exit");
  REQUIRE(exit_event.kind() == Exit::StaticKind());
  REQUIRE(Exit::StaticKind() == bhv::EventKind::FromName("Exit"));
  REQUIRE(Tick::StaticKind() != Exit::StaticKind());

  constexpr bhv::EventKind k = Tick::StaticKind();
  REQUIRE(k == Tick().kind());
}

TEST_CASE("Marker events with explicit names", "[event]") {
  REQUIRE(std::string(game::Exit().name()) == "game::Exit");
  REQUIRE(game::Exit::StaticKind() != Exit::StaticKind());
}

TEST_CASE("UnitEvent", "[event]") {
  bhv::UnitEvent unit;
  REQUIRE(std::string(unit.name()) == "UnitEvent");
  REQUIRE(unit.kind() == bhv::UnitEvent::StaticKind());
}

TEST_CASE("NamedEvent matches marker of the same name", "[event]") {
  bhv::NamedEvent named("Exit");
  REQUIRE(std::string(named.name()) == "Exit");
  REQUIRE(named.kind() == Exit::StaticKind());
}

TEST_CASE("Value-dependent events hash their variant name", "[event]") {
  const Input up(Input::Key::kUp);
  const Input down(Input::Key::kDown);
  const bhv::Event& as_event = up;

  REQUIRE(as_event.kind() == bhv::EventKind::FromName("Input::Up"));
  REQUIRE(up.kind() != down.kind());
  REQUIRE(up.kind() == Input(Input::Key::kUp).kind());
}

TEST_CASE("UnitEventPump never runs dry", "[event]") {
  bhv::UnitEventPump pump;
  for (int i = 0; i < 100; ++i) {
    const bhv::Event* e = pump.Next();
    REQUIRE(e != nullptr);
    REQUIRE(e->kind() == bhv::UnitEvent::StaticKind());
  }
}

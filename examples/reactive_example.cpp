/**
 * @file reactive_example.cpp
 * @brief Event-driven behavior tree waiting for an Exit event.
 *
 * Tree structure:
 *
 *   Root (Sequence)
 *   +-- Increment (Action)
 *   +-- Increment (Action)
 *   +-- EventGate(Exit)
 *       +-- Shutdown (Action)
 *
 * Both increments run on the first event. Later Tick events stop at the
 * gate, so the tree stays RUNNING until Exit arrives.
 */

#include <bhv/bhv.hpp>
#include <cstdio>

BHV_MARKER_EVENT(Tick);
BHV_MARKER_EVENT(Exit);

struct GameContext {
  int i = 0;
  bool shutdown = false;
};

int main() {
  using namespace bhv::reactive::factory;

  GameContext ctx;
  bhv::reactive::BehaviorTree<GameContext> tree(
      MakeSequence(
          MakeAction<GameContext>([](GameContext& c) { c.i += 1; }),
          MakeAction<GameContext>([](GameContext& c) { c.i += 1; }),
          MakeEventGate<Exit>(MakeAction<GameContext>([](GameContext& c) {
            c.shutdown = true;
            std::printf("  [Action] Shutdown\n");
          }))),
      ctx);

  const bhv::ValidateError err = tree.ValidateTree();
  if (err != bhv::ValidateError::kNone) {
    std::printf("invalid tree: %s\n", bhv::ValidateErrorToString(err));
    return 1;
  }

  std::printf("=== Dispatch ===\n");
  Tick tick;
  for (int k = 0; k < 5; ++k) {
    const bhv::Status s = tree.Dispatch(tick);
    std::printf("  %s -> %s (i = %d)\n", tick.name(), bhv::StatusToString(s),
                ctx.i);
  }

  Exit exit_event;
  const bhv::Status s = tree.Dispatch(exit_event);
  std::printf("  %s -> %s (i = %d)\n", exit_event.name(),
              bhv::StatusToString(s), ctx.i);
  std::printf("  Events consumed: %u\n\n", tree.events_consumed());

  // Drive a gated tree from an endless pump: only UnitEvent reaches it.
  std::printf("=== Pump ===\n");
  int polls = 0;
  auto waiter = MakeEventGate<bhv::UnitEvent>(
      MakeAsyncAction<int>([](int& n) {
        ++n;
        return (n < 3) ? bhv::Status::kRunning : bhv::Status::kSuccess;
      }));
  bhv::UnitEventPump pump;
  const bhv::Status result = bhv::reactive::Execute(*waiter, pump, polls);
  std::printf("  Result: %s after %d events\n", bhv::StatusToString(result),
              polls);

  return 0;
}

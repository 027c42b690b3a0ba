/**
 * @file basic_example.cpp
 * @brief Poll-model behavior trees: Sequence, Selector and decorators.
 *
 * Demonstrates:
 * - Wrapping lambdas as Condition/Action leaves
 * - Building composites with bhv::factory
 * - Running trees with BehaviorTree and Execute
 * - Repeat / RepeatUntil / RunIf decorators
 * - Context shared across all nodes
 */

#include <bhv/bhv.hpp>
#include <cstdio>

struct AppContext {
  int i = 0;
  int v = 0;
  int retries = 0;
  bool armed = true;
};

using namespace bhv::factory;

// ============================================================================
// Counting sequence
// ============================================================================

static void RunCounter() {
  /*
   * Root (Sequence)
   * +-- Print (Action)
   * +-- Increment (Action)
   * +-- Increment (Action)
   */
  AppContext ctx;
  bhv::BehaviorTree<AppContext> tree(
      MakeSequence(
          MakeAction<AppContext>([](AppContext& c) {
            std::printf("  [Action] Print: i = %d\n", c.i);
          }),
          MakeAction<AppContext>([](AppContext& c) { c.i += 1; }),
          MakeAction<AppContext>([](AppContext& c) { c.i += 1; })),
      ctx);

  std::printf("=== Sequence ===\n");
  const bool ok = tree.Run();
  std::printf("  Result: %s, i = %d\n\n", ok ? "SUCCESS" : "FAILURE", ctx.i);
}

// ============================================================================
// Range dispatch
// ============================================================================

static bhv::NodePtr<AppContext> InRange(int lo, int hi) {
  return MakeCondition<AppContext>(
      [lo, hi](const AppContext& c) { return (c.v >= lo) && (c.v < hi); });
}

static bhv::NodePtr<AppContext> Say(const char* msg) {
  return MakeAction<AppContext>([msg](AppContext& c) {
    std::printf("  [Action] v = %d: %s\n", c.v, msg);
  });
}

static void RunRanges() {
  /*
   * Root (Selector)
   * +-- Sequence
   * |   +-- InRange(0, 5)
   * |   +-- Say("small")
   * +-- Sequence
   * |   +-- InRange(5, 25)
   * |   +-- Say("medium")
   * +-- Say("large")
   */
  auto root = MakeSelector(MakeSequence(InRange(0, 5), Say("small")),
                           MakeSequence(InRange(5, 25), Say("medium")),
                           Say("large"));
  if (root->ValidateTree() != bhv::ValidateError::kNone) {
    std::printf("  invalid tree\n");
    return;
  }

  std::printf("=== Selector ===\n");
  AppContext ctx;
  const int values[] = {3, 12, 25};
  for (int v : values) {
    ctx.v = v;
    if (!bhv::Execute(*root, ctx)) {
      std::printf("  v = %d: no branch taken\n", v);
    }
  }
  std::printf("\n");
}

// ============================================================================
// Decorators
// ============================================================================

static void RunDecorators() {
  /*
   * Root (Sequence)
   * +-- Repeat(3)
   * |   +-- Increment (Action)
   * +-- RepeatUntil(retries == 0)
   * |   +-- Retry (Action)
   * +-- RunIf(armed)
   *     +-- Fire (Action)
   */
  AppContext ctx;
  ctx.retries = 2;
  bhv::BehaviorTree<AppContext> tree(
      MakeSequence(
          MakeRepeat(MakeAction<AppContext>([](AppContext& c) { ++c.i; }), 3U),
          MakeRepeatUntil(MakeAction<AppContext>([](AppContext& c) {
                            std::printf("  [Action] Retry (%d left)\n",
                                        --c.retries);
                          }),
                          [](const AppContext& c) { return c.retries == 0; }),
          MakeRunIf(MakeAction<AppContext>([](AppContext&) {
                      std::printf("  [Action] Fire\n");
                    }),
                    [](const AppContext& c) { return c.armed; })),
      ctx);

  const bhv::ValidateError err = tree.ValidateTree();
  if (err != bhv::ValidateError::kNone) {
    std::printf("  invalid tree: %s\n", bhv::ValidateErrorToString(err));
    return;
  }

  std::printf("=== Decorators ===\n");
  bhv::Status s = bhv::Status::kRunning;
  while (s == bhv::Status::kRunning) {
    s = tree.Tick();
    std::printf("  Tick %u: %s (i = %d)\n", tree.tick_count(),
                bhv::StatusToString(s), ctx.i);
  }

  ctx.armed = false;
  ctx.retries = 1;
  std::printf("  Disarmed run: %s\n\n", tree.Run() ? "SUCCESS" : "FAILURE");
}

int main() {
  RunCounter();
  RunRanges();
  RunDecorators();
  return 0;
}

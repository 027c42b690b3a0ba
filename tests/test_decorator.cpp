#include <catch2/catch.hpp>
#include <bhv/bhv.hpp>

#include "test_support.hpp"

using bhv::Status;
using bhv_test::MakeProbe;
using bhv_test::Probe;

struct DecCtx {
  int counter = 0;
  bool allowed = true;
};

// ============================================================================
// Status mapping
// ============================================================================

TEST_CASE("Invert flips SUCCESS and FAILURE", "[decorator]") {
  Probe p({Status::kRunning, Status::kSuccess, Status::kFailure});
  auto inv = bhv::factory::MakeInvert(MakeProbe<DecCtx>(&p));

  DecCtx ctx;
  REQUIRE(inv->Tick(ctx) == Status::kRunning);
  REQUIRE(inv->Tick(ctx) == Status::kFailure);
  REQUIRE(inv->Tick(ctx) == Status::kSuccess);
  REQUIRE(inv->type() == bhv::NodeType::kInvert);
}

TEST_CASE("ForceSuccess and ForceFailure keep RUNNING", "[decorator]") {
  Probe p1({Status::kRunning, Status::kFailure});
  Probe p2({Status::kRunning, Status::kSuccess});
  auto fs = bhv::factory::MakeForceSuccess(MakeProbe<DecCtx>(&p1));
  auto ff = bhv::factory::MakeForceFailure(MakeProbe<DecCtx>(&p2));

  DecCtx ctx;
  REQUIRE(fs->Tick(ctx) == Status::kRunning);
  REQUIRE(fs->Tick(ctx) == Status::kSuccess);
  REQUIRE(ff->Tick(ctx) == Status::kRunning);
  REQUIRE(ff->Tick(ctx) == Status::kFailure);
  REQUIRE(fs->type() == bhv::NodeType::kForceSuccess);
  REQUIRE(ff->type() == bhv::NodeType::kForceFailure);
}

TEST_CASE("Decorator forwards Reset to its child", "[decorator]") {
  Probe p({Status::kRunning});
  auto inv = bhv::factory::MakeInvert(MakeProbe<DecCtx>(&p));

  inv->Reset(Status::kSuccess);
  REQUIRE(p.resets == 1);
  REQUIRE(p.last_reset == Status::kSuccess);
}

// ============================================================================
// Repeat
// ============================================================================

TEST_CASE("Repeat runs the child N times", "[decorator][repeat]") {
  auto node = bhv::factory::MakeRepeat(
      bhv::factory::MakeAction<DecCtx>([](DecCtx& c) { ++c.counter; }), 3U);

  DecCtx ctx;
  REQUIRE(node->Tick(ctx) == Status::kRunning);
  REQUIRE(node->Tick(ctx) == Status::kRunning);
  REQUIRE(node->Tick(ctx) == Status::kSuccess);
  REQUIRE(ctx.counter == 3);
  REQUIRE(node->type() == bhv::NodeType::kRepeat);
}

TEST_CASE("Repeat surfaces only the final status", "[decorator][repeat]") {
  Probe p({Status::kFailure});
  auto node = bhv::factory::MakeRepeat(MakeProbe<DecCtx>(&p), 2U);

  DecCtx ctx;
  REQUIRE(node->Tick(ctx) == Status::kRunning);
  REQUIRE(p.resets == 1);
  REQUIRE(node->Tick(ctx) == Status::kFailure);
  REQUIRE(p.steps == 2);
}

TEST_CASE("Repeat does not count RUNNING steps", "[decorator][repeat]") {
  Probe p({Status::kRunning, Status::kSuccess});
  bhv::Repeat<DecCtx> node(MakeProbe<DecCtx>(&p), 2U);

  DecCtx ctx;
  REQUIRE(node.Tick(ctx) == Status::kRunning);
  REQUIRE(node.current() == 1U);
  REQUIRE(node.Tick(ctx) == Status::kRunning);
  REQUIRE(node.current() == 2U);
  REQUIRE(node.Tick(ctx) == Status::kRunning);
  REQUIRE(node.Tick(ctx) == Status::kSuccess);
  REQUIRE(p.steps == 4);
}

TEST_CASE("Repeat Reset rearms the counter", "[decorator][repeat]") {
  Probe p({Status::kSuccess});
  bhv::Repeat<DecCtx> node(MakeProbe<DecCtx>(&p), 3U);

  DecCtx ctx;
  REQUIRE(node.Tick(ctx) == Status::kRunning);
  REQUIRE(node.current() == 2U);
  node.Reset(Status::kFailure);
  REQUIRE(node.current() == 1U);
  REQUIRE(node.count() == 3U);
  REQUIRE(p.last_reset == Status::kFailure);
}

TEST_CASE("Repeat(1) is a pass-through", "[decorator][repeat]") {
  Probe p({Status::kRunning, Status::kFailure});
  auto node = bhv::factory::MakeRepeat(MakeProbe<DecCtx>(&p), 1U);

  DecCtx ctx;
  REQUIRE(node->Tick(ctx) == Status::kRunning);
  REQUIRE(node->Tick(ctx) == Status::kFailure);
  REQUIRE(p.resets == 0);
}

// ============================================================================
// RepeatUntil
// ============================================================================

TEST_CASE("RepeatUntil stops when the predicate holds", "[decorator][repeat]") {
  int completions = 0;
  auto node = bhv::factory::MakeRepeatUntil(
      bhv::factory::MakeAction<DecCtx>([&completions](DecCtx& c) {
        --c.counter;
        ++completions;
      }),
      [](const DecCtx& c) { return c.counter == 0; });

  DecCtx ctx;
  ctx.counter = 2;
  REQUIRE(node->Tick(ctx) == Status::kRunning);
  REQUIRE(node->Tick(ctx) == Status::kSuccess);
  REQUIRE(completions == 2);
  REQUIRE(node->type() == bhv::NodeType::kRepeatUntil);
}

TEST_CASE("RepeatUntil checks once per child completion", "[decorator][repeat]") {
  int checks = 0;
  Probe p({Status::kSuccess, Status::kRunning, Status::kRunning, Status::kSuccess});
  auto node = bhv::factory::MakeRepeatUntil(
      MakeProbe<DecCtx>(&p), [&checks](const DecCtx& c) {
        ++checks;
        return c.counter > 0;
      });

  DecCtx ctx;
  REQUIRE(node->Tick(ctx) == Status::kRunning);  // completed, checked
  REQUIRE(checks == 1);
  // The child was reset, so its script starts over: SUCCESS again.
  REQUIRE(node->Tick(ctx) == Status::kRunning);
  REQUIRE(checks == 2);

  p.script = {Status::kRunning, Status::kSuccess};
  p.pos = 0;
  REQUIRE(node->Tick(ctx) == Status::kRunning);  // child running, no check
  REQUIRE(checks == 2);
  ctx.counter = 1;
  REQUIRE(node->Tick(ctx) == Status::kSuccess);
  REQUIRE(checks == 3);
}

TEST_CASE("RepeatUntilSuccess retries a failing child", "[decorator][repeat]") {
  auto node = bhv::factory::MakeRepeatUntilSuccess(
      bhv::factory::MakeAsyncAction<DecCtx>([](DecCtx& c) {
        return (++c.counter < 3) ? Status::kFailure : Status::kSuccess;
      }));

  DecCtx ctx;
  REQUIRE(node->Tick(ctx) == Status::kRunning);
  REQUIRE(node->Tick(ctx) == Status::kRunning);
  REQUIRE(node->Tick(ctx) == Status::kSuccess);
  REQUIRE(ctx.counter == 3);
}

TEST_CASE("RepeatUntilFailure retries a succeeding child", "[decorator][repeat]") {
  Probe p({Status::kSuccess, Status::kFailure});
  auto node = bhv::factory::MakeRepeatUntilFailure(MakeProbe<DecCtx>(&p));

  DecCtx ctx;
  // Every reset rewinds the script, so the child keeps succeeding.
  REQUIRE(node->Tick(ctx) == Status::kRunning);
  REQUIRE(node->Tick(ctx) == Status::kRunning);
  REQUIRE(p.resets == 2);

  p.script = {Status::kFailure};
  REQUIRE(node->Tick(ctx) == Status::kFailure);
  REQUIRE(node->type() == bhv::NodeType::kRepeatUntilFailure);
}

// ============================================================================
// RunIf
// ============================================================================

TEST_CASE("RunIf fails without ticking when the predicate is false", "[decorator][run_if]") {
  Probe p({Status::kSuccess});
  auto node = bhv::factory::MakeRunIf(
      MakeProbe<DecCtx>(&p), [](const DecCtx& c) { return c.allowed; });

  DecCtx ctx;
  ctx.allowed = false;
  REQUIRE(node->Tick(ctx) == Status::kFailure);
  REQUIRE(p.steps == 0);

  ctx.allowed = true;
  REQUIRE(node->Tick(ctx) == Status::kSuccess);
  REQUIRE(p.steps == 1);
  REQUIRE(node->type() == bhv::NodeType::kRunIf);
}

TEST_CASE("RunIf abandons a running child", "[decorator][run_if]") {
  Probe p({Status::kRunning});
  auto node = bhv::factory::MakeRunIf(
      MakeProbe<DecCtx>(&p), [](const DecCtx& c) { return c.allowed; });

  DecCtx ctx;
  REQUIRE(node->Tick(ctx) == Status::kRunning);
  REQUIRE(node->Tick(ctx) == Status::kRunning);

  ctx.allowed = false;
  REQUIRE(node->Tick(ctx) == Status::kFailure);
  REQUIRE(p.resets == 1);
  REQUIRE(p.last_reset == Status::kFailure);

  // Nothing left to abandon.
  REQUIRE(node->Tick(ctx) == Status::kFailure);
  REQUIRE(p.resets == 1);
}

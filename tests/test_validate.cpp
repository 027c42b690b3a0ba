#include <catch2/catch.hpp>
#include <bhv/bhv.hpp>

#include <memory>
#include <vector>

using bhv::Status;
using bhv::ValidateError;

struct ValCtx {
  int value = 0;
};

namespace {

bhv::NodePtr<ValCtx> Ok() {
  return bhv::factory::MakeAction<ValCtx>([](ValCtx&) {});
}

}  // namespace

TEST_CASE("Validate leaf is valid", "[validate]") {
  auto n = Ok();
  REQUIRE(n->Validate() == ValidateError::kNone);
  REQUIRE(n->ValidateTree() == ValidateError::kNone);
}

TEST_CASE("Validate sequence with children is valid", "[validate]") {
  auto seq = bhv::factory::MakeSequence(Ok(), Ok());
  REQUIRE(seq->Validate() == ValidateError::kNone);
  REQUIRE(seq->ValidateTree() == ValidateError::kNone);
}

TEST_CASE("Validate empty composite returns error", "[validate]") {
  bhv::Sequence<ValCtx> seq(std::vector<bhv::NodePtr<ValCtx>>{});
  bhv::Selector<ValCtx> sel(std::vector<bhv::NodePtr<ValCtx>>{});
  REQUIRE(seq.Validate() == ValidateError::kEmptyComposite);
  REQUIRE(sel.ValidateTree() == ValidateError::kEmptyComposite);
}

TEST_CASE("Validate composite over capacity returns error", "[validate]") {
  std::vector<bhv::NodePtr<ValCtx>> children;
  for (int i = 0; i < BHV_MAX_CHILDREN + 1; ++i) {
    children.push_back(Ok());
  }
  bhv::Sequence<ValCtx> seq(std::move(children));
  REQUIRE(seq.Validate() == ValidateError::kChildrenExceedMax);
  REQUIRE(seq.children_count() == BHV_MAX_CHILDREN);
}

TEST_CASE("Validate composite at capacity is valid", "[validate]") {
  std::vector<bhv::NodePtr<ValCtx>> children;
  for (int i = 0; i < BHV_MAX_CHILDREN; ++i) {
    children.push_back(Ok());
  }
  bhv::Selector<ValCtx> sel(std::move(children));
  REQUIRE(sel.Validate() == ValidateError::kNone);
}

TEST_CASE("Validate null child returns error", "[validate]") {
  std::vector<bhv::NodePtr<ValCtx>> children;
  children.push_back(Ok());
  children.push_back(nullptr);
  bhv::Sequence<ValCtx> seq(std::move(children));
  REQUIRE(seq.Validate() == ValidateError::kNullChild);

  bhv::Invert<ValCtx> inv(nullptr);
  REQUIRE(inv.Validate() == ValidateError::kNullChild);
  REQUIRE(inv.ValidateTree() == ValidateError::kNullChild);
}

TEST_CASE("Validate Repeat with zero count returns error", "[validate]") {
  bhv::Repeat<ValCtx> rep(Ok(), 0U);
  REQUIRE(rep.Validate() == ValidateError::kRepeatCountZero);

  // Runs like Repeat(1).
  ValCtx ctx;
  REQUIRE(rep.Tick(ctx) == Status::kSuccess);
}

TEST_CASE("ValidateTree catches deep errors", "[validate]") {
  std::vector<bhv::NodePtr<ValCtx>> inner;
  inner.push_back(bhv::factory::MakeRepeat(Ok(), 0U));
  auto seq = bhv::factory::MakeSequence(
      Ok(), bhv::factory::MakeInvert<ValCtx>(
                std::make_unique<bhv::Selector<ValCtx>>(std::move(inner))));

  REQUIRE(seq->Validate() == ValidateError::kNone);  // seq itself is OK
  REQUIRE(seq->ValidateTree() == ValidateError::kRepeatCountZero);
}

TEST_CASE("Reactive ValidateTree catches deep errors", "[validate][reactive]") {
  namespace rf = bhv::reactive::factory;
  auto tree = rf::MakeSequence(
      rf::MakeAction<ValCtx>([](ValCtx&) {}),
      rf::MakeEventGate<bhv::UnitEvent>(bhv::reactive::NodePtr<ValCtx>()));

  REQUIRE(tree->Validate() == ValidateError::kNone);
  REQUIRE(tree->ValidateTree() == ValidateError::kNullChild);
}

/**
 * @file factory.hpp
 * @brief Builders for reactive trees.
 *
 * @code
 * BHV_MARKER_EVENT(Exit);
 *
 * using namespace bhv::reactive::factory;
 * auto tree = MakeSequence(
 *     MakeAction<int>([](int& i) { ++i; }),
 *     MakeEventGate<Exit>(MakeAction<int>([](int&) {})));
 * @endcode
 */

#ifndef BHV_REACTIVE_FACTORY_HPP_
#define BHV_REACTIVE_FACTORY_HPP_

#include <cassert>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "bhv/config.hpp"
#include "bhv/detail/always_false.hpp"
#include "bhv/detail/child_list.hpp"
#include "bhv/event.hpp"
#include "bhv/reactive/composite.hpp"
#include "bhv/reactive/decorator.hpp"
#include "bhv/reactive/leaf.hpp"
#include "bhv/reactive/node.hpp"

namespace bhv {
namespace reactive {
namespace factory {

// ============================================================================
// Leaves
// ============================================================================

template <typename Context, typename Pred>
NodePtr<Context> MakeCondition(Pred pred) {
  return std::make_unique<Condition<Context, Pred>>(std::move(pred));
}

template <typename Context, typename Fn>
NodePtr<Context> MakeAction(Fn fn) {
  return std::make_unique<Action<Context, Fn>>(std::move(fn));
}

template <typename Context, typename Fn>
NodePtr<Context> MakeAsyncAction(Fn fn) {
  return std::make_unique<AsyncAction<Context, Fn>>(std::move(fn));
}

// ============================================================================
// Composites
// ============================================================================

template <typename Context, typename... Rest>
NodePtr<Context> MakeSequence(NodePtr<Context> first, Rest... rest) {
  static_assert(1U + sizeof...(Rest) <= BHV_MAX_CHILDREN,
                "Sequence children exceed BHV_MAX_CHILDREN");
  return std::make_unique<Sequence<Context>>(
      detail::CollectChildren(std::move(first), std::move(rest)...));
}

template <typename Context>
NodePtr<Context> MakeSequence() {
  static_assert(detail::AlwaysFalse<Context>::value,
                "a Sequence requires at least one child");
  return nullptr;
}

template <typename Context, typename... Rest>
NodePtr<Context> MakeSelector(NodePtr<Context> first, Rest... rest) {
  static_assert(1U + sizeof...(Rest) <= BHV_MAX_CHILDREN,
                "Selector children exceed BHV_MAX_CHILDREN");
  return std::make_unique<Selector<Context>>(
      detail::CollectChildren(std::move(first), std::move(rest)...));
}

template <typename Context>
NodePtr<Context> MakeSelector() {
  static_assert(detail::AlwaysFalse<Context>::value,
                "a Selector requires at least one child");
  return nullptr;
}

/**
 * @brief Build a reactive Sequence from a runtime list of children.
 * @return kNone, or why the list was rejected; @p out is set only on kNone.
 */
template <typename Context>
ValidateError BuildSequence(std::vector<NodePtr<Context>>&& children,
                            NodePtr<Context>* out) {
  assert(out != nullptr);
  const ValidateError err = detail::CheckChildren(children);
  if (err != ValidateError::kNone) {
    return err;
  }
  *out = std::make_unique<Sequence<Context>>(std::move(children));
  return ValidateError::kNone;
}

/**
 * @brief Build a reactive Selector from a runtime list of children.
 * @see BuildSequence
 */
template <typename Context>
ValidateError BuildSelector(std::vector<NodePtr<Context>>&& children,
                            NodePtr<Context>* out) {
  assert(out != nullptr);
  const ValidateError err = detail::CheckChildren(children);
  if (err != ValidateError::kNone) {
    return err;
  }
  *out = std::make_unique<Selector<Context>>(std::move(children));
  return ValidateError::kNone;
}

// ============================================================================
// Decorators
// ============================================================================

template <typename Context>
NodePtr<Context> MakeInvert(NodePtr<Context> child) {
  return std::make_unique<Invert<Context>>(std::move(child));
}

template <typename Context>
NodePtr<Context> MakeForceSuccess(NodePtr<Context> child) {
  return std::make_unique<ForceSuccess<Context>>(std::move(child));
}

template <typename Context>
NodePtr<Context> MakeForceFailure(NodePtr<Context> child) {
  return std::make_unique<ForceFailure<Context>>(std::move(child));
}

/** @brief Run @p child to completion @p count times (count >= 1). */
template <typename Context>
NodePtr<Context> MakeRepeat(NodePtr<Context> child, uint32_t count) {
  return std::make_unique<Repeat<Context>>(std::move(child), count);
}

template <typename Context>
NodePtr<Context> MakeRepeatUntilSuccess(NodePtr<Context> child) {
  return std::make_unique<RepeatUntilSuccess<Context>>(std::move(child));
}

template <typename Context>
NodePtr<Context> MakeRepeatUntilFailure(NodePtr<Context> child) {
  return std::make_unique<RepeatUntilFailure<Context>>(std::move(child));
}

/** @brief Let only events of @p kind reach @p child. */
template <typename Context>
NodePtr<Context> MakeEventGate(NodePtr<Context> child, EventKind kind) {
  return std::make_unique<EventGate<Context>>(std::move(child), kind);
}

/** @brief Let only events of marker type @p E reach @p child. */
template <typename E, typename Context>
NodePtr<Context> MakeEventGate(NodePtr<Context> child) {
  return std::make_unique<EventGate<Context>>(std::move(child),
                                              E::StaticKind());
}

}  // namespace factory
}  // namespace reactive
}  // namespace bhv

#endif  // BHV_REACTIVE_FACTORY_HPP_

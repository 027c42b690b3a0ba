/**
 * @file factory.hpp
 * @brief Builders for poll-model trees.
 *
 * Leaves need the context type spelled out, since it cannot be deduced
 * from a lambda; composites and decorators deduce it from their children:
 *
 * @code
 * using namespace bhv::factory;
 * auto tree = MakeSequence(
 *     MakeCondition<Agent>([](const Agent& a) { return a.hp > 0; }),
 *     MakeRepeat(MakeAction<Agent>([](Agent& a) { ++a.steps; }), 3));
 * @endcode
 */

#ifndef BHV_FACTORY_HPP_
#define BHV_FACTORY_HPP_

#include <cassert>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "bhv/composite.hpp"
#include "bhv/config.hpp"
#include "bhv/decorator.hpp"
#include "bhv/detail/always_false.hpp"
#include "bhv/detail/child_list.hpp"
#include "bhv/leaf.hpp"
#include "bhv/node.hpp"

namespace bhv {
namespace factory {

// ============================================================================
// Leaves
// ============================================================================

/** @brief Wrap bool(const Context&) as a node. */
template <typename Context, typename Pred>
NodePtr<Context> MakeCondition(Pred pred) {
  return std::make_unique<Condition<Context, Pred>>(std::move(pred));
}

/** @brief Wrap void(Context&) as a node that always succeeds. */
template <typename Context, typename Fn>
NodePtr<Context> MakeAction(Fn fn) {
  return std::make_unique<Action<Context, Fn>>(std::move(fn));
}

/** @brief Wrap Status(Context&) as a node. */
template <typename Context, typename Fn>
NodePtr<Context> MakeAsyncAction(Fn fn) {
  return std::make_unique<AsyncAction<Context, Fn>>(std::move(fn));
}

// ============================================================================
// Composites
// ============================================================================

/**
 * @brief Build a Sequence from one or more children.
 *
 * An empty or oversized child list does not compile.
 */
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

/**
 * @brief Build a Selector from one or more children.
 *
 * An empty or oversized child list does not compile.
 */
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
 * @brief Build a Sequence from a runtime list of children.
 * @param children Ordered children; left untouched on error.
 * @param out Receives the new node on success (must not be null).
 * @return kNone, or why the list was rejected (empty, too long, null).
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
 * @brief Build a Selector from a runtime list of children.
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

/** @brief Rerun @p child until pred(const Context&) holds. */
template <typename Context, typename Pred>
NodePtr<Context> MakeRepeatUntil(NodePtr<Context> child, Pred pred) {
  return std::make_unique<RepeatUntil<Context, Pred>>(std::move(child),
                                                      std::move(pred));
}

template <typename Context>
NodePtr<Context> MakeRepeatUntilSuccess(NodePtr<Context> child) {
  return std::make_unique<RepeatUntilSuccess<Context>>(std::move(child));
}

template <typename Context>
NodePtr<Context> MakeRepeatUntilFailure(NodePtr<Context> child) {
  return std::make_unique<RepeatUntilFailure<Context>>(std::move(child));
}

/** @brief Run @p child only while pred(const Context&) holds. */
template <typename Context, typename Pred>
NodePtr<Context> MakeRunIf(NodePtr<Context> child, Pred pred) {
  return std::make_unique<RunIf<Context, Pred>>(std::move(child),
                                                std::move(pred));
}

}  // namespace factory
}  // namespace bhv

#endif  // BHV_FACTORY_HPP_

/**
 * @file leaf.hpp
 * @brief Leaf adaptors for reactive trees.
 *
 * The event is not passed to the wrapped callable; leaves react to every
 * event that reaches them. Use EventGate to restrict them to one kind.
 */

#ifndef BHV_REACTIVE_LEAF_HPP_
#define BHV_REACTIVE_LEAF_HPP_

#include <utility>

#include "bhv/reactive/node.hpp"

namespace bhv {
namespace reactive {

template <typename Context, typename Pred>
class Condition final : public Node<Context> {
 public:
  explicit Condition(Pred pred) noexcept : pred_(std::move(pred)) {}

  Status React(const Event& /*event*/, Context& ctx) override {
    return pred_(static_cast<const Context&>(ctx)) ? Status::kSuccess
                                                   : Status::kFailure;
  }

  NodeType type() const noexcept override { return NodeType::kCondition; }

 private:
  Pred pred_;
};

template <typename Context, typename Fn>
class Action final : public Node<Context> {
 public:
  explicit Action(Fn fn) noexcept : fn_(std::move(fn)) {}

  Status React(const Event& /*event*/, Context& ctx) override {
    fn_(ctx);
    return Status::kSuccess;
  }

  NodeType type() const noexcept override { return NodeType::kAction; }

 private:
  Fn fn_;
};

template <typename Context, typename Fn>
class AsyncAction final : public Node<Context> {
 public:
  explicit AsyncAction(Fn fn) noexcept : fn_(std::move(fn)) {}

  Status React(const Event& /*event*/, Context& ctx) override {
    return fn_(ctx);
  }

  NodeType type() const noexcept override { return NodeType::kAsyncAction; }

 private:
  Fn fn_;
};

}  // namespace reactive
}  // namespace bhv

#endif  // BHV_REACTIVE_LEAF_HPP_

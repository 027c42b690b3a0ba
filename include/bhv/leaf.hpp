/**
 * @file leaf.hpp
 * @brief Leaf adaptors wrapping plain callables as poll-model nodes.
 *
 * - Condition:   bool(const Context&)   -> SUCCESS / FAILURE
 * - Action:      void(Context&)         -> always SUCCESS
 * - AsyncAction: Status(Context&)       -> may span several ticks
 */

#ifndef BHV_LEAF_HPP_
#define BHV_LEAF_HPP_

#include <utility>

#include "bhv/node.hpp"

namespace bhv {

template <typename Context, typename Pred>
class Condition final : public Node<Context> {
 public:
  explicit Condition(Pred pred) noexcept : pred_(std::move(pred)) {}

  Status Tick(Context& ctx) override {
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

  Status Tick(Context& ctx) override {
    fn_(ctx);
    return Status::kSuccess;
  }

  NodeType type() const noexcept override { return NodeType::kAction; }

 private:
  Fn fn_;
};

/**
 * @brief Leaf whose callable reports its own status.
 *
 * The callable keeps any progress it needs across ticks in the context or
 * in its captures; RUNNING asks to be called again.
 */
template <typename Context, typename Fn>
class AsyncAction final : public Node<Context> {
 public:
  explicit AsyncAction(Fn fn) noexcept : fn_(std::move(fn)) {}

  Status Tick(Context& ctx) override { return fn_(ctx); }

  NodeType type() const noexcept override { return NodeType::kAsyncAction; }

 private:
  Fn fn_;
};

}  // namespace bhv

#endif  // BHV_LEAF_HPP_

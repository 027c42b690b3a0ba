/**
 * @file composite.hpp
 * @brief Reactive Sequence and Selector.
 */

#ifndef BHV_REACTIVE_COMPOSITE_HPP_
#define BHV_REACTIVE_COMPOSITE_HPP_

#include <cstdint>
#include <utility>
#include <vector>

#include "bhv/config.hpp"
#include "bhv/detail/child_list.hpp"
#include "bhv/policy.hpp"
#include "bhv/reactive/node.hpp"

namespace bhv {
namespace reactive {

/**
 * @brief Event-driven list engine under a continuation policy.
 * @tparam Context User context type.
 * @tparam Policy SequencePolicy or SelectorPolicy.
 *
 * Each event first fixes the eligible prefix: the children, counted from
 * the front of the list, that are interested in its kind (a take-while
 * scan, not a filter). Only children inside that prefix and at or after
 * the cursor react. Within that range the poll-model policy applies: a
 * child returning the continue status is passed and the next one reacts
 * to the same event; a RUNNING child keeps the cursor; the short-circuit
 * status ends the run. Each child reacts at most once per event.
 *
 * When the cursor reaches the end of the prefix short of the end of the
 * list, the list returns RUNNING with the cursor parked there. A child
 * uninterested in a kind therefore holds back every later sibling from
 * events of that kind, even after the cursor has moved past it.
 *
 * The list itself is interested in every kind.
 */
template <typename Context, typename Policy>
class ListNode final : public Node<Context> {
 public:
  using Children = detail::ChildList<Node<Context>>;

  explicit ListNode(std::vector<NodePtr<Context>>&& children) noexcept
      : children_(std::move(children)), cursor_(0) {}

  BHV_HOT Status React(const Event& event, Context& ctx) override {
    const EventKind kind = event.kind();
    const uint16_t count = children_.size();
    uint16_t eligible = 0;
    while ((eligible < count) && children_[eligible].InterestedIn(kind)) {
      ++eligible;
    }
    while (cursor_ < eligible) {
      const Status s = children_[cursor_].React(event, ctx);
      if (s == Policy::Continue()) {
        ++cursor_;
        continue;
      }
      if (s == Status::kRunning) {
        return Status::kRunning;
      }
      children_.ResetVisited(cursor_, Policy::Continue(), s);
      cursor_ = 0;
      return s;
    }
    if (cursor_ < count) {
      return Status::kRunning;
    }
    children_.ResetVisited(count, Policy::Continue(), Policy::Continue());
    cursor_ = 0;
    return Policy::Continue();
  }

  void Reset(Status last_status) noexcept override {
    children_.ResetVisited(cursor_, Policy::Continue(), last_status);
    cursor_ = 0;
  }

  NodeType type() const noexcept override { return Policy::Type(); }

  ValidateError Validate() const noexcept override {
    return children_.Validate();
  }

  ValidateError ValidateTree() const noexcept override {
    return children_.ValidateTree();
  }

  /** @brief Get number of children. */
  uint16_t children_count() const noexcept { return children_.size(); }

  /** @brief Get index of the child the next event is offered to first. */
  uint16_t current_child_index() const noexcept { return cursor_; }

 private:
  Children children_;
  uint16_t cursor_;
};

template <typename Context>
using Sequence = ListNode<Context, SequencePolicy>;

template <typename Context>
using Selector = ListNode<Context, SelectorPolicy>;

}  // namespace reactive
}  // namespace bhv

#endif  // BHV_REACTIVE_COMPOSITE_HPP_

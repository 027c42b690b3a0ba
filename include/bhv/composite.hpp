/**
 * @file composite.hpp
 * @brief Sequence and Selector: one list engine under two continuation
 *        policies.
 *
 * - Sequence: continue on SUCCESS, short-circuit on FAILURE (AND logic)
 * - Selector: continue on FAILURE, short-circuit on SUCCESS (OR logic)
 */

#ifndef BHV_COMPOSITE_HPP_
#define BHV_COMPOSITE_HPP_

#include <cstdint>
#include <utility>
#include <vector>

#include "bhv/config.hpp"
#include "bhv/detail/child_list.hpp"
#include "bhv/node.hpp"
#include "bhv/policy.hpp"

namespace bhv {

// ============================================================================
// ListNode
// ============================================================================

/**
 * @brief Runs children in order under a continuation policy.
 * @tparam Context User context type.
 * @tparam Policy SequencePolicy or SelectorPolicy.
 *
 * Starting at the cursor, children that return the continue status are
 * passed in the same Tick() call. A RUNNING child parks the cursor on
 * itself until the next call. The short-circuit status (the other terminal
 * status) ends the run at once. When a run ends, either way, every visited
 * child is reset and the cursor returns to 0.
 */
template <typename Context, typename Policy>
class ListNode final : public Node<Context> {
 public:
  using Children = detail::ChildList<Node<Context>>;

  /**
   * @brief Build from an ordered list of children.
   *
   * Prefer factory::MakeSequence()/MakeSelector(), which reject empty or
   * oversized lists. A list built here directly reports those problems
   * through Validate().
   */
  explicit ListNode(std::vector<NodePtr<Context>>&& children) noexcept
      : children_(std::move(children)), cursor_(0) {}

  BHV_HOT Status Tick(Context& ctx) override {
    const uint16_t count = children_.size();
    while (cursor_ < count) {
      const Status s = children_[cursor_].Tick(ctx);
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
    children_.ResetVisited(count, Policy::Continue(), Policy::Continue());
    cursor_ = 0;
    return Policy::Continue();
  }

  /**
   * @brief Reset visited children (including a running one) and rewind.
   */
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

  /** @brief Get index of the child the next Tick() resumes at. */
  uint16_t current_child_index() const noexcept { return cursor_; }

 private:
  Children children_;
  uint16_t cursor_;
};

/// Ordered AND: succeeds when every child succeeds.
template <typename Context>
using Sequence = ListNode<Context, SequencePolicy>;

/// Ordered OR: succeeds when any child succeeds.
template <typename Context>
using Selector = ListNode<Context, SelectorPolicy>;

}  // namespace bhv

#endif  // BHV_COMPOSITE_HPP_

/**
 * @file behavior_tree.hpp
 * @brief Reactive-model execution driver.
 *
 * Events are consumed one at a time. An event whose kind the root is not
 * interested in stops the run without a verdict; so does running out of
 * events. Both are reported as Status::kRunning ("still pending").
 */

#ifndef BHV_REACTIVE_BEHAVIOR_TREE_HPP_
#define BHV_REACTIVE_BEHAVIOR_TREE_HPP_

#include <cstdint>
#include <memory>
#include <type_traits>
#include <utility>

#include "bhv/config.hpp"
#include "bhv/event.hpp"
#include "bhv/reactive/node.hpp"

namespace bhv {
namespace detail {

BHV_FORCE_INLINE const Event& AsEvent(const Event& event) noexcept {
  return event;
}

BHV_FORCE_INLINE const Event& AsEvent(const Event* event) noexcept {
  return *event;
}

template <typename E, typename D>
BHV_FORCE_INLINE const Event& AsEvent(
    const std::unique_ptr<E, D>& event) noexcept {
  return *event;
}

/**
 * @brief Offer one event to @p root.
 * @param[out] delivered false when the root was not interested.
 */
template <typename Context>
BHV_FORCE_INLINE Status Offer(reactive::Node<Context>& root,
                              const Event& event, Context& ctx,
                              bool* delivered) {
  if (!root.InterestedIn(event.kind())) {
    *delivered = false;
    return Status::kRunning;
  }
  *delivered = true;
  const Status s = root.React(event, ctx);
  if (IsTerminal(s)) {
    root.Reset(s);
  }
  return s;
}

}  // namespace detail

namespace reactive {

/**
 * @brief Feed events from [first, last) to @p root until a verdict.
 * @tparam InputIt Iterator over `const Event&`, `const Event*` or
 *         `std::unique_ptr<Event>`.
 * @return SUCCESS/FAILURE, or RUNNING when no verdict was reached.
 */
template <typename Context, typename InputIt>
Status Execute(Node<Context>& root, InputIt first, InputIt last,
               Context& ctx) {
  for (; first != last; ++first) {
    bool delivered = false;
    const Status s =
        detail::Offer(root, detail::AsEvent(*first), ctx, &delivered);
    if (!delivered || IsTerminal(s)) {
      return s;
    }
  }
  return Status::kRunning;
}

/**
 * @brief Feed events pulled from @p pump to @p root until a verdict.
 *
 * With an endless pump (UnitEventPump) this only returns once the root
 * reaches a verdict or turns uninterested.
 */
template <typename Context>
Status Execute(Node<Context>& root, EventPump& pump, Context& ctx) {
  for (const Event* event = pump.Next(); event != nullptr;
       event = pump.Next()) {
    bool delivered = false;
    const Status s = detail::Offer(root, *event, ctx, &delivered);
    if (!delivered || IsTerminal(s)) {
      return s;
    }
  }
  return Status::kRunning;
}

/**
 * @brief Reactive behavior tree manager template.
 * @tparam Context User-defined context type.
 *
 * Owns the root node and borrows the shared context. Dispatch() feeds a
 * single event; Run() drains an event range or pump.
 */
template <typename Context>
class BehaviorTree final {
  static_assert(!std::is_pointer<Context>::value,
                "Context must not be a pointer type; use the pointed-to type");

 public:
  using RootType = Node<Context>;

  /**
   * @brief Construct a reactive behavior tree.
   * @param root The root node of the tree (ownership is taken).
   * @param context Reference to shared context (must outlive the tree).
   */
  BehaviorTree(NodePtr<Context> root, Context& context) noexcept
      : root_(std::move(root)),
        context_(context),
        last_status_(Status::kRunning),
        events_consumed_(0),
        events_rejected_(0) {}

  // Non-copyable, non-movable
  BehaviorTree(const BehaviorTree&) = delete;
  BehaviorTree& operator=(const BehaviorTree&) = delete;
  BehaviorTree(BehaviorTree&&) = delete;
  BehaviorTree& operator=(BehaviorTree&&) = delete;

  /** @brief Validate the entire tree structure. */
  ValidateError ValidateTree() const noexcept {
    if (root_ == nullptr) {
      return ValidateError::kNullChild;
    }
    return root_->ValidateTree();
  }

  /** @brief Whether the root would accept @p event. */
  bool Accepts(const Event& event) const noexcept {
    return root_->InterestedIn(event.kind());
  }

  /**
   * @brief Feed one event to the root.
   * @return The root's status; RUNNING if the root rejected the event.
   *
   * A terminal status completes a run and resets the root.
   */
  BHV_HOT Status Dispatch(const Event& event) {
    bool delivered = false;
    return Deliver(event, &delivered);
  }

  /**
   * @brief Dispatch events from [first, last) until a verdict.
   * @return SUCCESS/FAILURE, or RUNNING when the range ran out or the
   *         root rejected an event.
   */
  template <typename InputIt>
  Status Run(InputIt first, InputIt last) {
    for (; first != last; ++first) {
      bool delivered = false;
      const Status s = Deliver(detail::AsEvent(*first), &delivered);
      if (!delivered || IsTerminal(s)) {
        return s;
      }
    }
    return Status::kRunning;
  }

  /** @brief Dispatch events pulled from @p pump until a verdict. */
  Status Run(EventPump& pump) {
    for (const Event* event = pump.Next(); event != nullptr;
         event = pump.Next()) {
      bool delivered = false;
      const Status s = Deliver(*event, &delivered);
      if (!delivered || IsTerminal(s)) {
        return s;
      }
    }
    return Status::kRunning;
  }

  /**
   * @brief Abandon the current run and rearm every visited node.
   *
   * Statistics are preserved.
   */
  void Reset() noexcept {
    root_->Reset(Status::kFailure);
    last_status_ = Status::kRunning;
  }

  /** @brief Get root node reference. */
  RootType& root() const noexcept { return *root_; }

  /** @brief Get mutable context reference. */
  Context& context() noexcept { return context_; }

  /** @brief Get const context reference. */
  const Context& context() const noexcept { return context_; }

  /** @brief Status after the last delivered event (RUNNING before any). */
  Status last_status() const noexcept { return last_status_; }

  /** @brief Number of events delivered to the root. */
  uint32_t events_consumed() const noexcept { return events_consumed_; }

  /** @brief Number of events the root was not interested in. */
  uint32_t events_rejected() const noexcept { return events_rejected_; }

 private:
  Status Deliver(const Event& event, bool* delivered) {
    const Status s = detail::Offer(*root_, event, context_, delivered);
    if (!*delivered) {
      ++events_rejected_;
      return Status::kRunning;
    }
    ++events_consumed_;
    last_status_ = s;
    return s;
  }

  NodePtr<Context> root_;
  Context& context_;
  Status last_status_;
  uint32_t events_consumed_;
  uint32_t events_rejected_;
};

}  // namespace reactive
}  // namespace bhv

#endif  // BHV_REACTIVE_BEHAVIOR_TREE_HPP_

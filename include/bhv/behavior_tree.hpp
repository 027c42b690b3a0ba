/**
 * @file behavior_tree.hpp
 * @brief Poll-model execution driver.
 */

#ifndef BHV_BEHAVIOR_TREE_HPP_
#define BHV_BEHAVIOR_TREE_HPP_

#include <cstdint>
#include <type_traits>
#include <utility>

#include "bhv/config.hpp"
#include "bhv/node.hpp"

namespace bhv {

/**
 * @brief Tick @p root until it reports a terminal status.
 * @return true on SUCCESS, false on FAILURE.
 *
 * The root is reset afterwards, ready for another run. The loop never
 * yields: use it only when the tree makes bounded progress per tick.
 */
template <typename Context>
bool Execute(Node<Context>& root, Context& ctx) {
  Status s = root.Tick(ctx);
  while (s == Status::kRunning) {
    s = root.Tick(ctx);
  }
  root.Reset(s);
  return s == Status::kSuccess;
}

/**
 * @brief Behavior tree manager template.
 * @tparam Context User-defined context type.
 *
 * Owns the root node and borrows the shared context, providing a
 * high-level API with execution statistics.
 *
 * Recommended usage:
 * 1. Build the tree with bhv::factory
 * 2. Construct BehaviorTree with the root and context
 * 3. Call ValidateTree() once to verify structure
 * 4. Call Tick() from your main loop, or Run() to completion
 */
template <typename Context>
class BehaviorTree final {
  static_assert(!std::is_pointer<Context>::value,
                "Context must not be a pointer type; use the pointed-to type");

 public:
  using RootType = Node<Context>;

  /**
   * @brief Construct a behavior tree.
   * @param root The root node of the tree (ownership is taken).
   * @param context Reference to shared context (must outlive the tree).
   */
  BehaviorTree(NodePtr<Context> root, Context& context) noexcept
      : root_(std::move(root)),
        context_(context),
        last_status_(Status::kRunning),
        tick_count_(0),
        run_count_(0) {}

  // Non-copyable, non-movable
  BehaviorTree(const BehaviorTree&) = delete;
  BehaviorTree& operator=(const BehaviorTree&) = delete;
  BehaviorTree(BehaviorTree&&) = delete;
  BehaviorTree& operator=(BehaviorTree&&) = delete;

  /**
   * @brief Validate the entire tree structure.
   * @return ValidateError::kNone if the tree is valid.
   *
   * Should be called once after construction, before the first Tick().
   */
  ValidateError ValidateTree() const noexcept {
    if (root_ == nullptr) {
      return ValidateError::kNullChild;
    }
    return root_->ValidateTree();
  }

  /**
   * @brief Execute one tick of the behavior tree.
   * @return Status of the root after this tick.
   *
   * A terminal status completes a run: the root is reset so the next
   * Tick() starts a fresh one.
   */
  BHV_HOT Status Tick() {
    ++tick_count_;
    last_status_ = root_->Tick(context_);
    if (IsTerminal(last_status_)) {
      root_->Reset(last_status_);
      ++run_count_;
    }
    return last_status_;
  }

  /**
   * @brief Tick until the root reports a terminal status.
   * @return true on SUCCESS, false on FAILURE.
   */
  bool Run() {
    while (Tick() == Status::kRunning) {
    }
    return last_status_ == Status::kSuccess;
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

  /** @brief Get the status from the last Tick() (RUNNING before any). */
  Status last_status() const noexcept { return last_status_; }

  /** @brief Get total number of Tick() calls. */
  uint32_t tick_count() const noexcept { return tick_count_; }

  /** @brief Get number of completed runs. */
  uint32_t run_count() const noexcept { return run_count_; }

 private:
  NodePtr<Context> root_;
  Context& context_;
  Status last_status_;
  uint32_t tick_count_;
  uint32_t run_count_;
};

}  // namespace bhv

#endif  // BHV_BEHAVIOR_TREE_HPP_

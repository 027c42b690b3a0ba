/**
 * @file decorator.hpp
 * @brief Single-child poll-model decorators.
 *
 * - Invert:             SUCCESS <-> FAILURE, RUNNING unchanged
 * - ForceSuccess:       any terminal status becomes SUCCESS
 * - ForceFailure:       any terminal status becomes FAILURE
 * - Repeat:             run the child to completion N times
 * - RepeatUntil:        rerun the child until a context predicate holds
 * - RepeatUntilSuccess: rerun the child while it fails
 * - RepeatUntilFailure: rerun the child while it succeeds
 * - RunIf:              run the child only while a context predicate holds
 */

#ifndef BHV_DECORATOR_HPP_
#define BHV_DECORATOR_HPP_

#include <cstdint>
#include <utility>

#include "bhv/config.hpp"
#include "bhv/node.hpp"

namespace bhv {

// ============================================================================
// Decorator base
// ============================================================================

/**
 * @brief Common base owning exactly one child.
 *
 * Forwards Reset() to the child and validates the child subtree.
 */
template <typename Context>
class Decorator : public Node<Context> {
 public:
  explicit Decorator(NodePtr<Context> child) noexcept
      : child_(std::move(child)) {}

  void Reset(Status last_status) noexcept override {
    if (child_ != nullptr) {
      child_->Reset(last_status);
    }
  }

  ValidateError Validate() const noexcept override {
    return (child_ == nullptr) ? ValidateError::kNullChild
                               : ValidateError::kNone;
  }

  ValidateError ValidateTree() const noexcept override {
    const ValidateError err = Validate();
    if (err != ValidateError::kNone) {
      return err;
    }
    return child_->ValidateTree();
  }

  /** @brief Get the decorated child. */
  Node<Context>& child() const noexcept { return *child_; }

 protected:
  NodePtr<Context> child_;
};

// ============================================================================
// Status mapping decorators
// ============================================================================

template <typename Context>
class Invert final : public Decorator<Context> {
 public:
  explicit Invert(NodePtr<Context> child) noexcept
      : Decorator<Context>(std::move(child)) {}

  Status Tick(Context& ctx) override {
    return InvertStatus(this->child_->Tick(ctx));
  }

  NodeType type() const noexcept override { return NodeType::kInvert; }
};

template <typename Context>
class ForceSuccess final : public Decorator<Context> {
 public:
  explicit ForceSuccess(NodePtr<Context> child) noexcept
      : Decorator<Context>(std::move(child)) {}

  Status Tick(Context& ctx) override {
    return IsTerminal(this->child_->Tick(ctx)) ? Status::kSuccess
                                               : Status::kRunning;
  }

  NodeType type() const noexcept override { return NodeType::kForceSuccess; }
};

template <typename Context>
class ForceFailure final : public Decorator<Context> {
 public:
  explicit ForceFailure(NodePtr<Context> child) noexcept
      : Decorator<Context>(std::move(child)) {}

  Status Tick(Context& ctx) override {
    return IsTerminal(this->child_->Tick(ctx)) ? Status::kFailure
                                               : Status::kRunning;
  }

  NodeType type() const noexcept override { return NodeType::kForceFailure; }
};

// ============================================================================
// Repeat
// ============================================================================

/**
 * @brief Runs the child to completion a fixed number of times.
 *
 * The counter starts at 1. While it is below the target, each completion
 * of the child (either terminal status) resets the child, increments the
 * counter and yields RUNNING. Once the counter reaches the target the
 * child runs one final time and its own status is returned unmodified.
 * The child therefore completes @c count times in total, the first
 * @c count - 1 of them silently. Repeat(1) is a pass-through.
 */
template <typename Context>
class Repeat final : public Decorator<Context> {
 public:
  Repeat(NodePtr<Context> child, uint32_t count) noexcept
      : Decorator<Context>(std::move(child)), count_(count), current_(1U) {}

  BHV_HOT Status Tick(Context& ctx) override {
    if (current_ >= count_) {
      return this->child_->Tick(ctx);
    }
    const Status s = this->child_->Tick(ctx);
    if (IsTerminal(s)) {
      this->child_->Reset(s);
      ++current_;
    }
    return Status::kRunning;
  }

  void Reset(Status last_status) noexcept override {
    Decorator<Context>::Reset(last_status);
    current_ = 1U;
  }

  NodeType type() const noexcept override { return NodeType::kRepeat; }

  ValidateError Validate() const noexcept override {
    if (count_ == 0U) {
      return ValidateError::kRepeatCountZero;
    }
    return Decorator<Context>::Validate();
  }

  /** @brief Get the target completion count. */
  uint32_t count() const noexcept { return count_; }

  /** @brief Get the current repetition, starting at 1. */
  uint32_t current() const noexcept { return current_; }

 private:
  uint32_t count_;
  uint32_t current_;
};

// ============================================================================
// RepeatUntil
// ============================================================================

/**
 * @brief Reruns the child until a context predicate holds.
 * @tparam Pred Callable as bool(const Context&).
 *
 * The predicate is checked at most once per completion of the child: after
 * a check fails, RUNNING is returned without checking again until the
 * child completes once more. A passing check yields SUCCESS.
 */
template <typename Context, typename Pred>
class RepeatUntil final : public Decorator<Context> {
 public:
  RepeatUntil(NodePtr<Context> child, Pred pred) noexcept
      : Decorator<Context>(std::move(child)),
        pred_(std::move(pred)),
        checked_(false) {}

  Status Tick(Context& ctx) override {
    const Status s = this->child_->Tick(ctx);
    if (IsTerminal(s)) {
      this->child_->Reset(s);
      checked_ = false;
    }

    if (!checked_) {
      if (pred_(static_cast<const Context&>(ctx))) {
        return Status::kSuccess;
      }
      checked_ = true;
    }

    return Status::kRunning;
  }

  void Reset(Status last_status) noexcept override {
    Decorator<Context>::Reset(last_status);
    checked_ = false;
  }

  NodeType type() const noexcept override { return NodeType::kRepeatUntil; }

 private:
  Pred pred_;
  bool checked_;
};

// ============================================================================
// RepeatUntilSuccess / RepeatUntilFailure
// ============================================================================

/**
 * @brief Reruns the child while it fails; propagates its SUCCESS.
 */
template <typename Context>
class RepeatUntilSuccess final : public Decorator<Context> {
 public:
  explicit RepeatUntilSuccess(NodePtr<Context> child) noexcept
      : Decorator<Context>(std::move(child)) {}

  Status Tick(Context& ctx) override {
    const Status s = this->child_->Tick(ctx);
    if (s == Status::kFailure) {
      this->child_->Reset(s);
      return Status::kRunning;
    }
    return s;
  }

  NodeType type() const noexcept override {
    return NodeType::kRepeatUntilSuccess;
  }
};

/**
 * @brief Reruns the child while it succeeds; propagates its FAILURE.
 */
template <typename Context>
class RepeatUntilFailure final : public Decorator<Context> {
 public:
  explicit RepeatUntilFailure(NodePtr<Context> child) noexcept
      : Decorator<Context>(std::move(child)) {}

  Status Tick(Context& ctx) override {
    const Status s = this->child_->Tick(ctx);
    if (s == Status::kSuccess) {
      this->child_->Reset(s);
      return Status::kRunning;
    }
    return s;
  }

  NodeType type() const noexcept override {
    return NodeType::kRepeatUntilFailure;
  }
};

// ============================================================================
// RunIf
// ============================================================================

/**
 * @brief Gates the child on a context predicate checked on every call.
 * @tparam Pred Callable as bool(const Context&).
 *
 * While the predicate holds the child's status is returned as is. When it
 * does not, the child is not ticked and FAILURE is returned; a child left
 * mid-run by an earlier call is reset first.
 */
template <typename Context, typename Pred>
class RunIf final : public Decorator<Context> {
 public:
  RunIf(NodePtr<Context> child, Pred pred) noexcept
      : Decorator<Context>(std::move(child)),
        pred_(std::move(pred)),
        child_running_(false) {}

  Status Tick(Context& ctx) override {
    if (!pred_(static_cast<const Context&>(ctx))) {
      if (child_running_) {
        this->child_->Reset(Status::kFailure);
        child_running_ = false;
      }
      return Status::kFailure;
    }
    const Status s = this->child_->Tick(ctx);
    child_running_ = (s == Status::kRunning);
    return s;
  }

  void Reset(Status last_status) noexcept override {
    Decorator<Context>::Reset(last_status);
    child_running_ = false;
  }

  NodeType type() const noexcept override { return NodeType::kRunIf; }

 private:
  Pred pred_;
  bool child_running_;
};

}  // namespace bhv

#endif  // BHV_DECORATOR_HPP_

/**
 * @file decorator.hpp
 * @brief Single-child reactive decorators.
 *
 * - Invert / ForceSuccess / ForceFailure: same mapping as the poll model
 * - Repeat: run the child to completion N times, one event at a time
 * - RepeatUntilSuccess / RepeatUntilFailure: retry on later events
 * - EventGate: only let events of one kind through
 *
 * All but EventGate share their child's interest.
 */

#ifndef BHV_REACTIVE_DECORATOR_HPP_
#define BHV_REACTIVE_DECORATOR_HPP_

#include <cstdint>
#include <utility>

#include "bhv/config.hpp"
#include "bhv/reactive/node.hpp"

namespace bhv {
namespace reactive {

/**
 * @brief Common base owning exactly one child.
 */
template <typename Context>
class Decorator : public Node<Context> {
 public:
  explicit Decorator(NodePtr<Context> child) noexcept
      : child_(std::move(child)) {}

  bool InterestedIn(EventKind kind) const noexcept override {
    return (child_ != nullptr) && child_->InterestedIn(kind);
  }

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

template <typename Context>
class Invert final : public Decorator<Context> {
 public:
  explicit Invert(NodePtr<Context> child) noexcept
      : Decorator<Context>(std::move(child)) {}

  Status React(const Event& event, Context& ctx) override {
    return InvertStatus(this->child_->React(event, ctx));
  }

  NodeType type() const noexcept override { return NodeType::kInvert; }
};

template <typename Context>
class ForceSuccess final : public Decorator<Context> {
 public:
  explicit ForceSuccess(NodePtr<Context> child) noexcept
      : Decorator<Context>(std::move(child)) {}

  Status React(const Event& event, Context& ctx) override {
    return IsTerminal(this->child_->React(event, ctx)) ? Status::kSuccess
                                                       : Status::kRunning;
  }

  NodeType type() const noexcept override { return NodeType::kForceSuccess; }
};

template <typename Context>
class ForceFailure final : public Decorator<Context> {
 public:
  explicit ForceFailure(NodePtr<Context> child) noexcept
      : Decorator<Context>(std::move(child)) {}

  Status React(const Event& event, Context& ctx) override {
    return IsTerminal(this->child_->React(event, ctx)) ? Status::kFailure
                                                       : Status::kRunning;
  }

  NodeType type() const noexcept override { return NodeType::kForceFailure; }
};

/**
 * @brief Runs the child to completion a fixed number of times.
 *
 * Same counting as the poll-model Repeat: the counter starts at 1, each
 * completion below the target resets the child, increments the counter
 * and yields RUNNING, and the completion at the target is returned
 * unmodified. Later completions need later events.
 */
template <typename Context>
class Repeat final : public Decorator<Context> {
 public:
  Repeat(NodePtr<Context> child, uint32_t count) noexcept
      : Decorator<Context>(std::move(child)), count_(count), current_(1U) {}

  BHV_HOT Status React(const Event& event, Context& ctx) override {
    const Status s = this->child_->React(event, ctx);
    if ((current_ >= count_) || !IsTerminal(s)) {
      return s;
    }
    this->child_->Reset(s);
    ++current_;
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

/**
 * @brief Keeps retrying the child on later events until it succeeds.
 *
 * A FAILURE resets the child and yields RUNNING; SUCCESS is propagated.
 */
template <typename Context>
class RepeatUntilSuccess final : public Decorator<Context> {
 public:
  explicit RepeatUntilSuccess(NodePtr<Context> child) noexcept
      : Decorator<Context>(std::move(child)) {}

  Status React(const Event& event, Context& ctx) override {
    const Status s = this->child_->React(event, ctx);
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
 * @brief Keeps retrying the child on later events until it fails.
 *
 * A SUCCESS resets the child and yields RUNNING; FAILURE is propagated.
 */
template <typename Context>
class RepeatUntilFailure final : public Decorator<Context> {
 public:
  explicit RepeatUntilFailure(NodePtr<Context> child) noexcept
      : Decorator<Context>(std::move(child)) {}

  Status React(const Event& event, Context& ctx) override {
    const Status s = this->child_->React(event, ctx);
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

/**
 * @brief Makes the child reachable only by events of one kind.
 *
 * Inside a list the gate also holds back every later sibling from events
 * of other kinds, since lists stop at the first uninterested child.
 */
template <typename Context>
class EventGate final : public Decorator<Context> {
 public:
  EventGate(NodePtr<Context> child, EventKind kind) noexcept
      : Decorator<Context>(std::move(child)), kind_(kind) {}

  bool InterestedIn(EventKind kind) const noexcept override {
    return kind == kind_;
  }

  Status React(const Event& event, Context& ctx) override {
    return this->child_->React(event, ctx);
  }

  NodeType type() const noexcept override { return NodeType::kEventGate; }

  /** @brief Get the only kind this gate lets through. */
  EventKind kind() const noexcept { return kind_; }

 private:
  EventKind kind_;
};

}  // namespace reactive
}  // namespace bhv

#endif  // BHV_REACTIVE_DECORATOR_HPP_

/**
 * @file node.hpp
 * @brief Reactive-model node contract.
 */

#ifndef BHV_REACTIVE_NODE_HPP_
#define BHV_REACTIVE_NODE_HPP_

#include <memory>
#include <type_traits>

#include "bhv/event.hpp"
#include "bhv/status.hpp"

namespace bhv {
namespace reactive {

/**
 * @brief Reactive behavior tree node, advanced by one event at a time.
 * @tparam Context User-defined context type shared by every node of a tree.
 *
 * Before an event reaches React(), the enclosing node (or the driver)
 * asks InterestedIn() with the event's kind; an uninterested node is not
 * offered the event at all. Reset() follows a terminal status, as in the
 * poll model.
 *
 * Reactive and poll nodes are separate class families and cannot be mixed
 * in one tree.
 */
template <typename Context>
class Node {
  static_assert(!std::is_pointer<Context>::value,
                "Context must not be a pointer type; use the pointed-to type");

 public:
  Node() noexcept = default;
  virtual ~Node() = default;

  // Non-copyable, non-movable
  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;
  Node(Node&&) = delete;
  Node& operator=(Node&&) = delete;

  /** @brief Whether events of @p kind should reach this node. */
  virtual bool InterestedIn(EventKind kind) const noexcept {
    (void)kind;
    return true;
  }

  /**
   * @brief Advance the node in response to one event.
   * @param event The event being dispatched.
   * @param ctx Shared context, borrowed for the duration of the call.
   */
  virtual Status React(const Event& event, Context& ctx) = 0;

  /** @brief Rearm the node after a run (default: no-op). */
  virtual void Reset(Status last_status) noexcept { (void)last_status; }

  /** @brief Node kind tag (diagnostics). */
  virtual NodeType type() const noexcept = 0;

  /** @brief Validate this node's own configuration (non-recursive). */
  virtual ValidateError Validate() const noexcept {
    return ValidateError::kNone;
  }

  /** @brief Recursively validate this node and all descendants. */
  virtual ValidateError ValidateTree() const noexcept { return Validate(); }
};

/// Owning pointer to a reactive node.
template <typename Context>
using NodePtr = std::unique_ptr<Node<Context>>;

}  // namespace reactive
}  // namespace bhv

#endif  // BHV_REACTIVE_NODE_HPP_

/**
 * @file node.hpp
 * @brief Poll-model node contract.
 */

#ifndef BHV_NODE_HPP_
#define BHV_NODE_HPP_

#include <memory>
#include <type_traits>

#include "bhv/status.hpp"

namespace bhv {

/**
 * @brief Poll-model behavior tree node.
 * @tparam Context User-defined context type shared by every node of a tree.
 *
 * A node is stepped with Tick() until it returns a terminal status. After
 * a terminal status the caller (an enclosing node or the driver) calls
 * Reset() with that status before the node is ticked again, which restores
 * any resumption state (cursor, counters) to its initial value. Reset() is
 * idempotent; stateless nodes keep the default no-op.
 *
 * Nodes are built once, owned by their parent through NodePtr, and keep
 * their shape for the lifetime of the tree.
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

  /**
   * @brief Advance the node by one step.
   * @param ctx Shared context, borrowed for the duration of the call.
   * @return RUNNING to be called again, SUCCESS/FAILURE when done.
   */
  virtual Status Tick(Context& ctx) = 0;

  /**
   * @brief Rearm the node after a run.
   * @param last_status Terminal status the node produced, or any terminal
   *        status when the caller abandons a running node.
   */
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

/// Owning pointer to a poll-model node.
template <typename Context>
using NodePtr = std::unique_ptr<Node<Context>>;

}  // namespace bhv

#endif  // BHV_NODE_HPP_

/**
 * @file status.hpp
 * @brief Status algebra, node type tags and tree validation codes.
 */

#ifndef BHV_STATUS_HPP_
#define BHV_STATUS_HPP_

#include <cstdint>

namespace bhv {

// ============================================================================
// Status
// ============================================================================

/**
 * @brief Outcome of one step of a node.
 *
 * RUNNING means "call me again". SUCCESS and FAILURE are terminal for the
 * current run; the node must be reset before it is stepped again.
 * Values carry no ordering and are only compared for equality.
 */
enum class Status : uint8_t {
  kRunning = 0,  ///< Node needs more steps
  kSuccess = 1,  ///< Node completed successfully
  kFailure = 2   ///< Node failed to complete
};

/**
 * @brief Convert Status to human-readable string.
 */
inline constexpr const char* StatusToString(Status s) noexcept {
  return (s == Status::kRunning)   ? "RUNNING"
       : (s == Status::kSuccess) ? "SUCCESS"
       : (s == Status::kFailure) ? "FAILURE"
       : "UNKNOWN";
}

/** @brief Check if a status ends the current run (SUCCESS or FAILURE). */
inline constexpr bool IsTerminal(Status s) noexcept {
  return s != Status::kRunning;
}

/** @brief Map SUCCESS <-> FAILURE, RUNNING unchanged. */
inline constexpr Status InvertStatus(Status s) noexcept {
  return (s == Status::kSuccess)   ? Status::kFailure
       : (s == Status::kFailure) ? Status::kSuccess
       : s;
}

// ============================================================================
// Node Type
// ============================================================================

/**
 * @brief Node kind tag, shared by the poll and reactive node families.
 *
 * Used for diagnostics and validation only; dispatch is virtual.
 */
enum class NodeType : uint8_t {
  kAction = 0,
  kCondition,
  kAsyncAction,
  kSequence,
  kSelector,
  kInvert,
  kForceSuccess,
  kForceFailure,
  kRepeat,
  kRepeatUntil,
  kRepeatUntilSuccess,
  kRepeatUntilFailure,
  kRunIf,
  kEventGate
};

/**
 * @brief Convert NodeType to human-readable string.
 */
inline constexpr const char* NodeTypeToString(NodeType t) noexcept {
  return (t == NodeType::kAction)               ? "ACTION"
       : (t == NodeType::kCondition)          ? "CONDITION"
       : (t == NodeType::kAsyncAction)        ? "ASYNC_ACTION"
       : (t == NodeType::kSequence)           ? "SEQUENCE"
       : (t == NodeType::kSelector)           ? "SELECTOR"
       : (t == NodeType::kInvert)             ? "INVERT"
       : (t == NodeType::kForceSuccess)       ? "FORCE_SUCCESS"
       : (t == NodeType::kForceFailure)       ? "FORCE_FAILURE"
       : (t == NodeType::kRepeat)             ? "REPEAT"
       : (t == NodeType::kRepeatUntil)        ? "REPEAT_UNTIL"
       : (t == NodeType::kRepeatUntilSuccess) ? "REPEAT_UNTIL_SUCCESS"
       : (t == NodeType::kRepeatUntilFailure) ? "REPEAT_UNTIL_FAILURE"
       : (t == NodeType::kRunIf)              ? "RUN_IF"
       : (t == NodeType::kEventGate)          ? "EVENT_GATE"
       : "UNKNOWN";
}

/** @brief Check if a node type is a leaf adaptor type. */
inline constexpr bool IsLeafType(NodeType t) noexcept {
  return (t == NodeType::kAction) || (t == NodeType::kCondition) ||
         (t == NodeType::kAsyncAction);
}

/** @brief Check if a node type is a composite type. */
inline constexpr bool IsCompositeType(NodeType t) noexcept {
  return (t == NodeType::kSequence) || (t == NodeType::kSelector);
}

/** @brief Check if a node type is a single-child decorator type. */
inline constexpr bool IsDecoratorType(NodeType t) noexcept {
  return !IsLeafType(t) && !IsCompositeType(t);
}

// ============================================================================
// Validation Error
// ============================================================================

/**
 * @brief Tree construction error codes.
 *
 * Returned by the list builders (which then produce no node) and by
 * Validate()/ValidateTree(). Malformed trees are rejected before the
 * first step; nothing is checked on the tick path.
 */
enum class ValidateError : uint8_t {
  kNone = 0,           ///< No error
  kEmptyComposite,     ///< Sequence/Selector built with zero children
  kChildrenExceedMax,  ///< Children count exceeds BHV_MAX_CHILDREN
  kNullChild,          ///< Null owning pointer given as a child
  kRepeatCountZero     ///< Repeat built with a target count of 0
};

/** @brief Convert ValidateError to human-readable string. */
inline constexpr const char* ValidateErrorToString(ValidateError e) noexcept {
  return (e == ValidateError::kNone)               ? "NONE"
       : (e == ValidateError::kEmptyComposite)    ? "EMPTY_COMPOSITE"
       : (e == ValidateError::kChildrenExceedMax) ? "CHILDREN_EXCEED_MAX"
       : (e == ValidateError::kNullChild)         ? "NULL_CHILD"
       : (e == ValidateError::kRepeatCountZero)   ? "REPEAT_COUNT_ZERO"
       : "UNKNOWN";
}

}  // namespace bhv

#endif  // BHV_STATUS_HPP_

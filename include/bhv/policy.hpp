/**
 * @file policy.hpp
 * @brief Continuation policies shared by poll and reactive composites.
 *
 * A policy fixes the status that lets a list move on to its next child;
 * the other terminal status short-circuits the list.
 */

#ifndef BHV_POLICY_HPP_
#define BHV_POLICY_HPP_

#include "bhv/status.hpp"

namespace bhv {

/** @brief AND-until-failure policy. */
struct SequencePolicy {
  static constexpr Status Continue() noexcept { return Status::kSuccess; }
  static constexpr Status ShortCircuit() noexcept { return Status::kFailure; }
  static constexpr NodeType Type() noexcept { return NodeType::kSequence; }
};

/** @brief OR-until-success policy. */
struct SelectorPolicy {
  static constexpr Status Continue() noexcept { return Status::kFailure; }
  static constexpr Status ShortCircuit() noexcept { return Status::kSuccess; }
  static constexpr NodeType Type() noexcept { return NodeType::kSelector; }
};

}  // namespace bhv

#endif  // BHV_POLICY_HPP_

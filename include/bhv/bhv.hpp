/**
 * @file bhv.hpp
 * @brief Umbrella header: poll and reactive behavior trees.
 *
 * Design principles:
 * - Template for type-safe user context (no void* casting)
 * - Abstract node interface, children owned through std::unique_ptr
 * - Fixed-capacity children array per composite (BHV_MAX_CHILDREN)
 * - Tree construction errors reported as ValidateError codes
 * - -fno-exceptions, -fno-rtti compatible
 *
 * Naming convention (Google C++ Style Guide):
 * - Accessors: lowercase (e.g., type(), current_child_index())
 * - Regular functions: PascalCase (e.g., Tick(), React(), Reset())
 */

#ifndef BHV_BHV_HPP_
#define BHV_BHV_HPP_

#include "bhv/config.hpp"
#include "bhv/status.hpp"

// Poll model
#include "bhv/behavior_tree.hpp"
#include "bhv/composite.hpp"
#include "bhv/decorator.hpp"
#include "bhv/factory.hpp"
#include "bhv/leaf.hpp"
#include "bhv/node.hpp"

// Reactive model
#include "bhv/event.hpp"
#include "bhv/reactive/behavior_tree.hpp"
#include "bhv/reactive/composite.hpp"
#include "bhv/reactive/decorator.hpp"
#include "bhv/reactive/factory.hpp"
#include "bhv/reactive/leaf.hpp"
#include "bhv/reactive/node.hpp"

#endif  // BHV_BHV_HPP_

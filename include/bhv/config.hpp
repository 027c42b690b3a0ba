/**
 * @file config.hpp
 * @brief Compile-time configuration and compiler hints for bhv.
 *
 * Configuration macros (define BEFORE including any bhv header):
 * - BHV_MAX_CHILDREN: Max children per composite node (default 16).
 *   Children live in a fixed-capacity inline array of owning pointers.
 */

#ifndef BHV_CONFIG_HPP_
#define BHV_CONFIG_HPP_

// ============================================================================
// Configuration
// ============================================================================

/** @brief Maximum children per composite (fixed-capacity inline array). */
#ifndef BHV_MAX_CHILDREN
#define BHV_MAX_CHILDREN 16
#endif

// ============================================================================
// Compiler hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define BHV_LIKELY(x) __builtin_expect(!!(x), 1)
#define BHV_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define BHV_FORCE_INLINE inline __attribute__((always_inline))
#define BHV_HOT __attribute__((hot))
#else
#define BHV_LIKELY(x) (x)
#define BHV_UNLIKELY(x) (x)
#define BHV_FORCE_INLINE inline
#define BHV_HOT
#endif

#endif  // BHV_CONFIG_HPP_

#ifndef BHV_DETAIL_ALWAYS_FALSE_HPP_
#define BHV_DETAIL_ALWAYS_FALSE_HPP_

#include <type_traits>

namespace bhv {
namespace detail {

/// Dependent false, for static_assert in templates meant to be rejected.
template <typename T>
struct AlwaysFalse : std::false_type {};

}  // namespace detail
}  // namespace bhv

#endif  // BHV_DETAIL_ALWAYS_FALSE_HPP_

/**
 * @file child_list.hpp
 * @brief Fixed-capacity owning child storage shared by both composite
 *        families.
 */

#ifndef BHV_DETAIL_CHILD_LIST_HPP_
#define BHV_DETAIL_CHILD_LIST_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "bhv/config.hpp"
#include "bhv/status.hpp"

namespace bhv {
namespace detail {

/**
 * @brief Ordered children of a composite, owned exclusively.
 * @tparam NodeT Node base class (poll or reactive family).
 *
 * Children are stored in an inline array of BHV_MAX_CHILDREN owning
 * pointers. Extra children are dropped and remembered, so Validate()
 * reports kChildrenExceedMax instead of growing the array.
 */
template <typename NodeT>
class ChildList final {
 public:
  /// Maximum children per composite (compile-time configurable).
  static constexpr uint16_t kMaxChildren =
      static_cast<uint16_t>(BHV_MAX_CHILDREN);

  static_assert(BHV_MAX_CHILDREN > 0, "BHV_MAX_CHILDREN must be positive");
  static_assert(BHV_MAX_CHILDREN <= 256, "BHV_MAX_CHILDREN too large (max 256)");

  using Pointer = std::unique_ptr<NodeT>;

  explicit ChildList(std::vector<Pointer>&& children) noexcept
      : count_(0), overflow_(false) {
    for (auto& child : children) {
      if (count_ < kMaxChildren) {
        children_[count_] = std::move(child);
        ++count_;
      } else {
        overflow_ = true;
      }
    }
  }

  ChildList(const ChildList&) = delete;
  ChildList& operator=(const ChildList&) = delete;

  /** @brief Number of stored children. */
  uint16_t size() const noexcept { return count_; }

  /** @brief Child at index (caller guarantees index < size()). */
  NodeT& operator[](uint16_t index) const noexcept {
    return *children_[index];
  }

  /**
   * @brief Reset the children visited in the current run.
   * @param last_index Index of the last visited child; every child before
   *        it completed with @p passed.
   * @param passed Status the earlier children completed with.
   * @param last_status Status to hand to the child at @p last_index.
   */
  void ResetVisited(uint16_t last_index, Status passed,
                    Status last_status) noexcept {
    for (uint16_t i = 0; (i < last_index) && (i < count_); ++i) {
      if (children_[i] != nullptr) {
        children_[i]->Reset(passed);
      }
    }
    if ((last_index < count_) && (children_[last_index] != nullptr)) {
      children_[last_index]->Reset(last_status);
    }
  }

  /**
   * @brief Validate the list shape (non-recursive).
   */
  ValidateError Validate() const noexcept {
    if (overflow_) {
      return ValidateError::kChildrenExceedMax;
    }
    if (count_ == 0U) {
      return ValidateError::kEmptyComposite;
    }
    for (uint16_t i = 0; i < count_; ++i) {
      if (children_[i] == nullptr) {
        return ValidateError::kNullChild;
      }
    }
    return ValidateError::kNone;
  }

  /**
   * @brief Validate the list shape, then every child subtree.
   */
  ValidateError ValidateTree() const noexcept {
    ValidateError err = Validate();
    if (err != ValidateError::kNone) {
      return err;
    }
    for (uint16_t i = 0; i < count_; ++i) {
      err = children_[i]->ValidateTree();
      if (err != ValidateError::kNone) {
        return err;
      }
    }
    return ValidateError::kNone;
  }

 private:
  Pointer children_[kMaxChildren];
  uint16_t count_;
  bool overflow_;
};

template <typename NodeT>
constexpr uint16_t ChildList<NodeT>::kMaxChildren;

/**
 * @brief Check a children list before a composite is built from it.
 */
template <typename Pointer>
ValidateError CheckChildren(const std::vector<Pointer>& children) noexcept {
  if (children.empty()) {
    return ValidateError::kEmptyComposite;
  }
  if (children.size() > static_cast<size_t>(BHV_MAX_CHILDREN)) {
    return ValidateError::kChildrenExceedMax;
  }
  for (const auto& child : children) {
    if (child == nullptr) {
      return ValidateError::kNullChild;
    }
  }
  return ValidateError::kNone;
}

/**
 * @brief Move a non-empty pack of owning pointers into a vector.
 */
template <typename Pointer, typename... Rest>
std::vector<Pointer> CollectChildren(Pointer first, Rest... rest) {
  std::vector<Pointer> children;
  children.reserve(1U + sizeof...(Rest));
  children.push_back(std::move(first));
  int expand[] = {0, (children.push_back(Pointer(std::move(rest))), 0)...};
  (void)expand;
  return children;
}

}  // namespace detail
}  // namespace bhv

#endif  // BHV_DETAIL_CHILD_LIST_HPP_

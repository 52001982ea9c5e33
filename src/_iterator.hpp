#pragma once

#include "_node-ops.hpp"

#include <iterator>

namespace pvec::detail {

/**
 * Forward iterator over the elements of a vector, in order.
 *
 * Keeps the ancestors of the current leaf. When the position crosses into the
 * next leaf, only the levels beneath the highest level where the new and the
 * previous position diverge are walked again, so iteration is amortized O(1)
 * per element. Once the position reaches the tail offset, the tail is used.
 */
template <typename NodeOps> class Iterator {
public:
  using iterator_category = std::forward_iterator_tag;
  using difference_type = std::ptrdiff_t;
  using value_type = typename NodeOps::item_type;
  using reference = const value_type&;
  using pointer = const value_type*;
  using size_type = typename NodeOps::size_type;
  using node_type = typename NodeOps::node_type;
  using node_ptr_type = node_type*;

private:
  std::array<node_ptr_type, MaxTrieDepth> path_{}; // path_[0] is the root, path_[depth] a leaf
  node_ptr_type root_ = nullptr;
  node_ptr_type tail_ = nullptr;
  node_ptr_type leaf_ = nullptr; // current leaf, taken from path_, or the tail
  size_type size_ = 0;
  size_type tail_offset_ = 0;
  size_type index_ = 0;
  uint32_t shift_ = 0;

public:
  struct MakeBeginTag {};
  struct MakeEndTag {};

  constexpr Iterator() = default;

  constexpr Iterator(node_ptr_type root, node_ptr_type tail, size_type size, uint32_t shift,
                     MakeBeginTag)
      : root_{root}, tail_{tail}, size_{size}, tail_offset_{tail_offset(size)}, index_{0},
        shift_{shift} {
    if (size_ > 0)
      descend_to_leftmost_leaf_();
  }

  constexpr Iterator(node_ptr_type root, node_ptr_type tail, size_type size, uint32_t shift,
                     MakeEndTag)
      : root_{root}, tail_{tail}, size_{size}, tail_offset_{tail_offset(size)}, index_{size},
        shift_{shift} {}

  constexpr bool operator==(const Iterator& other) const {
    return index_ == other.index_ && tail_ == other.tail_;
  }

  constexpr bool operator!=(const Iterator& other) const { return !(*this == other); }

  constexpr Iterator& operator++() {
    increment_();
    return *this;
  }

  constexpr Iterator operator++(int) {
    Iterator tmp = *this;
    ++(*this);
    return tmp;
  }

  constexpr reference operator*() const { return *operator->(); }

  constexpr pointer operator->() const {
    assert(!is_end_());
    assert(leaf_ != nullptr);
    return NodeOps::Leaf::ptr_at(leaf_, static_cast<uint32_t>(index_ & BranchMask));
  }

  /**
   * The zero-based position of the current element
   */
  constexpr size_type index() const { return index_; }

private:
  constexpr bool is_end_() const { return index_ >= size_; }

  constexpr uint32_t leaf_depth_() const { return shift_ / BranchBits; }

  constexpr void increment_() {
    if (is_end_()) {
      return; // Attempt to increment beyond the end of the collection
    }
    ++index_;
    if (!is_end_() && (index_ & BranchMask) == 0)
      next_leaf_();
  }

  constexpr void descend_to_leftmost_leaf_() {
    if (tail_offset_ == 0) {
      leaf_ = tail_; // everything is in the tail
      return;
    }
    path_[0] = root_;
    for (auto depth = 0u; depth < leaf_depth_(); ++depth)
      path_[depth + 1] = NodeOps::child_at(path_[depth], 0);
    leaf_ = path_[leaf_depth_()];
  }

  constexpr void next_leaf_() {
    if (index_ >= tail_offset_) {
      leaf_ = tail_;
      return;
    }

    // The ancestors above the divergence level are the same for the new leaf
    const auto level = divergence_level(index_, shift_);
    for (auto depth = (shift_ - level) / BranchBits; depth < leaf_depth_(); ++depth) {
      const auto slot = selector(index_, NodeOps::level_at_depth(shift_, depth));
      path_[depth + 1] = NodeOps::child_at(path_[depth], slot);
    }
    leaf_ = path_[leaf_depth_()];
  }
};

} // namespace pvec::detail

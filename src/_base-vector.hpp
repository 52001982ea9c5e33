#pragma once

#include "_errors.hpp"
#include "_node-data.hpp"
#include "_base-node-ops.hpp"
#include "_node-ops.hpp"
#include "_iterator.hpp"

#include <limits>
#include <new>

namespace pvec::detail {

// ------------------------------------------------------------------------------------- base_vector

/**
 * The vector value: {size, shift, root, tail}.
 *
 * `root` is null while every element fits in the tail. `tail` is null only
 * for the empty vector. The `set`, `push_back` and `pop_back` members leave
 * `*this` untouched and return a new value that shares all unchanged nodes.
 * The `transient_` members edit `*this` in place, copying any node that is
 * shared with another value before editing it.
 */
template <typename T, bool IsThreadSafe = true> class base_vector {
public:
  using Ops = detail::NodeOps<T, IsThreadSafe>;
  using node_type = typename Ops::node_type;
  using node_ptr_type = typename Ops::node_ptr_type;
  using node_const_ptr_type = typename Ops::node_const_ptr_type;

  //@{
  using value_type = T;
  using size_type = typename Ops::size_type;
  using reference = value_type&;
  using const_reference = const value_type&;
  using const_iterator = typename detail::Iterator<Ops>;
  static constexpr bool is_thread_safe = IsThreadSafe;
  //@}

private:
  node_ptr_type root_{nullptr}; //!< Root of the trie, branch or leaf
  node_ptr_type tail_{nullptr}; //!< Last 1..32 elements
  size_type size_{0};           //!< Current size of the vector
  uint32_t shift_{0};           //!< Level of the root

  // Takes over the references to `root` and `tail`
  constexpr base_vector(size_type size, uint32_t shift, node_ptr_type root, node_ptr_type tail)
      : root_{root}, tail_{tail}, size_{size}, shift_{shift} {}

public:
  //@{ Construction/Destruction
  constexpr base_vector() = default;
  constexpr base_vector(const base_vector& other) { *this = other; }
  constexpr base_vector(base_vector&& other) noexcept { swap(other); }
  constexpr ~base_vector() {
    Ops::dec_ref(root_);
    Ops::dec_ref(tail_);
  }
  //@}

  //@{ Assignment
  constexpr base_vector& operator=(const base_vector& other) {
    Ops::add_ref(other.root_); // before releasing, in case of self assignment
    Ops::add_ref(other.tail_);
    Ops::dec_ref(root_);
    Ops::dec_ref(tail_);
    root_ = other.root_;
    tail_ = other.tail_;
    size_ = other.size_;
    shift_ = other.shift_;
    return *this;
  }

  constexpr base_vector& operator=(base_vector&& other) noexcept {
    swap(other);
    return *this;
  }
  //@}

  //@{ Iterators
  constexpr const_iterator cbegin() const {
    return const_iterator{root_, tail_, size_, shift_, typename const_iterator::MakeBeginTag{}};
  }
  constexpr const_iterator cend() const {
    return const_iterator{root_, tail_, size_, shift_, typename const_iterator::MakeEndTag{}};
  }
  //@}

  //@{ Capacity
  constexpr bool empty() const { return size() == 0; }
  constexpr size_type size() const { return size_; }
  static constexpr size_type max_size() { return std::numeric_limits<size_type>::max(); }
  //@}

  //@{ Structure
  constexpr uint32_t shift() const { return shift_; }
  constexpr node_ptr_type root() const { return root_; }
  constexpr node_ptr_type tail() const { return tail_; }
  //@}

  //@{ Lookup
  constexpr const_reference get(size_type position) const {
    check_index_(position);
    return *Ops::Leaf::ptr_at(leaf_for_(position), selector(position, 0));
  }

  constexpr const_reference front() const {
    if (empty())
      throw empty_vector_error{"front"};
    return get(0);
  }

  constexpr const_reference back() const {
    if (empty())
      throw empty_vector_error{"back"};
    return *Ops::Leaf::ptr_at(tail_, tail_size(size_) - 1);
  }
  //@}

  //@{ Persistent modifiers
  template <typename Value> constexpr base_vector set(size_type position, Value&& value) const {
    check_index_(position);
    if (is_in_tail(position, size_)) {
      auto new_tail = Ops::Leaf::duplicate_with_overwrite(tail_, selector(position, 0),
                                                          std::forward<Value>(value));
      return base_vector{size_, shift_, Ops::add_ref(root_), new_tail};
    }
    auto new_root = Ops::assoc(root_, shift_, position, std::forward<Value>(value));
    return base_vector{size_, shift_, new_root, Ops::add_ref(tail_)};
  }

  template <typename Value> constexpr base_vector push_back(Value&& value) const {
    if (size_ == 0)
      return base_vector{1, 0, nullptr, Ops::Leaf::make(std::forward<Value>(value))};

    if (tail_size(size_) != BranchFactor) {
      auto new_tail = Ops::Leaf::copy_append(tail_, std::forward<Value>(value));
      return base_vector{size_ + 1, shift_, Ops::add_ref(root_), new_tail};
    }

    // The full tail moves into the trie, and `value` starts a new tail
    base_vector result{size_ + 1, shift_, nullptr, Ops::Leaf::make(std::forward<Value>(value))};
    if (root_ == nullptr) {
      result.root_ = Ops::add_ref(tail_);
    } else if (trie_is_full(size_, shift_)) {
      result.root_ = Ops::grow(root_, shift_, tail_);
      result.shift_ = shift_ + BranchBits;
    } else {
      result.root_ = Ops::push_leaf(root_, shift_, tail_offset(size_), tail_);
    }
    return result;
  }

  constexpr base_vector pop_back() const {
    if (empty())
      throw empty_vector_error{"pop_back"};

    if (size_ == 1)
      return base_vector{};

    if (tail_size(size_) > 1) {
      auto new_tail = Ops::Leaf::duplicate_without_last(tail_);
      return base_vector{size_ - 1, shift_, Ops::add_ref(root_), new_tail};
    }

    // The tail would become empty, so the rightmost leaf of the trie becomes the tail
    if (size_ == BranchFactor + 1)
      return base_vector{BranchFactor, 0, nullptr, Ops::add_ref(root_)};

    const auto trie_size = size_ - BranchFactor - 1; // what remains in the trie
    if (is_shrinking_(trie_size)) {
      auto new_root = Ops::add_ref(Ops::child_at(root_, 0));
      auto new_tail =
          Ops::add_ref(Ops::leftmost_leaf(Ops::child_at(root_, 1), shift_ - BranchBits));
      return base_vector{size_ - 1, shift_ - BranchBits, new_root, new_tail};
    }

    auto [new_root, new_tail] = Ops::pop_leaf(root_, shift_, trie_size);
    return base_vector{size_ - 1, shift_, new_root, new_tail};
  }
  //@}

  //@{ Transient modifiers
  template <typename Value> constexpr void transient_set(size_type position, Value&& value) {
    check_index_(position);
    if (is_in_tail(position, size_))
      Ops::transient_assoc(&tail_, 0, position, std::forward<Value>(value));
    else
      Ops::transient_assoc(&root_, shift_, position, std::forward<Value>(value));
  }

  template <typename Value> constexpr void transient_push_back(Value&& value) {
    if (size_ == 0) {
      tail_ = Ops::Leaf::make(std::forward<Value>(value));
    } else if (tail_size(size_) != BranchFactor) {
      Ops::Leaf::append(Ops::ensure_editable(&tail_), std::forward<Value>(value));
    } else {
      auto new_tail = Ops::Leaf::make(std::forward<Value>(value));
      try {
        transient_push_tail_();
      } catch (const std::bad_alloc&) {
        Ops::dec_ref(new_tail);
        throw;
      }
      tail_ = new_tail;
    }
    ++size_;
  }

  constexpr void transient_pop_back() {
    if (empty())
      throw empty_vector_error{"pop_back"};

    if (size_ == 1) {
      Ops::dec_ref(tail_);
      tail_ = nullptr;
    } else if (tail_size(size_) > 1) {
      Ops::Leaf::remove_last(Ops::ensure_editable(&tail_));
    } else if (size_ == BranchFactor + 1) {
      Ops::dec_ref(tail_);
      tail_ = root_;
      root_ = nullptr;
    } else {
      const auto trie_size = size_ - BranchFactor - 1;
      if (is_shrinking_(trie_size)) {
        auto new_root = Ops::add_ref(Ops::child_at(root_, 0));
        auto new_tail =
            Ops::add_ref(Ops::leftmost_leaf(Ops::child_at(root_, 1), shift_ - BranchBits));
        Ops::dec_ref(root_);
        root_ = new_root;
        shift_ -= BranchBits;
        Ops::dec_ref(tail_);
        tail_ = new_tail;
      } else {
        auto new_tail = Ops::transient_pop_leaf(&root_, shift_, trie_size);
        Ops::dec_ref(tail_);
        tail_ = new_tail;
      }
    }
    --size_;
  }
  //@}

  //@{ Modifiers
  constexpr void clear() {
    Ops::dec_ref(root_);
    Ops::dec_ref(tail_);
    root_ = nullptr;
    tail_ = nullptr;
    size_ = 0;
    shift_ = 0;
  }

  constexpr void swap(base_vector& other) noexcept { // Should be able to swap onto itself
    std::swap(root_, other.root_);
    std::swap(tail_, other.tail_);
    std::swap(size_, other.size_);
    std::swap(shift_, other.shift_);
  }
  //@}

  //@{ Friends
  friend constexpr bool operator==(const base_vector& lhs, const base_vector& rhs) {
    if (lhs.size() != rhs.size())
      return false;

    if (lhs.root_ == rhs.root_ && lhs.tail_ == rhs.tail_)
      return true;

    auto ii = lhs.cbegin();
    auto jj = rhs.cbegin();
    for (; ii != lhs.cend(); ++ii, ++jj) {
      if (!(*ii == *jj))
        return false;
    }
    return true;
  }

  friend constexpr bool operator!=(const base_vector& lhs, const base_vector& rhs) {
    return !(lhs == rhs);
  }
  //@}

private:
  constexpr void check_index_(size_type position) const {
    if (position >= size_)
      throw_index_out_of_range(position, size_);
  }

  constexpr node_ptr_type leaf_for_(size_type position) const {
    return is_in_tail(position, size_) ? tail_ : Ops::find_leaf(root_, shift_, position);
  }

  // Moves the full tail into the trie. On return the trie owns the reference held in
  // `tail_`, which the caller replaces. Leaves `*this` unchanged if an allocation fails.
  constexpr void transient_push_tail_() {
    if (root_ == nullptr) {
      root_ = tail_;
      return;
    }
    if (trie_is_full(size_, shift_)) {
      auto grown = Ops::grow(root_, shift_, tail_);
      Ops::dec_ref(root_);
      root_ = grown;
      shift_ += BranchBits;
    } else {
      Ops::transient_push_leaf(&root_, shift_, tail_offset(size_), tail_);
    }
    Ops::dec_ref(tail_);
  }

  // True when `trie_size` elements fit in a trie one level lower than the current one
  constexpr bool is_shrinking_(size_type trie_size) const {
    return shift_ > 0 && trie_size == capacity(shift_ - BranchBits);
  }
};

} // namespace pvec::detail

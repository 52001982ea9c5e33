#pragma once

#include "_base-vector.hpp"

#include <functional>
#include <initializer_list>
#include <utility>
#include <vector>

namespace pvec {

template <typename ItemType, bool IsThreadSafe> class transient_vector;

namespace detail {
// A reducer result of {accumulator, stop}, as opposed to a pair valued accumulator
template <typename Result, typename Accumulator>
struct is_stop_signal : std::false_type {};
template <typename Acc, typename Accumulator>
struct is_stop_signal<std::pair<Acc, bool>, Accumulator>
    : std::bool_constant<!std::is_same<std::pair<Acc, bool>, Accumulator>::value> {};

/**
 * Calls `f` with as many of (item, index, self) as it accepts
 */
template <typename Function, typename ItemType, typename SizeType, typename Self>
constexpr decltype(auto) call_with_position(Function& f, const ItemType& item, SizeType index,
                                            const Self& self) {
  if constexpr (std::is_invocable<Function&, const ItemType&, SizeType, const Self&>::value) {
    return std::invoke(f, item, index, self);
  } else if constexpr (std::is_invocable<Function&, const ItemType&, SizeType>::value) {
    return std::invoke(f, item, index);
  } else {
    return std::invoke(f, item);
  }
}

/**
 * Calls the reducer `f` with (accumulator, item) and as many of (index, self) as it accepts
 */
template <typename Function, typename Accumulator, typename ItemType, typename SizeType,
          typename Self>
constexpr decltype(auto) call_reducer(Function& f, Accumulator&& acc, const ItemType& item,
                                      SizeType index, const Self& self) {
  if constexpr (std::is_invocable<Function&, Accumulator&&, const ItemType&, SizeType,
                                  const Self&>::value) {
    return std::invoke(f, std::forward<Accumulator>(acc), item, index, self);
  } else if constexpr (std::is_invocable<Function&, Accumulator&&, const ItemType&,
                                         SizeType>::value) {
    return std::invoke(f, std::forward<Accumulator>(acc), item, index);
  } else {
    return std::invoke(f, std::forward<Accumulator>(acc), item);
  }
}
} // namespace detail

// ------------------------------------------------------------------------------- persistent_vector

template <typename ItemType,          // Type of item to store
          bool IsThreadSafe = true    // True if reference counts are atomic
          >
class persistent_vector {
private:
  using vector_type = detail::base_vector<ItemType, IsThreadSafe>;
  vector_type vec_;

  explicit persistent_vector(vector_type&& vec) : vec_{std::move(vec)} {}

  friend class transient_vector<ItemType, IsThreadSafe>;

public:
  using value_type = typename vector_type::value_type;
  using item_type = value_type;
  using size_type = typename vector_type::size_type;
  using reference = typename vector_type::reference;
  using const_reference = typename vector_type::const_reference;
  using iterator = typename vector_type::const_iterator;
  using const_iterator = typename vector_type::const_iterator;
  using transient_type = transient_vector<ItemType, IsThreadSafe>;
  static constexpr bool is_thread_safe = IsThreadSafe;

  //@{ Construction/Destruction
  constexpr persistent_vector() = default;
  constexpr persistent_vector(const persistent_vector& other) = default;
  constexpr persistent_vector(persistent_vector&& other) noexcept = default;
  constexpr ~persistent_vector() = default;

  template <typename InputIt> constexpr persistent_vector(InputIt first, InputIt last) {
    while (first != last) {
      vec_.transient_push_back(*first);
      ++first;
    }
  }
  constexpr persistent_vector(std::initializer_list<item_type> ilist)
      : persistent_vector(std::begin(ilist), std::end(ilist)) {}

  /**
   * A transient sharing every node with this vector. Nodes are copied as the
   * transient edits them, so this vector is never affected.
   */
  constexpr transient_type transient() const { return transient_type(vector_type{vec_}); }
  //@}

  //@{ Assignment
  constexpr persistent_vector& operator=(const persistent_vector& other) = default;
  constexpr persistent_vector& operator=(persistent_vector&& other) noexcept = default;
  //@}

  //@{ Iterators
  constexpr const_iterator begin() const { return vec_.cbegin(); }
  constexpr const_iterator cbegin() const { return vec_.cbegin(); }

  constexpr const_iterator end() const { return vec_.cend(); }
  constexpr const_iterator cend() const { return vec_.cend(); }
  //@}

  //@{ Capacity
  constexpr bool empty() const { return vec_.empty(); }
  constexpr size_type size() const { return vec_.size(); }
  static constexpr size_type max_size() { return vector_type::max_size(); }
  //@}

  //@{ Lookup
  constexpr const_reference get(size_type index) const { return vec_.get(index); }
  constexpr const_reference at(size_type index) const { return vec_.get(index); }
  constexpr const_reference operator[](size_type index) const { return vec_.get(index); }
  constexpr const_reference front() const { return vec_.front(); }
  constexpr const_reference back() const { return vec_.back(); }
  //@}

  //@{ Modifiers, each returns a new vector and leaves this one untouched
  template <typename Value> constexpr persistent_vector set(size_type index, Value&& value) const {
    return persistent_vector(vec_.set(index, std::forward<Value>(value)));
  }

  constexpr persistent_vector push_back(const item_type& value) const {
    return persistent_vector(vec_.push_back(value));
  }
  constexpr persistent_vector push_back(item_type&& value) const {
    return persistent_vector(vec_.push_back(std::move(value)));
  }

  template <typename... Args> constexpr persistent_vector emplace_back(Args&&... args) const {
    return push_back(item_type{std::forward<Args>(args)...});
  }

  constexpr persistent_vector pop_back() const { return persistent_vector(vec_.pop_back()); }

  constexpr void clear() { vec_.clear(); }
  constexpr void swap(persistent_vector& other) noexcept { vec_.swap(other.vec_); }
  //@}

  //@{ Sequence operations
  template <typename Function> constexpr void for_each_indexed(Function&& f) const {
    for (auto ii = cbegin(); ii != cend(); ++ii)
      std::invoke(f, ii.index(), *ii);
  }

  /**
   * A new vector of `f(item)`, where `f` may also take the index, and this vector.
   */
  template <typename Function> constexpr auto map(Function&& f) const {
    using result_type = std::decay_t<decltype(detail::call_with_position(
        f, std::declval<const item_type&>(), size_type{}, *this))>;
    auto result = transient_vector<result_type, IsThreadSafe>{};
    for (auto ii = cbegin(); ii != cend(); ++ii)
      result.push_back(detail::call_with_position(f, *ii, ii.index(), *this));
    return result.persistent();
  }

  /**
   * A new vector of the items for which `predicate(item)` is true. The predicate
   * may also take the index, and this vector.
   */
  template <typename Predicate> constexpr persistent_vector filter(Predicate&& predicate) const {
    auto result = transient_type{};
    for (auto ii = cbegin(); ii != cend(); ++ii) {
      if (detail::call_with_position(predicate, *ii, ii.index(), *this))
        result.push_back(*ii);
    }
    return result.persistent();
  }

  /**
   * Folds `f(accumulator, item)` over the items in order. `f` may also take the
   * index, and this vector. If `f` returns std::pair<Accumulator, bool> (and the
   * accumulator is not itself that pair), then a `true` second member stops the fold
   * after that item.
   */
  template <typename Function, typename Accumulator>
  constexpr Accumulator reduce(Function&& f, Accumulator init) const {
    Accumulator acc{std::move(init)};
    for (auto ii = cbegin(); ii != cend(); ++ii) {
      auto result = detail::call_reducer(f, std::move(acc), *ii, ii.index(), *this);
      if constexpr (detail::is_stop_signal<decltype(result), Accumulator>::value) {
        acc = std::move(result.first);
        if (result.second)
          break;
      } else {
        acc = std::move(result);
      }
    }
    return acc;
  }

  std::vector<item_type> to_vector() const {
    std::vector<item_type> result;
    result.reserve(size());
    for (const auto& item : *this)
      result.push_back(item);
    return result;
  }
  //@}

  //@{ Friends
  friend constexpr bool operator==(const persistent_vector& lhs, const persistent_vector& rhs) {
    return lhs.vec_ == rhs.vec_;
  }

  friend constexpr bool operator!=(const persistent_vector& lhs, const persistent_vector& rhs) {
    return lhs.vec_ != rhs.vec_;
  }

  friend constexpr void swap(persistent_vector& lhs, persistent_vector& rhs) noexcept {
    lhs.swap(rhs);
  }
  //@}
};

// -------------------------------------------------------------------------------- transient_vector

/**
 * A vector edited in place, for building or rewriting a vector in bulk.
 *
 * Obtained from `persistent_vector::transient()`, and turned back into a
 * persistent vector with `persistent()`. Not copyable: a copy would alias nodes
 * that the next edit changes in place. Not safe to share between threads.
 */
template <typename ItemType,          // Type of item to store
          bool IsThreadSafe = true    // True if reference counts are atomic
          >
class transient_vector {
private:
  using vector_type = detail::base_vector<ItemType, IsThreadSafe>;
  vector_type vec_;

  explicit transient_vector(vector_type&& vec) : vec_{std::move(vec)} {}

  friend class persistent_vector<ItemType, IsThreadSafe>;

public:
  using value_type = typename vector_type::value_type;
  using item_type = value_type;
  using size_type = typename vector_type::size_type;
  using reference = typename vector_type::reference;
  using const_reference = typename vector_type::const_reference;
  using const_iterator = typename vector_type::const_iterator;
  using persistent_type = persistent_vector<ItemType, IsThreadSafe>;
  static constexpr bool is_thread_safe = IsThreadSafe;

  //@{ Construction/Destruction
  constexpr transient_vector() = default;
  constexpr transient_vector(const transient_vector&) = delete;
  constexpr transient_vector(transient_vector&& other) noexcept = default;
  constexpr ~transient_vector() = default;

  /**
   * Hands the contents over to a persistent vector, leaving this transient empty
   */
  constexpr persistent_type persistent() {
    vector_type vec;
    vec.swap(vec_);
    return persistent_type(std::move(vec));
  }
  //@}

  //@{ Assignment
  constexpr transient_vector& operator=(const transient_vector&) = delete;
  constexpr transient_vector& operator=(transient_vector&& other) noexcept = default;
  //@}

  //@{ Iterators, invalidated by any edit
  constexpr const_iterator begin() const { return vec_.cbegin(); }
  constexpr const_iterator cbegin() const { return vec_.cbegin(); }

  constexpr const_iterator end() const { return vec_.cend(); }
  constexpr const_iterator cend() const { return vec_.cend(); }
  //@}

  //@{ Capacity
  constexpr bool empty() const { return vec_.empty(); }
  constexpr size_type size() const { return vec_.size(); }
  static constexpr size_type max_size() { return vector_type::max_size(); }
  //@}

  //@{ Lookup
  constexpr const_reference get(size_type index) const { return vec_.get(index); }
  constexpr const_reference at(size_type index) const { return vec_.get(index); }
  constexpr const_reference operator[](size_type index) const { return vec_.get(index); }
  constexpr const_reference front() const { return vec_.front(); }
  constexpr const_reference back() const { return vec_.back(); }
  //@}

  //@{ Modifiers, in place
  template <typename Value> constexpr transient_vector& set(size_type index, Value&& value) {
    vec_.transient_set(index, std::forward<Value>(value));
    return *this;
  }

  constexpr transient_vector& push_back(const item_type& value) {
    vec_.transient_push_back(value);
    return *this;
  }
  constexpr transient_vector& push_back(item_type&& value) {
    vec_.transient_push_back(std::move(value));
    return *this;
  }

  template <typename... Args> constexpr transient_vector& emplace_back(Args&&... args) {
    return push_back(item_type{std::forward<Args>(args)...});
  }

  constexpr transient_vector& pop_back() {
    vec_.transient_pop_back();
    return *this;
  }

  constexpr void clear() { vec_.clear(); }
  constexpr void swap(transient_vector& other) noexcept { vec_.swap(other.vec_); }
  //@}

  //@{ Friends
  friend constexpr void swap(transient_vector& lhs, transient_vector& rhs) noexcept {
    lhs.swap(rhs);
  }
  //@}
};

} // namespace pvec

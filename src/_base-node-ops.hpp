#pragma once

#include "_index-codec.hpp"
#include "_node-data.hpp"

#include <new>

namespace pvec::detail {

// ------------------------------------------------------------------------------------- BaseNodeOps

template <typename T, bool IsThreadSafe = true, bool IsBranchNode = false> struct BaseNodeOps {

  using node_type = NodeData<IsThreadSafe>;
  using node_ptr_type = node_type*;
  using node_const_ptr_type = const node_type*;
  using item_type = T;
  using node_size_type = typename node_type::node_size_type;
  using ref_count_type = typename node_type::ref_count_type;

  static constexpr NodeType DefaultType{IsBranchNode ? NodeType::Branch : NodeType::Leaf};
  static constexpr std::size_t LogicalSize{calculate_logical_size<item_type>()};
  static constexpr std::size_t AlignOf{std::max(alignof(item_type), alignof(node_type))};

  // The start of the slot array
  static constexpr std::size_t offset() {
    if (alignof(item_type) <= sizeof(node_type)) {
      return sizeof(node_type); // align=[1, 2, 4, 8] => data starts at node_type edge
    }
    return LogicalSize;
  }

  static constexpr std::size_t offset_at(node_size_type index) {
    return offset() + LogicalSize * index;
  }

  // Every node has room for `BranchFactor` slots; `std::aligned_alloc` wants a multiple of AlignOf
  static constexpr std::size_t storage_size() {
    const auto size = offset_at(BranchFactor);
    return ((size + AlignOf - 1) / AlignOf) * AlignOf;
  }

  static NodeType type(node_const_ptr_type node) { return node->type(); }

  static std::size_t size(node_const_ptr_type node) { return node->payload_; }

  static bool is_full(node_const_ptr_type node) { return node->payload_ == BranchFactor; }

  //@{ Member access
  static bool is_valid_index(node_const_ptr_type node, node_size_type index) {
    return index < node->payload_;
  }

  static item_type* ptr_at(node_const_ptr_type node, node_size_type index) {
    assert(index < BranchFactor);
    auto ptr_idx = reinterpret_cast<uintptr_t>(node) + offset_at(index);
    assert(ptr_idx % alignof(item_type) == 0); // never unaligned access
    return reinterpret_cast<item_type*>(ptr_idx);
  }
  //@}

  //@{ Utility
  static node_ptr_type make_uninitialized(node_size_type payload) {
    assert(payload <= BranchFactor);
    auto ptr = static_cast<node_ptr_type>(std::aligned_alloc(AlignOf, storage_size()));
    if (ptr == nullptr)
      throw std::bad_alloc{};
    new (ptr) node_type{DefaultType, payload};
    return ptr;
  }

  // Releases the memory of a node whose slots are all destroyed (or were never constructed)
  static void free_storage(node_ptr_type node) {
    node->~node_type();
    std::free(node);
  }
  //@}
};

// ------------------------------------------------------------------------------------- LeafNodeOps

template <typename T, bool IsThreadSafe = true>
struct LeafNodeOps : public BaseNodeOps<T, IsThreadSafe, false> {

  using Base = BaseNodeOps<T, IsThreadSafe, false>;

  using node_type = NodeData<IsThreadSafe>;
  using node_ptr_type = node_type*;
  using node_const_ptr_type = const node_type*;
  using item_type = T;
  using node_size_type = typename node_type::node_size_type;
  using ref_count_type = typename node_type::ref_count_type;

  static void copy_one(const item_type& src, item_type* dst) {
    if constexpr (std::is_trivial<item_type>::value) {
      std::memcpy(dst, &src, sizeof(item_type));
    } else {
      static_assert(std::is_copy_constructible<item_type>::value);
      new (dst) item_type(src);
    }
  }

  static void initialize_one(const item_type& src, item_type* dst) { copy_one(src, dst); }

  static void initialize_one(item_type&& src, item_type* dst) {
    if constexpr (std::is_move_constructible<item_type>::value) {
      new (dst) item_type(std::move(src));
    } else if constexpr (std::is_default_constructible<item_type>::value &&
                         std::is_move_assignable<item_type>::value) {
      new (dst) item_type{};
      *dst = std::move(src);
    } else {
      copy_one(src, dst);
    }
  }

  static void destroy_items(node_ptr_type node, node_size_type count) {
    if constexpr (!std::is_trivially_destructible<item_type>::value) {
      for (auto i = 0u; i < count; ++i)
        std::destroy_at(Base::ptr_at(node, i));
    }
  }

  /**
   * Copies the values of `src` into the fresh node `dst`, placing `value` at `index`.
   * If `index` is `src` size, then `value` is appended. If a copy throws, then the
   * already constructed values are destroyed, `dst` is freed, and the exception propagates.
   */
  template <typename Value>
  static void copy_with_value_(node_const_ptr_type src, node_ptr_type dst, node_size_type index,
                               Value&& value) {
    const auto sz = static_cast<node_size_type>(Base::size(dst));
    node_size_type constructed = 0;
    try {
      for (; constructed < sz; ++constructed) {
        if (constructed == index)
          initialize_one(std::forward<Value>(value), Base::ptr_at(dst, constructed));
        else
          copy_one(*Base::ptr_at(src, constructed), Base::ptr_at(dst, constructed));
      }
    } catch (...) {
      destroy_items(dst, constructed);
      Base::free_storage(dst);
      throw;
    }
  }

  static void copy_payload_to(node_const_ptr_type src, node_ptr_type dst) {
    assert(src != nullptr);
    assert(Base::size(dst) <= Base::size(src));
    const auto sz = static_cast<node_size_type>(Base::size(dst));
    if constexpr (std::is_trivially_copyable<item_type>::value) {
      std::memcpy(Base::ptr_at(dst, 0), Base::ptr_at(src, 0), sz * Base::LogicalSize);
    } else {
      static_assert(std::is_copy_constructible<item_type>::value);
      node_size_type constructed = 0;
      try {
        for (; constructed < sz; ++constructed)
          copy_one(*Base::ptr_at(src, constructed), Base::ptr_at(dst, constructed));
      } catch (...) {
        destroy_items(dst, constructed);
        Base::free_storage(dst);
        throw;
      }
    }
  }

  //@{ Factory
  template <typename Value> static node_ptr_type make(Value&& value) {
    auto* ptr = Base::make_uninitialized(1);
    try {
      initialize_one(std::forward<Value>(value), Base::ptr_at(ptr, 0));
    } catch (...) {
      Base::free_storage(ptr);
      throw;
    }
    return ptr;
  }

  /**
   * Creates a new leaf node, with values copied, and `value` at the end
   */
  template <typename Value>
  static node_ptr_type copy_append(node_const_ptr_type src, Value&& value) {
    const auto sz = static_cast<node_size_type>(Base::size(src));
    assert(sz < BranchFactor);
    auto new_node = Base::make_uninitialized(sz + 1);
    copy_with_value_(src, new_node, sz, std::forward<Value>(value));
    return new_node;
  }

  /**
   * Creates a new leaf node, with values copied, except `value` replaces the value at `index`
   */
  template <typename Value>
  static node_ptr_type duplicate_with_overwrite(node_const_ptr_type src, node_size_type index,
                                                Value&& value) {
    assert(Base::is_valid_index(src, index));
    auto new_node = Base::make_uninitialized(static_cast<node_size_type>(Base::size(src)));
    copy_with_value_(src, new_node, index, std::forward<Value>(value));
    return new_node;
  }

  static node_ptr_type duplicate(node_const_ptr_type src) {
    auto new_node = Base::make_uninitialized(static_cast<node_size_type>(Base::size(src)));
    copy_payload_to(src, new_node);
    return new_node;
  }

  /**
   * Creates a new leaf node holding all but the last value of `src`
   */
  static node_ptr_type duplicate_without_last(node_const_ptr_type src) {
    assert(Base::size(src) > 0);
    auto new_node = Base::make_uninitialized(static_cast<node_size_type>(Base::size(src) - 1));
    copy_payload_to(src, new_node);
    return new_node;
  }
  //@}

  //@{ In place edits, only for nodes that are not shared
  template <typename Value> static void append(node_ptr_type node, Value&& value) {
    assert(node->is_unique());
    assert(!Base::is_full(node));
    initialize_one(std::forward<Value>(value), Base::ptr_at(node, node->payload_));
    ++node->payload_; // only after a successful construction
  }

  static void remove_last(node_ptr_type node) {
    assert(node->is_unique());
    assert(Base::size(node) > 0);
    --node->payload_;
    if constexpr (!std::is_trivially_destructible<item_type>::value)
      std::destroy_at(Base::ptr_at(node, node->payload_));
  }

  template <typename Value> static void overwrite(node_ptr_type node, node_size_type index,
                                                  Value&& value) {
    assert(node->is_unique());
    assert(Base::is_valid_index(node, index));
    *Base::ptr_at(node, index) = std::forward<Value>(value);
  }
  //@}
};

// ----------------------------------------------------------------------------------- BranchNodeOps

template <bool IsThreadSafe = true>
struct BranchNodeOps : public BaseNodeOps<NodeData<IsThreadSafe>*, IsThreadSafe, true> {

  using Base = BaseNodeOps<NodeData<IsThreadSafe>*, IsThreadSafe, true>;

  using node_type = NodeData<IsThreadSafe>;
  using node_ptr_type = node_type*;
  using node_const_ptr_type = const node_type*;
  using item_type = node_ptr_type;
  using node_size_type = typename node_type::node_size_type;
  using ref_count_type = typename node_type::ref_count_type;

  /**
   * A branch with the single child `child`. Takes over the caller's reference.
   */
  static node_ptr_type make(node_ptr_type child) {
    auto ptr = Base::make_uninitialized(1);
    *Base::ptr_at(ptr, 0) = child;
    return ptr;
  }

  /**
   * A branch with two children. Takes over the caller's references.
   */
  static node_ptr_type make(node_ptr_type first, node_ptr_type second) {
    auto ptr = Base::make_uninitialized(2);
    *Base::ptr_at(ptr, 0) = first;
    *Base::ptr_at(ptr, 1) = second;
    return ptr;
  }

  /**
   * Duplicate a Branch node, sharing every child, except `index` which is set to `child`.
   * `index` may be one past the end, in which case the node grows by one slot.
   * The reference to `child` is taken over from the caller.
   */
  static node_ptr_type duplicate_with(node_const_ptr_type node, node_size_type index,
                                      node_ptr_type child) {
    assert(node->type() == NodeType::Branch);
    assert(index <= Base::size(node));
    assert(index < BranchFactor);
    const auto sz = static_cast<node_size_type>(Base::size(node));
    const auto new_size = std::max(sz, index + 1);
    node_ptr_type ptr = Base::make_uninitialized(new_size);

    // Copy the pointers
    item_type* dst = Base::ptr_at(ptr, 0);
    const item_type* src = Base::ptr_at(node, 0);
    std::memcpy(dst, src, sz * sizeof(item_type));

    // Must bump up all references
    for (auto i = 0u; i < sz; ++i) {
      if (i == index)
        continue;
      dst[i]->add_ref();
    }
    dst[index] = child;
    return ptr;
  }

  static node_ptr_type duplicate(node_const_ptr_type node) {
    assert(node->type() == NodeType::Branch);
    const auto sz = static_cast<node_size_type>(Base::size(node));
    node_ptr_type ptr = Base::make_uninitialized(sz);
    item_type* dst = Base::ptr_at(ptr, 0);
    std::memcpy(dst, Base::ptr_at(node, 0), sz * sizeof(item_type));
    for (auto i = 0u; i < sz; ++i)
      dst[i]->add_ref();
    return ptr;
  }

  /**
   * Duplicate a Branch node, sharing all children but the last, which is dropped
   */
  static node_ptr_type duplicate_without_last(node_const_ptr_type node) {
    assert(node->type() == NodeType::Branch);
    assert(Base::size(node) > 1); // otherwise the branch node would become empty
    const auto sz = static_cast<node_size_type>(Base::size(node) - 1);
    node_ptr_type ptr = Base::make_uninitialized(sz);
    item_type* dst = Base::ptr_at(ptr, 0);
    std::memcpy(dst, Base::ptr_at(node, 0), sz * sizeof(item_type));
    for (auto i = 0u; i < sz; ++i)
      dst[i]->add_ref();
    return ptr;
  }

  //@{ In place edits, only for nodes that are not shared
  static void append(node_ptr_type node, node_ptr_type child) {
    assert(node->is_unique());
    assert(!Base::is_full(node));
    *Base::ptr_at(node, node->payload_++) = child;
  }

  /**
   * Detaches the last child and hands its reference back to the caller
   */
  static node_ptr_type remove_last(node_ptr_type node) {
    assert(node->is_unique());
    assert(Base::size(node) > 1);
    return *Base::ptr_at(node, --node->payload_);
  }
  //@}
};

} // namespace pvec::detail

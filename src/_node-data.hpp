#pragma once

#include <algorithm>
#include <atomic>
#include <memory>
#include <type_traits>

#include <cstdint>
#include <cstring>
#include <cassert>
#include <cstdlib>

namespace pvec::detail {

enum class NodeType : int { Branch = 0, Leaf = 1 };

/**
 * The bytes between successive objects in an array of T
 */
constexpr std::size_t calculate_logical_size_(std::size_t align, std::size_t size) {
  if (size <= align)
    return align;
  if (align <= 1)
    return size;
  const auto remainder = size % align;
  const auto chunks = size / align;
  return (remainder == 0) ? size : align * (chunks + 1);
}

template <typename T> constexpr std::size_t calculate_logical_size() {
  return calculate_logical_size_(alignof(T), sizeof(T));
}

// ---------------------------------------------------------------------------------------- NodeData

/**
 * Header of every trie node (branch or leaf), and every tail.
 *
 * The slots follow the header in the same allocation. `payload_` is the number of
 * occupied slots; occupied slots always form the prefix [0, payload_).
 */
template <bool IsThreadSafe = true> struct NodeData {
  using ref_count_type = uint32_t;
  using node_size_type = uint32_t;
  using counter_type =
      std::conditional_t<IsThreadSafe, std::atomic<ref_count_type>, ref_count_type>;

  static constexpr ref_count_type HighBitOffset{sizeof(ref_count_type) * 8 - 1}; // 31
  static constexpr ref_count_type HighBit{static_cast<ref_count_type>(1) << HighBitOffset};
  static constexpr ref_count_type HighMask{HighBit};
  static constexpr ref_count_type RefMask{HighBit - 1};
  static constexpr ref_count_type MaxRef{HighBit - 1};

  // @{ members
  mutable counter_type ref_count_; // The high bit is fixed at contruction
  node_size_type payload_;
  // @}

  constexpr NodeData(NodeType type, node_size_type payload)
      : ref_count_{HighBit * static_cast<ref_count_type>(type) + 1}, payload_{payload} {}

  constexpr ref_count_type add_ref() const {
    ref_count_type previous_count;
    if constexpr (IsThreadSafe) {
      previous_count = ref_count_.fetch_add(1, std::memory_order_acq_rel) & RefMask;
    } else {
      previous_count = ref_count_++ & RefMask;
    }
    assert(previous_count < MaxRef);
    return previous_count + 1;
  }

  constexpr ref_count_type dec_ref() const {
    ref_count_type previous_count;
    if constexpr (IsThreadSafe) {
      previous_count = ref_count_.fetch_sub(1, std::memory_order_acq_rel) & RefMask;
    } else {
      previous_count = ref_count_-- & RefMask;
    }
    assert(previous_count > 0);
    return previous_count - 1;
  }

  constexpr ref_count_type ref_count() const { return raw_count_() & RefMask; }

  // True when nothing else references this node, so it may be edited in place
  constexpr bool is_unique() const { return ref_count() == 1; }

  constexpr NodeType type() const {
    const auto bit = (raw_count_() & HighMask) >> HighBitOffset;
    return static_cast<NodeType>(bit);
  }

  constexpr node_size_type size() const { return payload_; }

private:
  constexpr ref_count_type raw_count_() const {
    if constexpr (IsThreadSafe) {
      return ref_count_.load(std::memory_order_acquire);
    } else {
      return ref_count_;
    }
  }
};

} // namespace pvec::detail

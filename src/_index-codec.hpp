#pragma once

#include <cstddef>
#include <cstdint>
#include <cassert>

namespace pvec::detail {

// ---------------------------------------------------------------------------------- Index Codec

constexpr uint32_t BranchBits{5};
constexpr uint32_t BranchFactor{1u << BranchBits}; // 32 slots per node
constexpr uint32_t BranchMask{BranchFactor - 1};   // 0x00011111b

constexpr std::size_t MaxTrieDepth{13}; // 5 * 13 = 65 bits covers every 64 bit position

constexpr std::size_t MaxShift{BranchBits * (MaxTrieDepth - 1)};

/**
 * @return The number of elements held in the tail of a vector of `size` elements
 */
constexpr uint32_t tail_size(std::size_t size) {
  return (size == 0) ? 0 : static_cast<uint32_t>(((size - 1) & BranchMask) + 1);
}

/**
 * Positions below the tail offset live in the trie, the rest live in the tail
 */
constexpr std::size_t tail_offset(std::size_t size) {
  return (size == 0) ? 0 : ((size - 1) >> BranchBits) << BranchBits;
}

constexpr bool is_in_tail(std::size_t position, std::size_t size) {
  return position >= tail_offset(size);
}

/**
 * The child slot to follow at trie `level` (a multiple of 5) for `position`
 */
constexpr uint32_t selector(std::size_t position, uint32_t level) {
  assert(level % BranchBits == 0);
  assert(level <= MaxShift);
  return static_cast<uint32_t>((position >> level) & BranchMask);
}

/**
 * Number of elements a completely full trie holds when its root sits at `shift`
 */
constexpr std::size_t capacity(uint32_t shift) {
  return static_cast<std::size_t>(1) << (shift + BranchBits);
}

/**
 * True if pushing the (full) tail of a `size` element vector into a trie rooted at
 * `shift` overflows the root, meaning the trie has to grow one level
 */
constexpr bool trie_is_full(std::size_t size, uint32_t shift) {
  return ((size >> BranchBits) << BranchBits) > capacity(shift);
}

/**
 * The highest level at which `position` and `position - 1` select different children.
 * Everything above that level is shared by the two paths.
 */
constexpr uint32_t divergence_level(std::size_t position, uint32_t shift) {
  assert(position > 0);
  const auto diverges = position ^ (position - 1);
  uint32_t level = shift;
  while (level > 0 && (diverges >> level) == 0)
    level -= BranchBits;
  return level;
}

} // namespace pvec::detail

#include "test-utils.hpp"

namespace pvec::test {

CATCH_TEST_CASE("max_trie_depth", "[max_trie_depth]") {
  const auto position_bits = sizeof(std::size_t) * 8;                          // 64 bits
  CATCH_REQUIRE(detail::BranchBits * (detail::MaxTrieDepth - 0) >= position_bits); // 5 * 13 = 65
  CATCH_REQUIRE(detail::BranchBits * (detail::MaxTrieDepth - 1) < position_bits);  // 5 * 12 = 60
  CATCH_REQUIRE(detail::BranchFactor == 32);
  CATCH_REQUIRE(detail::BranchMask == 0x1fu);
  CATCH_REQUIRE(detail::MaxShift == 60);
}

CATCH_TEST_CASE("tail_size", "[tail_size]") {
  CATCH_REQUIRE(detail::tail_size(0) == 0);
  CATCH_REQUIRE(detail::tail_size(1) == 1);
  CATCH_REQUIRE(detail::tail_size(31) == 31);
  CATCH_REQUIRE(detail::tail_size(32) == 32);
  CATCH_REQUIRE(detail::tail_size(33) == 1);
  CATCH_REQUIRE(detail::tail_size(64) == 32);
  CATCH_REQUIRE(detail::tail_size(65) == 1);
  CATCH_REQUIRE(detail::tail_size(1057) == 1);
  for (std::size_t size = 1; size < 5000; ++size)
    CATCH_REQUIRE(detail::tail_size(size) == ((size - 1) % 32) + 1);
}

CATCH_TEST_CASE("tail_offset", "[tail_offset]") {
  CATCH_REQUIRE(detail::tail_offset(0) == 0);
  CATCH_REQUIRE(detail::tail_offset(1) == 0);
  CATCH_REQUIRE(detail::tail_offset(32) == 0);
  CATCH_REQUIRE(detail::tail_offset(33) == 32);
  CATCH_REQUIRE(detail::tail_offset(64) == 32);
  CATCH_REQUIRE(detail::tail_offset(65) == 64);
  for (std::size_t size = 1; size < 5000; ++size) {
    CATCH_REQUIRE(detail::tail_offset(size) == 32 * ((size - 1) / 32));
    CATCH_REQUIRE(detail::tail_offset(size) + detail::tail_size(size) == size);
    CATCH_REQUIRE(detail::is_in_tail(size - 1, size));
    CATCH_REQUIRE(detail::is_in_tail(detail::tail_offset(size), size));
    if (detail::tail_offset(size) > 0)
      CATCH_REQUIRE(!detail::is_in_tail(detail::tail_offset(size) - 1, size));
  }
}

CATCH_TEST_CASE("selector", "[selector]") {
  // position = 0b 00010 00011 00100
  const std::size_t position = (2u << 10) | (3u << 5) | 4u;
  CATCH_REQUIRE(detail::selector(position, 0) == 4);
  CATCH_REQUIRE(detail::selector(position, 5) == 3);
  CATCH_REQUIRE(detail::selector(position, 10) == 2);
  CATCH_REQUIRE(detail::selector(position, 15) == 0);

  // Highest chunk of a 64 bit position only has 4 bits
  const std::size_t last = std::numeric_limits<std::size_t>::max();
  CATCH_REQUIRE(detail::selector(last, 55) == 31);
  CATCH_REQUIRE(detail::selector(last, 60) == 15);

  // Reassembling the selectors gives back the position
  for (std::size_t position = 0; position < 40000; position += 7) {
    std::size_t reassembled = 0;
    for (uint32_t level = 0; level <= 15; level += detail::BranchBits)
      reassembled |= static_cast<std::size_t>(detail::selector(position, level)) << level;
    CATCH_REQUIRE(reassembled == position);
  }
}

CATCH_TEST_CASE("capacity", "[capacity]") {
  CATCH_REQUIRE(detail::capacity(0) == 32);
  CATCH_REQUIRE(detail::capacity(5) == 1024);
  CATCH_REQUIRE(detail::capacity(10) == 32768);
}

CATCH_TEST_CASE("trie_is_full", "[trie_is_full]") {
  // A single leaf root (shift 0) takes one leaf
  CATCH_REQUIRE(!detail::trie_is_full(32, 0));
  CATCH_REQUIRE(detail::trie_is_full(64, 0));

  // shift 5 holds 32 leaves: 1024 elements, plus the full tail
  CATCH_REQUIRE(!detail::trie_is_full(96, 5));
  CATCH_REQUIRE(!detail::trie_is_full(1024, 5));
  CATCH_REQUIRE(!detail::trie_is_full(1024 + 0, 5));
  CATCH_REQUIRE(detail::trie_is_full(1024 + 32, 5));

  // shift 10 holds 32768 elements
  CATCH_REQUIRE(!detail::trie_is_full(32768, 10));
  CATCH_REQUIRE(detail::trie_is_full(32768 + 32, 10));
}

CATCH_TEST_CASE("divergence_level", "[divergence_level]") {
  // Neighbouring positions within a leaf only diverge at the leaf level
  CATCH_REQUIRE(detail::divergence_level(1, 10) == 0);
  CATCH_REQUIRE(detail::divergence_level(31, 10) == 0);

  // Crossing into the next leaf, under the same level-5 branch
  CATCH_REQUIRE(detail::divergence_level(32, 10) == 5);
  CATCH_REQUIRE(detail::divergence_level(64, 10) == 5);

  // Crossing into the next level-5 branch
  CATCH_REQUIRE(detail::divergence_level(1024, 10) == 10);
  CATCH_REQUIRE(detail::divergence_level(2048, 10) == 10);
  CATCH_REQUIRE(detail::divergence_level(32768, 15) == 15);

  // Never above the root
  CATCH_REQUIRE(detail::divergence_level(32768, 10) == 10);

  for (std::size_t position = 32; position < 100000; position += 32) {
    const auto level = detail::divergence_level(position, 15);
    CATCH_REQUIRE(detail::selector(position, level) != detail::selector(position - 1, level));
    for (auto above = level + detail::BranchBits; above <= 15; above += detail::BranchBits)
      CATCH_REQUIRE(detail::selector(position, above) == detail::selector(position - 1, above));
  }
}

} // namespace pvec::test

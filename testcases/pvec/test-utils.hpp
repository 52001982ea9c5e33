#pragma once

#include <catch2/catch.hpp>

#include "pvec/persistent-vector.hpp"

#include <fmt/format.h>

#include <new>
#include <ostream>
#include <string>
#include <vector>

namespace pvec::test {

class TracedItem {
private:
  uint32_t& counter_;
  std::size_t value_{0};

public:
  explicit TracedItem(uint32_t& counter) : TracedItem(counter, 0) {}
  TracedItem(uint32_t& counter, std::size_t value) : counter_{counter}, value_{value} {
    counter_++;
  }
  TracedItem(const TracedItem& o) : counter_{o.counter_}, value_{o.value_} { counter_++; }
  TracedItem(TracedItem&&) = delete;
  ~TracedItem() { counter_--; };
  TracedItem& operator=(const TracedItem&) = delete;
  TracedItem& operator=(TracedItem&&) = delete;
  std::size_t value() const { return value_; }
  bool operator==(const TracedItem& o) const { return o.value() == value(); }
};

class MoveTracedItem {
private:
  uint32_t* counter_;
  std::size_t value_{0};

public:
  MoveTracedItem(uint32_t& counter, std::size_t value) : counter_{&counter}, value_{value} {
    (*counter_)++;
  }
  MoveTracedItem(const MoveTracedItem& o) : counter_{o.counter_}, value_{o.value_} {
    (*counter_)++;
  }
  MoveTracedItem(MoveTracedItem&& o) noexcept : counter_{o.counter_}, value_{o.value_} {
    (*counter_)++;
  }
  ~MoveTracedItem() { (*counter_)--; };
  MoveTracedItem& operator=(const MoveTracedItem& o) {
    value_ = o.value_;
    return *this;
  }
  MoveTracedItem& operator=(MoveTracedItem&& o) noexcept {
    value_ = o.value_;
    return *this;
  }
  std::size_t value() const { return value_; }
  bool operator==(const MoveTracedItem& o) const { return o.value() == value(); }
};

/**
 * Throws on copy once `copies_left` copies have been made
 */
class ThrowingItem {
private:
  int* copies_left_;
  int value_{0};

public:
  ThrowingItem(int& copies_left, int value) : copies_left_{&copies_left}, value_{value} {}
  ThrowingItem(const ThrowingItem& o) : copies_left_{o.copies_left_}, value_{o.value_} {
    if ((*copies_left_)-- <= 0)
      throw std::runtime_error{"copy failed"};
  }
  ThrowingItem& operator=(const ThrowingItem&) = delete;
  int value() const { return value_; }
};

using IntVector = persistent_vector<int>;
using VanillaIntVector = persistent_vector<int, false>;
using TracedVector = persistent_vector<TracedItem>;
using MoveTracedVector = persistent_vector<MoveTracedItem, false>;

// Access to the {size, shift, root, tail} of a vector; defined in test-utils.cpp
const detail::base_vector<int, true>& get_base(const IntVector& vec);
const detail::base_vector<int, false>& get_base(const VanillaIntVector& vec);
const detail::base_vector<TracedItem, true>& get_base(const TracedVector& vec);
const detail::base_vector<MoveTracedItem, false>& get_base(const MoveTracedVector& vec);

/**
 * While alive, node allocations fail with std::bad_alloc once `count` of them
 * have succeeded. Defined in test-utils.cpp, which replaces `aligned_alloc`.
 */
class FailingAllocation {
public:
  explicit FailingAllocation(int count);
  ~FailingAllocation();
  FailingAllocation(const FailingAllocation&) = delete;
  FailingAllocation& operator=(const FailingAllocation&) = delete;
};

/**
 * Runs `f` with the first node allocation failing, then the second, and so on,
 * until `f` completes. `on_failure` runs after every std::bad_alloc.
 * @return The number of failed attempts
 */
template <typename Function, typename OnFailure>
int fail_each_allocation(Function f, OnFailure on_failure) {
  for (int count = 0;; ++count) {
    bool failed = false;
    {
      FailingAllocation guard{count};
      try {
        f();
      } catch (const std::bad_alloc&) {
        failed = true;
      }
    }
    if (!failed)
      return count;
    on_failure();
  }
}

/**
 * Apply `f` to `node` and every node beneath it, with the level of each node
 */
template <typename NodeOps, typename Function>
void for_each_node(typename NodeOps::node_type* node, uint32_t level, Function f) {
  if (node == nullptr)
    return; // empty
  f(node, level);
  if (NodeOps::type(node) == detail::NodeType::Branch) {
    auto* start = NodeOps::Branch::ptr_at(node, 0);
    for (auto* iterator = start; iterator != start + NodeOps::Branch::size(node); ++iterator) {
      for_each_node<NodeOps>(*iterator, level - detail::BranchBits, f);
    }
  }
}

/**
 * Writes the trie, and tail, of `vec` as a graphviz digraph
 */
template <typename BaseVector> void dot_graph(std::ostream& out, const BaseVector& vec) {
  using NodeOps = typename BaseVector::Ops;
  using NodeType = detail::NodeType;
  auto node_name = [](typename NodeOps::node_type* node) -> std::string {
    return fmt::format("{:c}0x{:08x}sz_{}", (NodeOps::type(node) == NodeType::Branch ? 'B' : 'L'),
                       reinterpret_cast<uintptr_t>(node), NodeOps::size(node));
  };

  out << "digraph {\n";
  for_each_node<NodeOps>(vec.root(), vec.shift(), [&](auto* node, uint32_t) {
    if (NodeOps::type(node) == NodeType::Branch) {
      for (auto i = 0u; i < NodeOps::Branch::size(node); ++i) {
        auto* other = *NodeOps::Branch::ptr_at(node, i);
        out << fmt::format("   {} -> {}[label=\"{}\"]\n", node_name(node), node_name(other), i);
      }
    }
  });
  if (vec.root() != nullptr && NodeOps::type(vec.root()) == NodeType::Leaf)
    out << fmt::format("   {}\n", node_name(vec.root()));
  if (vec.tail() != nullptr)
    out << fmt::format("   tail -> {}\n", node_name(vec.tail()));
  out << "}\n";
}

/**
 * Checks the shape of the trie and tail against the size of the vector
 */
template <typename BaseVector> void check_vector_invariants(const BaseVector& vec) {
  using NodeOps = typename BaseVector::Ops;
  using NodeType = detail::NodeType;
  const auto size = vec.size();

  CATCH_REQUIRE(vec.shift() % detail::BranchBits == 0);

  if (size == 0) {
    CATCH_REQUIRE(vec.root() == nullptr);
    CATCH_REQUIRE(vec.tail() == nullptr);
    CATCH_REQUIRE(vec.shift() == 0);
    return;
  }

  // 1. The tail holds the last ((size-1) mod 32)+1 elements
  CATCH_REQUIRE(vec.tail() != nullptr);
  CATCH_REQUIRE(NodeOps::type(vec.tail()) == NodeType::Leaf);
  CATCH_REQUIRE(NodeOps::size(vec.tail()) == detail::tail_size(size));

  if (size <= detail::BranchFactor) {
    CATCH_REQUIRE(vec.root() == nullptr);
    CATCH_REQUIRE(vec.shift() == 0);
    return;
  }

  // 2. Every leaf in the trie is full, branches are at levels > 0, leaves at level 0
  std::size_t trie_count = 0;
  CATCH_REQUIRE(vec.root() != nullptr);
  for_each_node<NodeOps>(vec.root(), vec.shift(), [&](auto* node, uint32_t level) {
    CATCH_REQUIRE(NodeOps::ref_count(node) > 0);
    if (level == 0) {
      CATCH_REQUIRE(NodeOps::type(node) == NodeType::Leaf);
      CATCH_REQUIRE(NodeOps::size(node) == detail::BranchFactor);
      trie_count += NodeOps::size(node);
    } else {
      CATCH_REQUIRE(NodeOps::type(node) == NodeType::Branch);
      CATCH_REQUIRE(NodeOps::size(node) > 0);
      CATCH_REQUIRE(NodeOps::size(node) <= detail::BranchFactor);
    }
  });
  CATCH_REQUIRE(trie_count == detail::tail_offset(size));
  CATCH_REQUIRE(trie_count + NodeOps::size(vec.tail()) == size);

  // 3. The trie is no taller than it needs to be
  if (vec.shift() > 0) {
    CATCH_REQUIRE(NodeOps::size(vec.root()) > 1);
    CATCH_REQUIRE(trie_count > detail::capacity(vec.shift() - detail::BranchBits));
  }
  CATCH_REQUIRE(trie_count <= detail::capacity(vec.shift()));
}

/**
 * Checks every element through `get`, and through iteration, against `expected`
 */
template <typename Vector, typename Expected>
void check_elements(const Vector& vec, const std::vector<Expected>& expected) {
  CATCH_REQUIRE(vec.size() == expected.size());
  CATCH_REQUIRE(vec.empty() == expected.empty());
  for (auto i = 0u; i < expected.size(); ++i)
    CATCH_REQUIRE(vec.get(i) == expected[i]);

  std::size_t counter = 0;
  for (auto ii = vec.begin(); ii != vec.end(); ++ii) {
    CATCH_REQUIRE(ii.index() == counter);
    CATCH_REQUIRE(*ii == expected[counter]);
    ++counter;
  }
  CATCH_REQUIRE(counter == expected.size());
}

inline std::vector<int> make_sequence(int first, int last) {
  std::vector<int> values;
  for (auto i = first; i <= last; ++i)
    values.push_back(i);
  return values;
}

} // namespace pvec::test

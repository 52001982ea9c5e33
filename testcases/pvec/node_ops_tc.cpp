#include "test-utils.hpp"

#include <array>
#include <bit>

namespace pvec::test {

CATCH_TEST_CASE("node_data_size_alignment", "[node_data_size_alignment]") {
  using NodeDataTheadSafe = detail::NodeData<true>;
  using NodeDataVanilla = detail::NodeData<false>;
  CATCH_REQUIRE(alignof(NodeDataTheadSafe) == alignof(NodeDataVanilla));
  CATCH_REQUIRE(sizeof(NodeDataTheadSafe) == sizeof(NodeDataVanilla));
  CATCH_REQUIRE(sizeof(NodeDataTheadSafe) == 8);
  CATCH_REQUIRE(alignof(NodeDataTheadSafe) == 4);
}

CATCH_TEST_CASE("node_data_add_dec_ref", "[node_data_add_dec_ref]") {
  auto test_node = [](auto& node) {
    CATCH_REQUIRE(node.ref_count() == 1);
    CATCH_REQUIRE(node.is_unique());
    CATCH_REQUIRE(node.add_ref() == 2);
    CATCH_REQUIRE(!node.is_unique());
    CATCH_REQUIRE(node.dec_ref() == 1);
    CATCH_REQUIRE(node.is_unique());
    CATCH_REQUIRE(node.dec_ref() == 0);
  };
  auto n1 = detail::NodeData<true>{detail::NodeType::Leaf, 0};
  auto n2 = detail::NodeData<false>{detail::NodeType::Leaf, 0};
  test_node(n1);
  test_node(n2);
}

CATCH_TEST_CASE("node_type", "[node_type]") {
  {
    detail::NodeData node{detail::NodeType::Branch, 0};
    CATCH_REQUIRE(node.type() == detail::NodeType::Branch);
    node.add_ref(); // Reference counting leaves the type alone
    CATCH_REQUIRE(node.type() == detail::NodeType::Branch);
    CATCH_REQUIRE(node.ref_count() == 2);
  }
  {
    detail::NodeData node{detail::NodeType::Leaf, 7};
    CATCH_REQUIRE(node.type() == detail::NodeType::Leaf);
    CATCH_REQUIRE(node.size() == 7);
    node.add_ref();
    node.dec_ref();
    CATCH_REQUIRE(node.type() == detail::NodeType::Leaf);
  }
}

template <typename T> void test_node_size() {
  using NodeType = detail::NodeType;
  {
    auto node = T::Branch::make_uninitialized(0);
    CATCH_REQUIRE(T::size(node) == 0);
    CATCH_REQUIRE(T::type(node) == NodeType::Branch);
    CATCH_REQUIRE(T::Branch::offset() >= sizeof(typename T::node_type));
    auto address_0 = std::bit_cast<uintptr_t>(T::Branch::ptr_at(node, 0));
    auto address_31 = std::bit_cast<uintptr_t>(T::Branch::ptr_at(node, 31));
    CATCH_REQUIRE(address_0 >= std::bit_cast<uintptr_t>(node) + sizeof(typename T::node_type));
    CATCH_REQUIRE(address_0 % T::Branch::AlignOf == 0);
    CATCH_REQUIRE(address_31 + sizeof(void*) <=
                  std::bit_cast<uintptr_t>(node) + T::Branch::storage_size());
    CATCH_REQUIRE(T::Branch::AlignOf == alignof(void*));
    CATCH_REQUIRE(T::ref_count(node) == 1);
    T::Branch::free_storage(node);
  }

  {
    using item_type = typename T::Leaf::item_type;
    auto node = T::Leaf::make_uninitialized(0);
    CATCH_REQUIRE(T::size(node) == 0);
    CATCH_REQUIRE(T::type(node) == NodeType::Leaf);
    CATCH_REQUIRE(T::Leaf::offset() >= sizeof(typename T::node_type));
    auto address_0 = std::bit_cast<uintptr_t>(T::Leaf::ptr_at(node, 0));
    auto address_31 = std::bit_cast<uintptr_t>(T::Leaf::ptr_at(node, 31));
    CATCH_REQUIRE(address_0 >= std::bit_cast<uintptr_t>(node) + sizeof(typename T::node_type));
    CATCH_REQUIRE(address_0 % alignof(item_type) == 0);
    CATCH_REQUIRE(address_31 % alignof(item_type) == 0);
    CATCH_REQUIRE(address_31 + sizeof(item_type) <=
                  std::bit_cast<uintptr_t>(node) + T::Leaf::storage_size());
    CATCH_REQUIRE(T::Leaf::storage_size() % T::Leaf::AlignOf == 0);
    CATCH_REQUIRE(T::ref_count(node) == 1);
    T::Leaf::free_storage(node);
  }
}

template <typename T> void test_node_configuration() {
  test_node_size<detail::NodeOps<T, true>>();
  test_node_size<detail::NodeOps<T, false>>();
}

CATCH_TEST_CASE("node_configuration", "[node_configuration]") {
  test_node_configuration<char>();
  test_node_configuration<int16_t>();
  test_node_configuration<int32_t>();
  test_node_configuration<int64_t>();
  test_node_configuration<void*>();
  test_node_configuration<std::array<char, 22>>();

  struct alignas(1) Weird0 {
    char value[5];
  };

  struct alignas(2) Weird1 {
    char value[17];
  };

  struct alignas(16) Weird2 {
    int64_t a;
    char b;
  };

  test_node_configuration<Weird0>();
  test_node_configuration<Weird1>();
  test_node_configuration<Weird2>();
}

CATCH_TEST_CASE("node_ops_construct_destruct", "[node_ops_construct_destruct]") {
  uint32_t counter{0}; // Tracks how many times the constructor/destructor is called
  using Ops = detail::NodeOps<TracedItem>;

  { // Constructor should be called 4 times, and same with destructor
    auto* node_ptr = Ops::Leaf::make_uninitialized(4);
    CATCH_REQUIRE(Ops::size(node_ptr) == 4);
    for (auto i = 0u; i < Ops::size(node_ptr); ++i) {
      new (Ops::Leaf::ptr_at(node_ptr, i)) TracedItem{counter};
    }
    CATCH_REQUIRE(counter == Ops::size(node_ptr));
    Ops::dec_ref(node_ptr); // Calls destructor
    CATCH_REQUIRE(counter == 0);
  }
}

CATCH_TEST_CASE("node_ops_safe_destroy", "[node_ops_safe_destroy]") {
  using Ops = detail::NodeOps<TracedItem>;
  Ops::destroy(nullptr); // should not crash
  Ops::dec_ref(nullptr);
  CATCH_REQUIRE(Ops::add_ref(nullptr) == nullptr);
  CATCH_REQUIRE(Ops::ref_count(nullptr) == 0);
  CATCH_REQUIRE(Ops::size(nullptr) == 0);
}

CATCH_TEST_CASE("duplicate_leaf", "[duplicate_leaf]") {
  uint32_t counter = 0;

  using Ops = detail::NodeOps<TracedItem>;
  using Leaf = Ops::Leaf;

  auto* leaf_0 = Leaf::make(TracedItem{counter, 0});
  auto* leaf_1 = Leaf::copy_append(leaf_0, TracedItem{counter, 1});
  auto* leaf_2 = Leaf::duplicate(leaf_1);
  auto* leaf_3 = Leaf::duplicate_with_overwrite(leaf_2, 0, TracedItem{counter, 7});
  auto* leaf_4 = Leaf::duplicate_without_last(leaf_3);

  CATCH_REQUIRE(Leaf::size(leaf_0) == 1);
  CATCH_REQUIRE(Leaf::size(leaf_1) == 2);
  CATCH_REQUIRE(Leaf::size(leaf_2) == 2);
  CATCH_REQUIRE(Leaf::size(leaf_3) == 2);
  CATCH_REQUIRE(Leaf::size(leaf_4) == 1);
  CATCH_REQUIRE(counter == 8);

  for (auto index = 0u; index < 2; ++index) {
    CATCH_REQUIRE(Leaf::ptr_at(leaf_1, index)->value() == index);
    CATCH_REQUIRE(Leaf::ptr_at(leaf_2, index)->value() == index);
  }
  CATCH_REQUIRE(Leaf::ptr_at(leaf_3, 0)->value() == 7);
  CATCH_REQUIRE(Leaf::ptr_at(leaf_3, 1)->value() == 1);
  CATCH_REQUIRE(Leaf::ptr_at(leaf_4, 0)->value() == 7);

  // The sources are untouched
  CATCH_REQUIRE(Leaf::ptr_at(leaf_2, 0)->value() == 0);
  CATCH_REQUIRE(Leaf::size(leaf_0) == 1);

  Ops::dec_ref(leaf_0);
  Ops::dec_ref(leaf_1);
  Ops::dec_ref(leaf_2);
  Ops::dec_ref(leaf_3);
  Ops::dec_ref(leaf_4);

  CATCH_REQUIRE(counter == 0);
}

CATCH_TEST_CASE("leaf_in_place_edits", "[leaf_in_place_edits]") {
  uint32_t counter = 0;

  using Ops = detail::NodeOps<MoveTracedItem, false>;
  using Leaf = Ops::Leaf;

  auto* leaf = Leaf::make(MoveTracedItem{counter, 0});
  for (auto i = 1u; i < detail::BranchFactor; ++i)
    Leaf::append(leaf, MoveTracedItem{counter, i});
  CATCH_REQUIRE(Leaf::is_full(leaf));
  CATCH_REQUIRE(counter == detail::BranchFactor);

  Leaf::overwrite(leaf, 3, MoveTracedItem{counter, 42});
  CATCH_REQUIRE(Leaf::ptr_at(leaf, 3)->value() == 42);
  CATCH_REQUIRE(counter == detail::BranchFactor);

  Leaf::remove_last(leaf);
  Leaf::remove_last(leaf);
  CATCH_REQUIRE(Leaf::size(leaf) == detail::BranchFactor - 2);
  CATCH_REQUIRE(counter == detail::BranchFactor - 2);

  Ops::dec_ref(leaf);
  CATCH_REQUIRE(counter == 0);
}

CATCH_TEST_CASE("leaf_copy_rollback", "[leaf_copy_rollback]") {
  using Ops = detail::NodeOps<ThrowingItem, false>;
  using Leaf = Ops::Leaf;

  int copies_left = 100;
  auto* leaf = Leaf::make(ThrowingItem{copies_left, 0});
  for (auto i = 1; i < 10; ++i)
    leaf = [&]() {
      auto* next = Leaf::copy_append(leaf, ThrowingItem{copies_left, i});
      Ops::dec_ref(leaf);
      return next;
    }();
  CATCH_REQUIRE(Leaf::size(leaf) == 10);

  copies_left = 4; // the fifth copy throws
  CATCH_REQUIRE_THROWS_AS(Leaf::duplicate(leaf), std::runtime_error);
  CATCH_REQUIRE_THROWS_AS(Leaf::copy_append(leaf, ThrowingItem{copies_left, 10}),
                          std::runtime_error);
  CATCH_REQUIRE(Leaf::size(leaf) == 10);
  CATCH_REQUIRE(Ops::ref_count(leaf) == 1);
  for (auto i = 0u; i < 10; ++i)
    CATCH_REQUIRE(Leaf::ptr_at(leaf, i)->value() == static_cast<int>(i));

  Ops::dec_ref(leaf);
}

CATCH_TEST_CASE("branch_ops", "[branch_ops]") {
  uint32_t counter = 0;

  using Ops = detail::NodeOps<TracedItem>;
  using Leaf = Ops::Leaf;
  using Branch = Ops::Branch;

  auto* a = Leaf::make(TracedItem{counter, 1});
  auto* b = Leaf::make(TracedItem{counter, 2});
  auto* c = Leaf::make(TracedItem{counter, 3});

  auto* branch = Branch::make(a, b); // takes over both references
  CATCH_REQUIRE(Branch::size(branch) == 2);
  CATCH_REQUIRE(Ops::type(branch) == detail::NodeType::Branch);
  CATCH_REQUIRE(Ops::child_at(branch, 0) == a);
  CATCH_REQUIRE(Ops::child_at(branch, 1) == b);
  CATCH_REQUIRE(Ops::ref_count(a) == 1);

  // Append through a copy: `a` and `b` are now shared
  auto* grown = Branch::duplicate_with(branch, 2, c);
  CATCH_REQUIRE(Branch::size(grown) == 3);
  CATCH_REQUIRE(Ops::child_at(grown, 2) == c);
  CATCH_REQUIRE(Ops::ref_count(a) == 2);
  CATCH_REQUIRE(Ops::ref_count(b) == 2);
  CATCH_REQUIRE(Ops::ref_count(c) == 1);

  // Replace through a copy
  auto* replaced = Branch::duplicate_with(grown, 0, Ops::add_ref(c));
  CATCH_REQUIRE(Ops::child_at(replaced, 0) == c);
  CATCH_REQUIRE(Ops::ref_count(a) == 2);
  CATCH_REQUIRE(Ops::ref_count(b) == 3);
  CATCH_REQUIRE(Ops::ref_count(c) == 3);

  auto* trimmed = Branch::duplicate_without_last(replaced);
  CATCH_REQUIRE(Branch::size(trimmed) == 2);
  CATCH_REQUIRE(Ops::ref_count(c) == 4); // slot 0 of `trimmed`

  Ops::dec_ref(replaced);
  Ops::dec_ref(grown);
  CATCH_REQUIRE(Ops::ref_count(a) == 1);
  CATCH_REQUIRE(Ops::ref_count(c) == 1);

  // In place edits on the now unique `branch`
  auto* removed = Branch::remove_last(branch);
  CATCH_REQUIRE(removed == b);
  CATCH_REQUIRE(Branch::size(branch) == 1);
  Branch::append(branch, removed);
  CATCH_REQUIRE(Branch::size(branch) == 2);

  Ops::dec_ref(branch);
  Ops::dec_ref(trimmed);
  CATCH_REQUIRE(counter == 0);
}

CATCH_TEST_CASE("new_path", "[new_path]") {
  uint32_t counter = 0;
  using Ops = detail::NodeOps<TracedItem>;

  auto* leaf = Ops::Leaf::make(TracedItem{counter, 5});
  CATCH_REQUIRE(Ops::new_path(0, Ops::add_ref(leaf)) == leaf);
  Ops::dec_ref(leaf);

  auto* path = Ops::new_path(10, leaf);
  CATCH_REQUIRE(Ops::type(path) == detail::NodeType::Branch);
  CATCH_REQUIRE(Ops::size(path) == 1);
  CATCH_REQUIRE(Ops::size(Ops::child_at(path, 0)) == 1);
  CATCH_REQUIRE(Ops::leftmost_leaf(path, 10) == leaf);
  CATCH_REQUIRE(Ops::find_leaf(path, 10, 17) == leaf);

  Ops::dec_ref(path);
  CATCH_REQUIRE(counter == 0);
}

CATCH_TEST_CASE("make_path", "[make_path]") {
  using Ops = detail::NodeOps<int, true>;
  const auto values = make_sequence(0, 2000);
  const IntVector vec{std::begin(values), std::end(values)};
  const auto& base = get_base(vec);
  CATCH_REQUIRE(base.shift() == 10);

  for (std::size_t position = 0; position < detail::tail_offset(base.size()); position += 13) {
    const auto path = Ops::make_path(base.root(), base.shift(), position);
    CATCH_REQUIRE(path.size == 2);
    CATCH_REQUIRE(path.nodes[0] == base.root());
    CATCH_REQUIRE(path.leaf_end == Ops::find_leaf(base.root(), base.shift(), position));
    CATCH_REQUIRE(*Ops::Leaf::ptr_at(path.leaf_end, detail::selector(position, 0)) ==
                  static_cast<int>(position));
  }

  // The leaf after the last one in the trie does not exist yet
  const auto path = Ops::make_path(base.root(), base.shift(), detail::tail_offset(base.size()));
  CATCH_REQUIRE(path.leaf_end == nullptr);
  CATCH_REQUIRE(path.size == 2);
}

CATCH_TEST_CASE("path_copy", "[path_copy]") {
  using Ops = detail::NodeOps<int, false>;
  const auto values = make_sequence(0, 1100);
  const VanillaIntVector vec{std::begin(values), std::end(values)};
  const auto& base = get_base(vec);
  CATCH_REQUIRE(base.shift() == 10);

  const std::size_t position = 37;
  auto* new_root = Ops::assoc(base.root(), base.shift(), position, -1);
  CATCH_REQUIRE(new_root != base.root());
  CATCH_REQUIRE(*Ops::Leaf::ptr_at(Ops::find_leaf(new_root, base.shift(), position), 5) == -1);
  CATCH_REQUIRE(*Ops::Leaf::ptr_at(Ops::find_leaf(base.root(), base.shift(), position), 5) == 37);

  // Only the nodes on the path to `position` are copied
  CATCH_REQUIRE(Ops::child_at(new_root, 1) == Ops::child_at(base.root(), 1));
  auto* old_level5 = Ops::child_at(base.root(), 0);
  auto* new_level5 = Ops::child_at(new_root, 0);
  CATCH_REQUIRE(old_level5 != new_level5);
  CATCH_REQUIRE(Ops::child_at(new_level5, 0) == Ops::child_at(old_level5, 0));
  CATCH_REQUIRE(Ops::child_at(new_level5, 1) != Ops::child_at(old_level5, 1));
  CATCH_REQUIRE(Ops::ref_count(Ops::child_at(old_level5, 0)) == 2);

  Ops::dec_ref(new_root);
  CATCH_REQUIRE(Ops::ref_count(Ops::child_at(old_level5, 0)) == 1);
}

} // namespace pvec::test

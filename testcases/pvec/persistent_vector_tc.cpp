#include "test-utils.hpp"

#include <sstream>

namespace pvec::test {

template <typename Vector> void check_vector(const Vector& vec, const std::vector<int>& expected) {
  check_vector_invariants(get_base(vec));
  check_elements(vec, expected);
}

CATCH_TEST_CASE("vector_default_construct", "[vector_default_construct]") {
  IntVector vec;
  CATCH_REQUIRE(vec.size() == 0);
  CATCH_REQUIRE(vec.empty());
  CATCH_REQUIRE(vec.begin() == vec.end());
  CATCH_REQUIRE(vec.size() < vec.max_size());
  check_vector_invariants(get_base(vec));

  auto traced = std::make_unique<TracedVector>();
  CATCH_REQUIRE(traced->size() == 0);
  CATCH_REQUIRE(traced->begin() == traced->end());
}

CATCH_TEST_CASE("vector_push_back_get", "[vector_push_back_get]") {
  IntVector vec;
  std::vector<int> expected;
  for (auto i = 0; i < 1100; ++i) {
    vec = vec.push_back(i * 3);
    expected.push_back(i * 3);
    CATCH_REQUIRE(vec.size() == expected.size());
    CATCH_REQUIRE(vec.back() == i * 3);
    CATCH_REQUIRE(vec.front() == 0);
    check_vector_invariants(get_base(vec));
  }
  check_elements(vec, expected);
  for (auto i = 0u; i < expected.size(); ++i) {
    CATCH_REQUIRE(vec.at(i) == expected[i]);
    CATCH_REQUIRE(vec[i] == expected[i]);
  }
}

CATCH_TEST_CASE("vector_persistence", "[vector_persistence]") {
  // Every version survives, whatever happens to later versions
  std::vector<IntVector> versions;
  versions.emplace_back();
  for (auto i = 0; i < 1200; ++i)
    versions.push_back(versions.back().push_back(i));

  for (auto i = 0u; i < versions.size(); ++i) {
    CATCH_REQUIRE(versions[i].size() == i);
    if (i % 61 == 0 || i == 32 || i == 33 || i == 1056 || i == 1057)
      check_vector(versions[i], make_sequence(0, static_cast<int>(i) - 1));
  }

  auto edited = versions[1000].set(500, -1).set(999, -2).pop_back();
  CATCH_REQUIRE(edited.size() == 999);
  CATCH_REQUIRE(edited.get(500) == -1);
  CATCH_REQUIRE(versions[1000].get(500) == 500);
  CATCH_REQUIRE(versions[1000].get(999) == 999);
  check_vector(versions[1000], make_sequence(0, 999));
  check_vector(versions[1200], make_sequence(0, 1199));
}

CATCH_TEST_CASE("vector_boundaries", "[vector_boundaries]") {
  struct Shape {
    std::size_t size;
    uint32_t shift;
    bool has_root;
  };
  // Sizes at which the tail or the trie change shape
  const std::vector<Shape> shapes{{{0, 0, false},
                                   {1, 0, false},
                                   {32, 0, false},
                                   {33, 0, true},
                                   {64, 0, true},
                                   {65, 5, true},
                                   {96, 5, true},
                                   {97, 5, true},
                                   {1024, 5, true},
                                   {1056, 5, true},
                                   {1057, 10, true},
                                   {1088, 10, true},
                                   {1089, 10, true}}};

  for (const auto& shape : shapes) {
    const auto values = make_sequence(0, static_cast<int>(shape.size) - 1);
    IntVector vec;
    for (auto value : values)
      vec = vec.push_back(value);

    const auto& base = get_base(vec);
    CATCH_REQUIRE(base.size() == shape.size);
    CATCH_REQUIRE(base.shift() == shape.shift);
    CATCH_REQUIRE((base.root() != nullptr) == shape.has_root);
    check_vector(vec, values);

    // Popping back across the boundary gives the same shape as pushing up to it
    if (shape.size > 0) {
      auto popped = vec.push_back(-1).pop_back();
      CATCH_REQUIRE(get_base(popped).shift() == shape.shift);
      check_vector(popped, values);
      check_vector(vec.pop_back(), make_sequence(0, static_cast<int>(shape.size) - 2));
    }
  }
}

CATCH_TEST_CASE("vector_push_get_pop_to_empty", "[vector_push_get_pop_to_empty]") {
  IntVector vec;
  for (auto i = 1; i <= 1024; ++i) {
    vec = vec.push_back(i);
    CATCH_REQUIRE(vec.get(static_cast<std::size_t>(i - 1)) == i);
  }
  CATCH_REQUIRE(vec.size() == 1024);

  for (auto i = 1; i <= 1024; ++i)
    CATCH_REQUIRE(vec.get(static_cast<std::size_t>(i - 1)) == i);

  for (auto i = 1024; i >= 1; --i) {
    CATCH_REQUIRE(vec.back() == i);
    vec = vec.pop_back();
    CATCH_REQUIRE(vec.size() == static_cast<std::size_t>(i - 1));
    check_vector_invariants(get_base(vec));
  }

  CATCH_REQUIRE(vec.empty());
  CATCH_REQUIRE_THROWS_AS(vec.pop_back(), empty_vector_error);
  CATCH_REQUIRE_THROWS_AS(vec.pop_back(), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(vec.front(), empty_vector_error);
  CATCH_REQUIRE_THROWS_AS(vec.back(), empty_vector_error);
}

CATCH_TEST_CASE("vector_push_pop_inverse", "[vector_push_pop_inverse]") {
  IntVector vec;
  for (auto i = 0; i < 2200; ++i) {
    auto pushed = vec.push_back(i);
    auto popped = pushed.pop_back();
    CATCH_REQUIRE(popped == vec);
    CATCH_REQUIRE(get_base(popped).shift() == get_base(vec).shift());
    check_vector_invariants(get_base(popped));
    vec = pushed;
  }
}

CATCH_TEST_CASE("vector_set", "[vector_set]") {
  const auto values = make_sequence(0, 1500);
  const IntVector vec{std::begin(values), std::end(values)};

  auto expected = values;
  auto edited = vec;
  for (std::size_t i = 0; i < values.size(); i += 7) {
    edited = edited.set(i, -static_cast<int>(i));
    expected[i] = -static_cast<int>(i);
  }
  check_vector(edited, expected);
  check_vector(vec, values);

  // Writing into the tail only replaces the tail
  auto tail_edit = vec.set(1500, 0);
  CATCH_REQUIRE(get_base(tail_edit).root() == get_base(vec).root());
  CATCH_REQUIRE(get_base(tail_edit).tail() != get_base(vec).tail());
  CATCH_REQUIRE(tail_edit.back() == 0);
  CATCH_REQUIRE(vec.back() == 1500);
}

CATCH_TEST_CASE("vector_out_of_range", "[vector_out_of_range]") {
  const IntVector vec{{1, 2, 3}};
  CATCH_REQUIRE_THROWS_AS(vec.get(3), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(vec.at(100), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(vec[3], std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(vec.set(3, 4), std::out_of_range);
  CATCH_REQUIRE_THROWS_WITH(vec.get(3), "index 3 out of range for vector of size 3");
  CATCH_REQUIRE_THROWS_WITH(IntVector{}.pop_back(), "pop_back: vector is empty");

  // Failed operations leave the vector untouched
  check_vector(vec, {1, 2, 3});
}

CATCH_TEST_CASE("vector_structural_sharing", "[vector_structural_sharing]") {
  using Ops = detail::NodeOps<int, true>;
  const auto values = make_sequence(0, 1100);
  const IntVector vec{std::begin(values), std::end(values)};
  const auto& base = get_base(vec);

  { // Pushing into a non-full tail shares the whole trie
    auto pushed = vec.push_back(1101);
    CATCH_REQUIRE(get_base(pushed).root() == base.root());
    CATCH_REQUIRE(Ops::ref_count(base.root()) == 2);
  }
  CATCH_REQUIRE(Ops::ref_count(base.root()) == 1);

  { // Updating the trie copies one path only
    auto edited = vec.set(0, -1);
    const auto& edited_base = get_base(edited);
    CATCH_REQUIRE(edited_base.root() != base.root());
    CATCH_REQUIRE(edited_base.tail() == base.tail());
    CATCH_REQUIRE(Ops::child_at(edited_base.root(), 1) == Ops::child_at(base.root(), 1));
    CATCH_REQUIRE(Ops::ref_count(Ops::child_at(base.root(), 1)) == 2);
  }

  { // A copy shares everything
    auto copy = vec;
    CATCH_REQUIRE(get_base(copy).root() == base.root());
    CATCH_REQUIRE(get_base(copy).tail() == base.tail());
    CATCH_REQUIRE(Ops::ref_count(base.tail()) == 2);
    CATCH_REQUIRE(copy == vec);
  }
  CATCH_REQUIRE(Ops::ref_count(base.tail()) == 1);
}

CATCH_TEST_CASE("vector_item_lifetimes", "[vector_item_lifetimes]") {
  uint32_t counter = 0;
  {
    TracedVector vec;
    for (auto i = 0u; i < 1100; ++i)
      vec = vec.push_back(TracedItem{counter, i});
    CATCH_REQUIRE(counter == 1100);

    auto edited = vec.set(10, TracedItem{counter, 9999});
    CATCH_REQUIRE(edited.get(10).value() == 9999);
    CATCH_REQUIRE(vec.get(10).value() == 10);

    while (!edited.empty())
      edited = edited.pop_back();
    CATCH_REQUIRE(counter == 1100);

    auto emplaced = vec.emplace_back(counter, 1100u);
    CATCH_REQUIRE(emplaced.back().value() == 1100);
    CATCH_REQUIRE(emplaced.size() == 1101);
  }
  CATCH_REQUIRE(counter == 0);

  {
    MoveTracedVector vec;
    for (auto i = 0u; i < 100; ++i)
      vec = vec.emplace_back(counter, i);
    CATCH_REQUIRE(counter == 100);
    vec.clear();
    CATCH_REQUIRE(counter == 0);
    CATCH_REQUIRE(vec.empty());
  }
}

CATCH_TEST_CASE("vector_strong_guarantee", "[vector_strong_guarantee]") {
  using Vector = persistent_vector<ThrowingItem, false>;
  int copies_left = 1000000;
  Vector vec;
  for (auto i = 0; i < 40; ++i)
    vec = vec.push_back(ThrowingItem{copies_left, i});

  copies_left = 2;
  CATCH_REQUIRE_THROWS_AS(vec.push_back(ThrowingItem{copies_left, 40}), std::runtime_error);
  copies_left = 2;
  CATCH_REQUIRE_THROWS_AS(vec.set(35, ThrowingItem{copies_left, -1}), std::runtime_error);
  copies_left = 2;
  CATCH_REQUIRE_THROWS_AS(vec.pop_back().pop_back(), std::runtime_error);

  CATCH_REQUIRE(vec.size() == 40);
  for (auto i = 0u; i < vec.size(); ++i)
    CATCH_REQUIRE(vec.get(i).value() == static_cast<int>(i));
}

CATCH_TEST_CASE("vector_allocation_failure", "[vector_allocation_failure]") {
  uint32_t counter = 0;
  {
    TracedVector vec;
    // Nothing built before the failure survives it
    auto check_unchanged = [&]() {
      CATCH_REQUIRE(counter == vec.size());
      check_vector_invariants(get_base(vec));
      for (auto i = 0u; i < vec.size(); ++i)
        CATCH_REQUIRE(vec.get(i).value() == i);
    };

    // Into the tail, into an empty trie, growing the trie, and along a new path
    for (auto size : {0u, 31u, 32u, 64u, 96u, 1056u, 1088u}) {
      while (vec.size() < size)
        vec = vec.push_back(TracedItem{counter, vec.size()});
      TracedVector result;
      const auto failures = fail_each_allocation(
          [&]() { result = vec.push_back(TracedItem{counter, size}); }, check_unchanged);
      CATCH_REQUIRE(failures > 0);
      CATCH_REQUIRE(result.size() == size + 1);
      CATCH_REQUIRE(result.back().value() == size);
      check_vector_invariants(get_base(result));
    }

    for (auto position : {0u, 500u, 1055u, 1087u}) {
      TracedVector result;
      const auto failures = fail_each_allocation(
          [&]() { result = vec.set(position, TracedItem{counter, 9999}); }, check_unchanged);
      CATCH_REQUIRE(failures > 0);
      CATCH_REQUIRE(result.get(position).value() == 9999);
      check_vector_invariants(get_base(result));
    }

    for (auto size : {1088u, 1057u, 1056u, 1025u, 97u, 65u, 33u, 2u}) {
      while (vec.size() > size)
        vec = vec.pop_back();
      TracedVector result;
      fail_each_allocation([&]() { result = vec.pop_back(); }, check_unchanged);
      CATCH_REQUIRE(result.size() == size - 1);
      check_vector_invariants(get_base(result));
    }
  }
  CATCH_REQUIRE(counter == 0);
}

CATCH_TEST_CASE("vector_construct", "[vector_construct]") {
  const IntVector from_ilist{{4, 5, 6}};
  check_vector(from_ilist, {4, 5, 6});

  const auto values = make_sequence(0, 99);
  const IntVector from_range{std::begin(values), std::end(values)};
  check_vector(from_range, values);

  IntVector other;
  other = from_range;
  CATCH_REQUIRE(other == from_range);
  IntVector moved{std::move(other)};
  CATCH_REQUIRE(moved == from_range);
}

CATCH_TEST_CASE("vector_equality", "[vector_equality]") {
  const IntVector vec{{1, 2, 3}};
  IntVector other;
  CATCH_REQUIRE(vec == vec);
  CATCH_REQUIRE(other == other);
  CATCH_REQUIRE(vec != other);
  CATCH_REQUIRE(other != vec);

  other = other.push_back(1).push_back(2).push_back(3);
  CATCH_REQUIRE(other == vec); // equal elements, different nodes
  CATCH_REQUIRE(other.set(1, 5) != vec);
  CATCH_REQUIRE(other.pop_back() != vec);

  other.clear();
  CATCH_REQUIRE(other.empty());
  CATCH_REQUIRE(vec.size() == 3);
}

CATCH_TEST_CASE("vector_swap", "[vector_swap]") {
  IntVector vec{{1, 2, 3}};
  IntVector other;

  other.swap(other);
  CATCH_REQUIRE(other.size() == 0);
  vec.swap(vec);
  CATCH_REQUIRE(vec.size() == 3);

  vec.swap(other);
  CATCH_REQUIRE(vec.size() == 0);
  CATCH_REQUIRE(other.size() == 3);

  using std::swap;
  swap(vec, other);
  CATCH_REQUIRE(vec.size() == 3);
  CATCH_REQUIRE(other.size() == 0);
}

CATCH_TEST_CASE("vector_dot_graph", "[vector_dot_graph]") {
  const auto values = make_sequence(0, 1100);
  const VanillaIntVector vec{std::begin(values), std::end(values)};

  std::ostringstream out;
  dot_graph(out, get_base(vec));
  const auto graph = out.str();
  CATCH_REQUIRE(graph.rfind("digraph {\n", 0) == 0);
  CATCH_REQUIRE(graph.find("tail -> L0x") != std::string::npos);
  CATCH_REQUIRE(graph.find("[label=\"31\"]") != std::string::npos);

  std::ostringstream empty_out;
  dot_graph(empty_out, get_base(VanillaIntVector{}));
  CATCH_REQUIRE(empty_out.str() == "digraph {\n}\n");
}

} // namespace pvec::test

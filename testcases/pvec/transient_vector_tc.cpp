#include "test-utils.hpp"

namespace pvec::test {

CATCH_TEST_CASE("transient_push_back", "[transient_push_back]") {
  // Building transiently gives the same shape, and elements, as building persistently
  for (auto size : {0, 1, 31, 32, 33, 64, 65, 1024, 1056, 1057, 1089, 33000}) {
    const auto values = make_sequence(0, size - 1);
    IntVector persistent;
    for (auto value : values)
      persistent = persistent.push_back(value);

    auto transient = IntVector{}.transient();
    for (auto value : values)
      transient.push_back(value);
    CATCH_REQUIRE(transient.size() == values.size());
    auto built = transient.persistent();
    CATCH_REQUIRE(transient.empty());

    CATCH_REQUIRE(built == persistent);
    CATCH_REQUIRE(get_base(built).shift() == get_base(persistent).shift());
    check_vector_invariants(get_base(built));
    check_elements(built, values);
  }
}

CATCH_TEST_CASE("transient_leaves_source_untouched", "[transient_leaves_source_untouched]") {
  using Ops = detail::NodeOps<int, true>;
  const auto values = make_sequence(0, 1100);
  const IntVector source{std::begin(values), std::end(values)};
  const auto& base = get_base(source);

  auto transient = source.transient();
  CATCH_REQUIRE(Ops::ref_count(base.root()) == 2); // shared until edited
  CATCH_REQUIRE(Ops::ref_count(base.tail()) == 2);

  transient.set(0, -1).set(1099, -2).push_back(-3);
  for (auto i = 0; i < 100; ++i)
    transient.pop_back();
  for (auto i = 0; i < 40; ++i)
    transient.push_back(i);

  CATCH_REQUIRE(transient.get(0) == -1);
  CATCH_REQUIRE(transient.size() == 1101 + 1 - 100 + 40);
  CATCH_REQUIRE(transient.get(1001) == 1001);
  CATCH_REQUIRE(transient.get(1002) == 0);

  check_elements(source, values);
  check_vector_invariants(base);

  auto result = transient.persistent();
  check_vector_invariants(get_base(result));
  CATCH_REQUIRE(result.get(0) == -1);
  CATCH_REQUIRE(result.back() == 39);
  check_elements(source, values);
}

CATCH_TEST_CASE("transient_edits_in_place", "[transient_edits_in_place]") {
  const auto values = make_sequence(0, 1100);
  IntVector source{std::begin(values), std::end(values)};
  const auto root = get_base(source).root();
  const auto tail = get_base(source).tail();

  auto transient = source.transient();
  source.clear(); // `transient` is now the only owner, so edits do not copy

  transient.set(0, -1).set(1100, -2).push_back(-3);
  auto result = transient.persistent();
  CATCH_REQUIRE(get_base(result).root() == root);
  CATCH_REQUIRE(get_base(result).tail() == tail);
  CATCH_REQUIRE(result.get(0) == -1);
  CATCH_REQUIRE(result.get(1100) == -2);
  CATCH_REQUIRE(result.back() == -3);
  check_vector_invariants(get_base(result));
}

CATCH_TEST_CASE("transient_pop_back", "[transient_pop_back]") {
  const auto values = make_sequence(1, 1100);
  auto transient = IntVector{std::begin(values), std::end(values)}.transient();
  for (auto i = 1100; i >= 1; --i) {
    CATCH_REQUIRE(transient.back() == i);
    transient.pop_back();
    CATCH_REQUIRE(transient.size() == static_cast<std::size_t>(i - 1));
    if (i % 97 == 0 || i == 1058 || i == 1057 || i == 66 || i == 65 || i == 34 || i == 33) {
      auto snapshot = transient.persistent();
      check_vector_invariants(get_base(snapshot));
      check_elements(snapshot, make_sequence(1, i - 1));
      transient = snapshot.transient();
    }
  }
  CATCH_REQUIRE(transient.empty());
  CATCH_REQUIRE_THROWS_AS(transient.pop_back(), empty_vector_error);
}

CATCH_TEST_CASE("transient_set", "[transient_set]") {
  const auto values = make_sequence(0, 2000);
  const IntVector source{std::begin(values), std::end(values)};
  auto transient = source.transient();

  auto expected = values;
  for (std::size_t i = 0; i < values.size(); i += 3) {
    transient.set(i, static_cast<int>(i) * 10);
    expected[i] = static_cast<int>(i) * 10;
  }
  CATCH_REQUIRE_THROWS_AS(transient.set(values.size(), 0), std::out_of_range);

  auto result = transient.persistent();
  check_vector_invariants(get_base(result));
  check_elements(result, expected);
  check_elements(source, values);
}

CATCH_TEST_CASE("transient_item_lifetimes", "[transient_item_lifetimes]") {
  uint32_t counter = 0;
  {
    // TracedItem cannot be assigned, so `set` replaces leaves
    TracedVector source;
    {
      auto transient = source.transient();
      for (auto i = 0u; i < 1100; ++i)
        transient.emplace_back(counter, i);
      source = transient.persistent();
    }
    CATCH_REQUIRE(counter == 1100);

    auto transient = source.transient();
    transient.set(5, TracedItem{counter, 5000}).set(1090, TracedItem{counter, 6000});
    CATCH_REQUIRE(transient.get(5).value() == 5000);
    CATCH_REQUIRE(transient.get(1090).value() == 6000);
    CATCH_REQUIRE(source.get(5).value() == 5);
    CATCH_REQUIRE(source.get(1090).value() == 1090);
    for (auto i = 0; i < 50; ++i)
      transient.pop_back();

    auto edited = transient.persistent();
    CATCH_REQUIRE(edited.size() == 1050);
    CATCH_REQUIRE(edited.get(5).value() == 5000);
    CATCH_REQUIRE(edited != source);
  }
  CATCH_REQUIRE(counter == 0);

  {
    MoveTracedVector source;
    auto transient = source.transient();
    for (auto i = 0u; i < 1100; ++i)
      transient.push_back(MoveTracedItem{counter, i});
    transient.set(3, MoveTracedItem{counter, 3000});
    CATCH_REQUIRE(counter == 1100);
    source = transient.persistent();
    CATCH_REQUIRE(source.get(3).value() == 3000);
  }
  CATCH_REQUIRE(counter == 0);
}

CATCH_TEST_CASE("transient_strong_guarantee", "[transient_strong_guarantee]") {
  using Vector = persistent_vector<ThrowingItem, false>;
  int copies_left = 1000000;
  auto transient = Vector{}.transient();
  for (auto i = 0; i < 40; ++i)
    transient.push_back(ThrowingItem{copies_left, i});
  const auto source = transient.persistent();

  // The first edit of a shared node copies it, and that copy throws
  transient = source.transient();
  copies_left = 2;
  CATCH_REQUIRE_THROWS_AS(transient.push_back(ThrowingItem{copies_left, 40}), std::runtime_error);
  copies_left = 2;
  CATCH_REQUIRE_THROWS_AS(transient.pop_back(), std::runtime_error);
  CATCH_REQUIRE(transient.size() == 40);

  copies_left = 1000000;
  transient.push_back(ThrowingItem{copies_left, 40});
  CATCH_REQUIRE(transient.size() == 41);
  CATCH_REQUIRE(transient.back().value() == 40);

  CATCH_REQUIRE(source.size() == 40);
  for (auto i = 0u; i < source.size(); ++i)
    CATCH_REQUIRE(source.get(i).value() == static_cast<int>(i));
}

CATCH_TEST_CASE("transient_allocation_failure", "[transient_allocation_failure]") {
  uint32_t counter = 0;
  for (auto size : {31u, 32u, 64u, 96u, 1056u, 1088u}) {
    TracedVector source;
    for (auto i = 0u; i < size; ++i)
      source = source.push_back(TracedItem{counter, i});

    // Once with every node shared with `source`, once with every node private
    for (auto shared : {true, false}) {
      auto transient = shared ? source.transient() : TracedVector{}.transient();
      if (!shared) {
        for (auto i = 0u; i < size; ++i)
          transient.emplace_back(counter, i);
      }

      fail_each_allocation([&]() { transient.push_back(TracedItem{counter, size}); },
                           [&]() {
                             CATCH_REQUIRE(transient.size() == size);
                             for (auto i = 0u; i < size; ++i)
                               CATCH_REQUIRE(transient.get(i).value() == i);
                           });
      CATCH_REQUIRE(transient.size() == size + 1);
      CATCH_REQUIRE(transient.back().value() == size);

      // TracedItem cannot be assigned, so `set` builds a replacement leaf
      const auto position = size / 2;
      fail_each_allocation([&]() { transient.set(position, TracedItem{counter, 9999}); },
                           [&]() { CATCH_REQUIRE(transient.get(position).value() == position); });
      CATCH_REQUIRE(transient.get(position).value() == 9999);

      auto result = transient.persistent();
      check_vector_invariants(get_base(result));
      CATCH_REQUIRE(result.size() == size + 1);
    }

    check_vector_invariants(get_base(source));
    for (auto i = 0u; i < size; ++i)
      CATCH_REQUIRE(source.get(i).value() == i);
  }
  CATCH_REQUIRE(counter == 0);
}

CATCH_TEST_CASE("transient_swap_clear", "[transient_swap_clear]") {
  auto a = IntVector{{1, 2, 3}}.transient();
  auto b = IntVector{}.transient();
  swap(a, b);
  CATCH_REQUIRE(a.empty());
  CATCH_REQUIRE(b.size() == 3);
  b.clear();
  CATCH_REQUIRE(b.empty());
  CATCH_REQUIRE(b.persistent() == IntVector{});
}

} // namespace pvec::test

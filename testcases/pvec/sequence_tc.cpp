#include "test-utils.hpp"

#include <iterator>
#include <string>
#include <utility>

namespace pvec::test {

CATCH_TEST_CASE("vector_iterators", "[vector_iterators]") {
  for (auto size : {0, 1, 32, 33, 65, 1024, 1057, 2100, 33000}) {
    const auto values = make_sequence(0, size - 1);
    const IntVector vec{std::begin(values), std::end(values)};

    { // begin/end
      std::size_t counter = 0;
      for (auto ii = vec.begin(); ii != vec.end(); ++ii) {
        CATCH_REQUIRE(*ii == values[counter]);
        CATCH_REQUIRE(ii.index() == counter);
        ++counter;
      }
      CATCH_REQUIRE(counter == values.size());
    }

    { // Range for
      std::size_t counter = 0;
      for (const auto& value : vec)
        CATCH_REQUIRE(value == values[counter++]);
      CATCH_REQUIRE(counter == values.size());
    }

    { // Test postincrement
      std::size_t counter = 0;
      for (auto ii = vec.cbegin(); ii != vec.cend();)
        CATCH_REQUIRE(*ii++ == values[counter++]);
      CATCH_REQUIRE(counter == values.size());
    }

    { // Should be able to move beyond the end, without effect
      auto end = vec.cend();
      ++end;
      CATCH_REQUIRE(end == vec.cend());
    }

    CATCH_REQUIRE(static_cast<std::size_t>(std::distance(vec.begin(), vec.end())) == vec.size());
  }
}

CATCH_TEST_CASE("vector_iterator_arrow", "[vector_iterator_arrow]") {
  using StringVector = persistent_vector<std::string>;
  const StringVector vec = {"one", "two", "three"};
  auto ii = vec.begin();
  CATCH_REQUIRE(ii->size() == 3);
  ++ii;
  ++ii;
  CATCH_REQUIRE(ii->size() == 5);
  CATCH_REQUIRE(*ii == "three");
}

CATCH_TEST_CASE("vector_for_each_indexed", "[vector_for_each_indexed]") {
  const auto values = make_sequence(100, 1200);
  const IntVector vec{std::begin(values), std::end(values)};
  std::size_t counter = 0;
  vec.for_each_indexed([&](std::size_t index, int value) {
    CATCH_REQUIRE(index == counter);
    CATCH_REQUIRE(value == values[index]);
    ++counter;
  });
  CATCH_REQUIRE(counter == values.size());

  IntVector{}.for_each_indexed([&](std::size_t, int) { ++counter; });
  CATCH_REQUIRE(counter == values.size());
}

CATCH_TEST_CASE("vector_map", "[vector_map]") {
  const auto values = make_sequence(0, 1100);
  const IntVector vec{std::begin(values), std::end(values)};

  const auto doubled = vec.map([](int value) { return value * 2; });
  CATCH_REQUIRE(doubled.size() == vec.size());
  for (auto i = 0u; i < vec.size(); ++i)
    CATCH_REQUIRE(doubled.get(i) == 2 * vec.get(i));
  check_vector_invariants(get_base(doubled));

  // The function may take the index, and the vector
  const auto indexed = vec.map([](int value, std::size_t index) { return value - int(index); });
  for (const auto& value : indexed)
    CATCH_REQUIRE(value == 0);

  const auto with_self = vec.map([](int value, std::size_t index, const IntVector& self) {
    return self.size() - index + static_cast<std::size_t>(value);
  });
  static_assert(std::is_same<decltype(with_self), const persistent_vector<std::size_t>>::value);
  for (const auto& value : with_self)
    CATCH_REQUIRE(value == vec.size());

  // The result may hold another type
  const auto strings =
      IntVector{{1, 22, 333}}.map([](int value) { return std::to_string(value); });
  CATCH_REQUIRE(strings.size() == 3);
  CATCH_REQUIRE(strings.get(1) == "22");

  CATCH_REQUIRE(IntVector{}.map([](int value) { return value; }).empty());
  check_elements(vec, values); // untouched
}

CATCH_TEST_CASE("vector_filter", "[vector_filter]") {
  const auto values = make_sequence(0, 1100);
  const IntVector vec{std::begin(values), std::end(values)};

  const auto evens = vec.filter([](int value) { return value % 2 == 0; });
  CATCH_REQUIRE(evens.size() == 551);
  for (auto i = 0u; i < evens.size(); ++i)
    CATCH_REQUIRE(evens.get(i) == static_cast<int>(2 * i));
  check_vector_invariants(get_base(evens));

  const auto first_half = vec.filter([](int, std::size_t index) { return index < 550; });
  check_elements(first_half, make_sequence(0, 549));

  const auto nothing = vec.filter([](int, std::size_t, const IntVector&) { return false; });
  CATCH_REQUIRE(nothing.empty());

  const auto everything = vec.filter([](int) { return true; });
  CATCH_REQUIRE(everything == vec);
}

CATCH_TEST_CASE("vector_reduce", "[vector_reduce]") {
  const auto values = make_sequence(1, 1100);
  const IntVector vec{std::begin(values), std::end(values)};

  const auto sum = vec.reduce([](long acc, int value) { return acc + value; }, 0L);
  CATCH_REQUIRE(sum == 1100L * 1101L / 2);

  CATCH_REQUIRE(IntVector{}.reduce([](int acc, int value) { return acc + value; }, 42) == 42);

  // The reducer may take the index
  const auto index_sum =
      vec.reduce([](std::size_t acc, int, std::size_t index) { return acc + index; },
                 std::size_t{0});
  CATCH_REQUIRE(index_sum == 1099u * 1100u / 2);

  // Returning {acc, true} stops the fold after that item
  std::size_t visited = 0;
  const auto first_over_500 = vec.reduce(
      [&visited](int, int value) -> std::pair<int, bool> {
        ++visited;
        return {value, value > 500};
      },
      0);
  CATCH_REQUIRE(first_over_500 == 501);
  CATCH_REQUIRE(visited == 501);

  // A pair valued accumulator is folded over every item
  const auto sum_count = vec.reduce(
      [](std::pair<int, int> acc, int value) {
        return std::pair<int, int>{acc.first + value, acc.second + 1};
      },
      std::pair<int, int>{0, 0});
  CATCH_REQUIRE(sum_count.first == 1100 * 1101 / 2);
  CATCH_REQUIRE(sum_count.second == 1100);

  const auto sum_flag = vec.reduce(
      [](std::pair<int, bool> acc, int value) {
        return std::pair<int, bool>{acc.first + value, value > 10};
      },
      std::pair<int, bool>{0, false});
  CATCH_REQUIRE(sum_flag.first == 1100 * 1101 / 2);
  CATCH_REQUIRE(sum_flag.second);

  const auto joined = IntVector{{1, 2, 3}}.reduce(
      [](std::string acc, int value, std::size_t index, const IntVector& self) {
        acc += std::to_string(value);
        if (index + 1 < self.size())
          acc += ",";
        return acc;
      },
      std::string{});
  CATCH_REQUIRE(joined == "1,2,3");
}

CATCH_TEST_CASE("vector_to_vector", "[vector_to_vector]") {
  for (auto size : {0, 1, 33, 1100}) {
    const auto values = make_sequence(0, size - 1);
    const IntVector vec{std::begin(values), std::end(values)};
    CATCH_REQUIRE(vec.to_vector() == values);
  }

  uint32_t counter = 0;
  {
    MoveTracedVector vec;
    for (auto i = 0u; i < 40; ++i)
      vec = vec.emplace_back(counter, i);
    const auto copy = vec.to_vector();
    CATCH_REQUIRE(copy.size() == 40);
    CATCH_REQUIRE(counter == 80);
    CATCH_REQUIRE(copy[39].value() == 39);
  }
  CATCH_REQUIRE(counter == 0);
}

} // namespace pvec::test

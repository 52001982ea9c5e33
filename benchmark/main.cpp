#include "pvec/persistent-vector.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

using namespace std::string_literals;

using ticktock_type = std::chrono::time_point<std::chrono::steady_clock>;

static ticktock_type tick() { return std::chrono::steady_clock::now(); }
static std::chrono::microseconds tock(const ticktock_type& whence) {
  auto now = std::chrono::steady_clock::now();
  return std::chrono::duration_cast<std::chrono::microseconds>(now - whence);
}

constexpr std::size_t ColumnCount = 4;

struct Data {
  std::size_t size;
  std::array<std::string, ColumnCount> columns;
  std::array<uint64_t, ColumnCount> push_times;
  std::array<uint64_t, ColumnCount> iterate_times;
  std::array<uint64_t, ColumnCount> get_times;
  std::array<uint64_t, ColumnCount> set_times;
  std::array<uint64_t, ColumnCount> pop_times;
  std::size_t volatile_data = 0; // to prevent optimizing away
};

// Persistent operations, one new version per element
template <typename Vector> struct PersistentRunner {
  Vector vec;

  void push(std::size_t size) {
    Vector result;
    for (auto i = 0u; i < size; ++i)
      result = result.push_back(i);
    vec = std::move(result);
  }
  void set() {
    auto result = vec;
    for (auto i = 0u; i < vec.size(); ++i)
      result = result.set(i, i + 1);
    vec = std::move(result);
  }
  void pop() {
    auto result = vec;
    while (!result.empty())
      result = result.pop_back();
  }
};

// Builds and rewrites through a transient, sealing the result once
template <typename Vector> struct TransientRunner {
  Vector vec;

  void push(std::size_t size) {
    auto transient = Vector{}.transient();
    for (auto i = 0u; i < size; ++i)
      transient.push_back(i);
    vec = transient.persistent();
  }
  void set() {
    auto transient = vec.transient();
    for (auto i = 0u; i < vec.size(); ++i)
      transient.set(i, i + 1);
    vec = transient.persistent();
  }
  void pop() {
    auto transient = vec.transient();
    while (!transient.empty())
      transient.pop_back();
  }
};

struct StdVectorRunner {
  std::vector<std::size_t> vec;

  void push(std::size_t size) {
    std::vector<std::size_t> result;
    for (auto i = 0u; i < size; ++i)
      result.push_back(i);
    vec = std::move(result);
  }
  void set() {
    for (auto i = 0u; i < vec.size(); ++i)
      vec[i] = i + 1;
  }
  void pop() {
    auto result = vec;
    while (!result.empty())
      result.pop_back();
  }
};

Data run_size(const std::size_t size, const uint32_t sample_size) {
  Data data;
  data.size = size;
  data.columns = decltype(data.columns){{"std-vector"s, "atomic-pvec"s, "na-pvec"s, "transient"s}};

  auto runners = std::make_tuple(StdVectorRunner{},
                                 PersistentRunner<pvec::persistent_vector<std::size_t, true>>{},
                                 PersistentRunner<pvec::persistent_vector<std::size_t, false>>{},
                                 TransientRunner<pvec::persistent_vector<std::size_t, false>>{});

  auto profile = [sample_size](std::string_view label, auto thunk) {
    uint64_t total_us = 0;
    for (auto i = 0u; i < sample_size; ++i) {
      const auto reference = tick();
      thunk();
      total_us += tock(reference).count();
    }
    const auto average_us = uint64_t(total_us / double(sample_size));
    const auto seconds = average_us / 1000000;
    std::cout << fmt::format("             {:15s} = {}.{:06d}s\n", label, seconds,
                             average_us % 1000000);
    return average_us;
  };

  // Runs `op` on every runner, in column order
  auto for_each_runner = [&](std::string_view op_name, auto& times, auto op) {
    std::cout << fmt::format("size({}) -- {}\n", size, op_name);
    std::size_t column = 0;
    std::apply(
        [&](auto&... runner) {
          ((times[column] = profile(data.columns[column], [&]() { op(runner); }), ++column), ...);
        },
        runners);
  };

  for_each_runner("PUSH", data.push_times, [size](auto& runner) { runner.push(size); });

  std::size_t counter = 0;
  for_each_runner("ITERATE", data.iterate_times, [&counter](auto& runner) {
    for (const auto& value : runner.vec)
      counter += value;
  });
  for_each_runner("GET", data.get_times, [&counter](auto& runner) {
    for (auto i = 0u; i < runner.vec.size(); ++i)
      counter += runner.vec[i];
  });
  data.volatile_data = counter;

  for_each_runner("SET", data.set_times, [](auto& runner) { runner.set(); });
  for_each_runner("POP", data.pop_times, [](auto& runner) { runner.pop(); });

  std::cout << "\n";
  return data;
}

void run_benchmark(std::size_t max_size, uint32_t sample_size) {
  std::vector<Data> data;
  for (std::size_t size = std::min<std::size_t>(1000, max_size); size <= max_size; size *= 2)
    data.push_back(run_size(size, sample_size));

  auto output = [&](std::string_view op_type, auto fn) {
    std::cout << fmt::format("{}\t{}\n", op_type, fmt::join(data[0].columns, "\t"));
    for (const auto& datum : data)
      std::cout << fmt::format("{}\t{}\n", datum.size, fmt::join(fn(datum), "\t"));
    std::cout << "\n";
  };

  output("push", std::mem_fn(&Data::push_times));
  output("iterate", std::mem_fn(&Data::iterate_times));
  output("get", std::mem_fn(&Data::get_times));
  output("set", std::mem_fn(&Data::set_times));
  output("pop", std::mem_fn(&Data::pop_times));
}

int main(int argc, char* argv[]) {
  std::size_t max_size = 1000000;
  uint32_t sample_size = 5;
  try {
    if (argc > 1)
      max_size = std::stoull(argv[1]);
    if (argc > 2)
      sample_size = static_cast<uint32_t>(std::stoul(argv[2]));
  } catch (const std::exception& e) {
    std::cerr << fmt::format("usage: {} [element-count] [samples]: {}\n", argv[0], e.what());
    return EXIT_FAILURE;
  }
  if (max_size == 0 || sample_size == 0) {
    std::cerr << fmt::format("usage: {} [element-count] [samples]\n", argv[0]);
    return EXIT_FAILURE;
  }

  run_benchmark(max_size, sample_size);
  return EXIT_SUCCESS;
}

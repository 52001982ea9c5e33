#pragma once

#include <fmt/format.h>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace pvec {

/**
 * Thrown by `pop_back`, `front` and `back` on an empty vector
 */
class empty_vector_error : public std::out_of_range {
public:
  explicit empty_vector_error(const std::string& operation)
      : std::out_of_range{fmt::format("{}: vector is empty", operation)} {}
};

namespace detail {

[[noreturn]] inline void throw_index_out_of_range(std::size_t index, std::size_t size) {
  throw std::out_of_range{fmt::format("index {} out of range for vector of size {}", index, size)};
}

} // namespace detail

} // namespace pvec

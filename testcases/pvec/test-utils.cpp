#include "test-utils.hpp"

#include <algorithm>
#include <cstdlib>

namespace {
int allocations_until_failure = -1; // negative: never fail
}

// Nodes are allocated with std::aligned_alloc, so this lets tests fail them on demand
extern "C" void* aligned_alloc(std::size_t alignment, std::size_t size) noexcept {
  if (allocations_until_failure == 0)
    return nullptr;
  if (allocations_until_failure > 0)
    --allocations_until_failure;
  void* ptr = nullptr;
  if (::posix_memalign(&ptr, std::max(alignment, sizeof(void*)), size) != 0)
    return nullptr;
  return ptr;
}

namespace pvec::test {

FailingAllocation::FailingAllocation(int count) { allocations_until_failure = count; }

FailingAllocation::~FailingAllocation() { allocations_until_failure = -1; }

// The vector types used in testing need to be declared here to use the "private hack"
namespace private_hack {
template <typename Tag> struct result {
  using type = typename Tag::type;
  static type ptr;
};
template <typename Tag> typename result<Tag>::type result<Tag>::ptr;

template <typename Tag, typename Tag::type p> struct rob : result<Tag> {
  struct filler {
    filler() { result<Tag>::ptr = p; }
  };
  static filler filler_obj;
};
template <typename Tag, typename Tag::type p> typename rob<Tag, p>::filler rob<Tag, p>::filler_obj;

template <typename T> struct Vf {
  using type = detail::base_vector<typename T::item_type, T::is_thread_safe> T::*;
};

template struct rob<Vf<IntVector>, &IntVector::vec_>;
template struct rob<Vf<VanillaIntVector>, &VanillaIntVector::vec_>;
template struct rob<Vf<TracedVector>, &TracedVector::vec_>;
template struct rob<Vf<MoveTracedVector>, &MoveTracedVector::vec_>;

template <typename T> const auto& get_base1(const T& vec) { return vec.*result<Vf<T>>::ptr; }
} // namespace private_hack

const detail::base_vector<int, true>& get_base(const IntVector& vec) {
  return private_hack::get_base1(vec);
}

const detail::base_vector<int, false>& get_base(const VanillaIntVector& vec) {
  return private_hack::get_base1(vec);
}

const detail::base_vector<TracedItem, true>& get_base(const TracedVector& vec) {
  return private_hack::get_base1(vec);
}

const detail::base_vector<MoveTracedItem, false>& get_base(const MoveTracedVector& vec) {
  return private_hack::get_base1(vec);
}

} // namespace pvec::test

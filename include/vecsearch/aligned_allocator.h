#pragma once

#include <cstddef>
#include <cstdlib>
#include <limits>
#include <new>
#include <type_traits>
#include <vector>

#if defined(_MSC_VER)
  #include <malloc.h>
#endif

namespace vecsearch {

// Row alignment of the record store's embedding block (one AVX2 register).
constexpr std::size_t kVectorAlignment = 32;

namespace detail {

inline void* aligned_bytes(std::size_t alignment, std::size_t bytes) {
  // Round up so every platform accepts the size.
  bytes = (bytes + alignment - 1) & ~(alignment - 1);
#if defined(_MSC_VER)
  void* p = _aligned_malloc(bytes, alignment);
#else
  void* p = nullptr;
  if (posix_memalign(&p, alignment, bytes) != 0) {
    p = nullptr;
  }
#endif
  if (!p) {
    throw std::bad_alloc();
  }
  return p;
}

inline void release_aligned(void* p) noexcept {
#if defined(_MSC_VER)
  _aligned_free(p);
#else
  std::free(p);
#endif
}

} // namespace detail

// AlignedAllocator
// ----------------
// Allocator for the record store's flat embedding block. Every slot starts on
// a multiple of the row stride, so a 32-byte aligned base keeps AVX2 loads of
// a row from straddling more cache lines than necessary.
template <typename T, std::size_t Alignment = kVectorAlignment>
class AlignedAllocator {
  static_assert(Alignment >= alignof(T) && (Alignment & (Alignment - 1)) == 0,
                "Alignment must be a power of two no smaller than alignof(T)");

public:
  using value_type = T;
  using is_always_equal = std::true_type;

  template <typename U>
  struct rebind {
    using other = AlignedAllocator<U, Alignment>;
  };

  AlignedAllocator() noexcept = default;

  template <typename U>
  AlignedAllocator(const AlignedAllocator<U, Alignment>&) noexcept {}

  T* allocate(std::size_t n) {
    if (n == 0) {
      return nullptr;
    }
    if (n > std::numeric_limits<std::size_t>::max() / sizeof(T)) {
      throw std::bad_array_new_length();
    }
    return static_cast<T*>(detail::aligned_bytes(Alignment, n * sizeof(T)));
  }

  void deallocate(T* p, std::size_t) noexcept { detail::release_aligned(p); }

  template <typename U>
  bool operator==(const AlignedAllocator<U, Alignment>&) const noexcept {
    return true;
  }
  template <typename U>
  bool operator!=(const AlignedAllocator<U, Alignment>&) const noexcept {
    return false;
  }
};

// Contiguous float rows, base aligned for the SIMD kernels.
using AlignedFloats = std::vector<float, AlignedAllocator<float>>;

} // namespace vecsearch

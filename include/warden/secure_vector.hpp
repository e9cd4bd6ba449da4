/**
 * @file secure_vector.hpp
 * @brief Locked, zero-on-free storage for key material and secrets
 */

#pragma once

#include <cstdlib>
#include <cstring>
#include <memory>
#include <new>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <sys/mman.h>
#include <unistd.h>

namespace warden {

/**
 * @brief Allocator for derived keys, salts and decrypted claim plaintext
 *
 * Pages are locked so keys are not swapped out, and every byte is zeroed
 * before the memory is returned.
 */
template <typename T>
class SecureAllocator {
 public:
  using value_type = T;
  using size_type = std::size_t;
  using pointer = T*;
  using const_pointer = const T*;

  template <typename U>
  struct rebind {
    using other = SecureAllocator<U>;
  };

  SecureAllocator() = default;

  template <typename U>
  SecureAllocator(const SecureAllocator<U>&) noexcept {}

  /**
   * @brief Allocate page-aligned memory and lock it
   * @param n Number of elements to allocate
   * @return Pointer to the allocation
   * @throws std::bad_alloc if allocation fails
   */
  T* allocate(size_t n) {
    if (n == 0) return nullptr;

    size_t size = n * sizeof(T);
    size_t page_size = pageSize();
    size_t aligned_size = ((size + page_size - 1) / page_size) * page_size;

    T* ptr = static_cast<T*>(std::aligned_alloc(page_size, aligned_size));
    if (!ptr) throw std::bad_alloc();

    // mlock can fail under RLIMIT_MEMLOCK; the memory is still usable
    mlock(ptr, aligned_size);
    return ptr;
  }

  void deallocate(T* ptr, size_t n) noexcept {
    if (ptr) {
      size_t size = n * sizeof(T);
      secureZero(ptr, size);
      munlock(ptr, size);
      std::free(ptr);
    }
  }

  template <typename U>
  bool operator==(const SecureAllocator<U>&) const noexcept {
    return true;
  }

  template <typename U>
  bool operator!=(const SecureAllocator<U>&) const noexcept {
    return false;
  }

  static void secureZero(void* ptr, size_t size) noexcept {
    volatile unsigned char* p = static_cast<volatile unsigned char*>(ptr);
    for (size_t i = 0; i < size; ++i) {
      p[i] = 0;
    }
  }

 private:
  static size_t pageSize() noexcept {
    return static_cast<size_t>(sysconf(_SC_PAGESIZE));
  }
};

template <typename T>
using SecureVector = std::vector<T, SecureAllocator<T>>;

/// Byte buffer holding secret material
using SecureBytes = SecureVector<uint8_t>;

/**
 * @brief Timing-independent comparisons and wiping helpers
 */
namespace secure_utils {

/**
 * @brief Constant-time memory comparison
 * @return 0 if equal, non-zero otherwise
 */
inline int constantTimeCompare(const void* a, const void* b,
                               size_t size) noexcept {
  const volatile unsigned char* va =
      static_cast<const volatile unsigned char*>(a);
  const volatile unsigned char* vb =
      static_cast<const volatile unsigned char*>(b);
  unsigned char result = 0;

  for (size_t i = 0; i < size; ++i) {
    result |= va[i] ^ vb[i];
  }

  return result;
}

/**
 * @brief Constant-time equality for byte ranges
 *
 * Only the length is compared early; the contents are always fully
 * scanned.
 */
inline bool constantTimeEqual(std::span<const uint8_t> a,
                              std::span<const uint8_t> b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  return constantTimeCompare(a.data(), b.data(), a.size()) == 0;
}

inline bool constantTimeEqual(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  return constantTimeCompare(a.data(), b.data(), a.size()) == 0;
}

inline SecureBytes toSecureBytes(std::string_view text) {
  return SecureBytes(text.begin(), text.end());
}

/**
 * @brief Overwrite a string's contents before it is released
 */
inline void wipe(std::string& value) noexcept {
  SecureAllocator<char>::secureZero(value.data(), value.size());
  value.clear();
}

}  // namespace secure_utils

}  // namespace warden

// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#ifndef TIMECHUNK_UTIL_ENDIAN_HPP
#define TIMECHUNK_UTIL_ENDIAN_HPP

#include <cstdint>

namespace timechunk {
namespace endian {

// Little-endian helpers for fixed wire layouts (independent of host order)

inline void WriteLE32(uint8_t *ptr, uint32_t x) {
  for (int i = 0; i < 4; ++i) {
    ptr[i] = static_cast<uint8_t>(x >> (8 * i));
  }
}

inline uint32_t ReadLE32(const uint8_t *ptr) {
  uint32_t x = 0;
  for (int i = 0; i < 4; ++i) {
    x |= static_cast<uint32_t>(ptr[i]) << (8 * i);
  }
  return x;
}

inline void WriteLE64(uint8_t *ptr, uint64_t x) {
  for (int i = 0; i < 8; ++i) {
    ptr[i] = static_cast<uint8_t>(x >> (8 * i));
  }
}

inline uint64_t ReadLE64(const uint8_t *ptr) {
  uint64_t x = 0;
  for (int i = 0; i < 8; ++i) {
    x |= static_cast<uint64_t>(ptr[i]) << (8 * i);
  }
  return x;
}

} // namespace endian
} // namespace timechunk

#endif // TIMECHUNK_UTIL_ENDIAN_HPP

// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#ifndef TIMECHUNK_CRYPTO_SHA256_HPP
#define TIMECHUNK_CRYPTO_SHA256_HPP

#include "util/uint.hpp"
#include <cstddef>
#include <cstdint>

// OpenSSL's EVP_MD_CTX
struct evp_md_ctx_st;

namespace timechunk {
namespace crypto {

/**
 * Incremental SHA-256 hasher backed by OpenSSL's EVP interface
 *
 * Usage:
 *   uint256 h = CSHA256().Write(a.data(), a.size()).Write(b, n).Finalize();
 *
 * A hasher is single-use: Finalize() may be called once.
 */
class CSHA256 {
public:
  static constexpr size_t OUTPUT_SIZE = 32;

  CSHA256();
  ~CSHA256();

  CSHA256(const CSHA256 &) = delete;
  CSHA256 &operator=(const CSHA256 &) = delete;

  CSHA256 &Write(const uint8_t *data, size_t len);

  uint256 Finalize();

private:
  evp_md_ctx_st *ctx_{nullptr};
  bool finalized_{false};
};

} // namespace crypto
} // namespace timechunk

#endif // TIMECHUNK_CRYPTO_SHA256_HPP

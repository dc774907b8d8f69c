// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#include "crypto/sha256.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace timechunk {
namespace crypto {

CSHA256::CSHA256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    throw std::runtime_error("SHA256: failed to initialize OpenSSL digest");
  }
}

CSHA256::~CSHA256() { EVP_MD_CTX_free(ctx_); }

CSHA256 &CSHA256::Write(const uint8_t *data, size_t len) {
  if (finalized_) {
    throw std::logic_error("SHA256: Write() after Finalize()");
  }
  if (len > 0 && EVP_DigestUpdate(ctx_, data, len) != 1) {
    throw std::runtime_error("SHA256: digest update failed");
  }
  return *this;
}

uint256 CSHA256::Finalize() {
  if (finalized_) {
    throw std::logic_error("SHA256: Finalize() called twice");
  }
  uint8_t digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_DigestFinal_ex(ctx_, digest, &digest_len) != 1 ||
      digest_len != OUTPUT_SIZE) {
    throw std::runtime_error("SHA256: digest finalization failed");
  }
  finalized_ = true;
  return uint256(std::span<const uint8_t>(digest, OUTPUT_SIZE));
}

} // namespace crypto
} // namespace timechunk

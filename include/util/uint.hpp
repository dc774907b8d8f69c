// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#ifndef TIMECHUNK_UTIL_UINT_HPP
#define TIMECHUNK_UTIL_UINT_HPP

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace timechunk {

/**
 * Fixed-size opaque blob of BITS bits
 *
 * Bytes are kept and printed in storage order (no byte reversal), so the hex
 * form of a content hash is the digest as produced by SHA-256.
 */
template <unsigned int BITS> class base_blob {
protected:
  static constexpr int WIDTH = BITS / 8;
  static_assert(BITS % 8 == 0, "base_blob currently only supports whole bytes.");
  std::array<uint8_t, WIDTH> m_data{};

public:
  constexpr base_blob() = default;

  // Copies exactly WIDTH bytes; shorter input leaves the tail zeroed
  explicit base_blob(std::span<const uint8_t> vch) {
    for (size_t i = 0; i < vch.size() && i < m_data.size(); ++i) {
      m_data[i] = vch[i];
    }
  }

  constexpr void SetNull() { m_data.fill(0); }

  constexpr auto operator<=>(const base_blob &other) const = default;

  std::string GetHex() const;

  /**
   * Parse a hex string of exactly WIDTH * 2 digits (optional "0x" prefix).
   * Returns false and leaves the blob null on malformed input.
   */
  bool SetHex(std::string_view str);

  std::string ToString() const { return GetHex(); }

  constexpr uint8_t *data() { return m_data.data(); }
  constexpr const uint8_t *data() const { return m_data.data(); }
  constexpr uint8_t *begin() { return m_data.data(); }
  constexpr const uint8_t *begin() const { return m_data.data(); }
  constexpr uint8_t *end() { return m_data.data() + WIDTH; }
  constexpr const uint8_t *end() const { return m_data.data() + WIDTH; }
  static constexpr unsigned int size() { return WIDTH; }
};

/** 256-bit opaque blob, used for content hashes and agent identities */
class uint256 : public base_blob<256> {
public:
  constexpr uint256() = default;
  explicit uint256(std::span<const uint8_t> vch) : base_blob<256>(vch) {}

  static std::optional<uint256> FromHex(std::string_view str);
};

} // namespace timechunk

#endif // TIMECHUNK_UTIL_UINT_HPP

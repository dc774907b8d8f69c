// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#ifndef TIMECHUNK_PRIMITIVES_ENTRY_HPP
#define TIMECHUNK_PRIMITIVES_ENTRY_HPP

#include "util/uint.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace timechunk {

// Content address of an entry or link record
using EntryHash = uint256;

// Identity of an author (peer). Signing happens beneath this layer.
using AgentId = uint256;

enum class EntryType : uint8_t {
  CHUNK = 1,   // Time window anchor (see chunk/chunk.hpp)
  CONTENT = 2, // Opaque application entry
};

std::string EntryTypeToString(EntryType type);
std::optional<EntryType> EntryTypeFromByte(uint8_t value);

/**
 * Entry - unit of content-addressed storage
 *
 * The address is SHA-256 over the type byte followed by the payload, so two
 * peers that build the same entry independently always agree on its address.
 */
struct Entry {
  EntryType type{EntryType::CONTENT};
  std::vector<uint8_t> payload;

  EntryHash GetHash() const;

  static Entry FromString(std::string_view text);

  bool operator==(const Entry &other) const = default;
};

} // namespace timechunk

#endif // TIMECHUNK_PRIMITIVES_ENTRY_HPP

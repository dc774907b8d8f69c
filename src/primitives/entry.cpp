// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#include "primitives/entry.hpp"
#include "crypto/sha256.hpp"

namespace timechunk {

std::string EntryTypeToString(EntryType type) {
  switch (type) {
  case EntryType::CHUNK:
    return "chunk";
  case EntryType::CONTENT:
    return "content";
  }
  return "unknown";
}

std::optional<EntryType> EntryTypeFromByte(uint8_t value) {
  switch (value) {
  case static_cast<uint8_t>(EntryType::CHUNK):
    return EntryType::CHUNK;
  case static_cast<uint8_t>(EntryType::CONTENT):
    return EntryType::CONTENT;
  default:
    return std::nullopt;
  }
}

EntryHash Entry::GetHash() const {
  const uint8_t type_byte = static_cast<uint8_t>(type);
  return crypto::CSHA256()
      .Write(&type_byte, 1)
      .Write(payload.data(), payload.size())
      .Finalize();
}

Entry Entry::FromString(std::string_view text) {
  Entry entry;
  entry.type = EntryType::CONTENT;
  entry.payload.assign(text.begin(), text.end());
  return entry;
}

} // namespace timechunk

// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#ifndef TIMECHUNK_PRIMITIVES_LINK_HPP
#define TIMECHUNK_PRIMITIVES_LINK_HPP

#include "primitives/entry.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace timechunk {

// How a record hangs off its chunk. Carried on the wire: a chained record
// whose source happens to equal the chunk address is still chained.
enum class LinkKind : uint8_t {
  DIRECT = 0,  // source = chunk
  CHAINED = 1, // source = target of the author's chain tip on the chunk
};

std::string LinkKindToString(LinkKind kind);

/**
 * LinkRecord - one edge created by one author
 *
 * A record is filed under exactly one chunk. It is either
 * - direct:  source == chunk
 * - chained: source == target of the author's preceding record on that chunk
 *
 * author_sequence is the record's position in the author's own history and
 * is the only ordering the admission and validation rules rely on.
 *
 * Wire layout (little-endian):
 *   author(32) | author_sequence(8) | kind(1) | chunk(32) | source(32) |
 *   target(32) | tag_len(4) | tag(tag_len)
 */
struct LinkRecord {
  static constexpr size_t FIXED_SIZE = 32 + 8 + 1 + 32 + 32 + 32 + 4;
  static constexpr size_t MAX_TAG_SIZE = 1024;

  AgentId author;
  uint64_t author_sequence{0};
  LinkKind kind{LinkKind::DIRECT};
  EntryHash chunk;
  EntryHash source;
  EntryHash target;
  std::string tag;

  bool IsDirect() const { return kind == LinkKind::DIRECT; }

  // Address of the record itself (distinct domain from entry addresses)
  EntryHash GetHash() const;

  std::vector<uint8_t> Serialize() const;

  // Rejects truncated input, trailing bytes, unknown kinds and oversized tags
  bool Deserialize(const uint8_t *data, size_t size);

  std::string ToString() const;

  bool operator==(const LinkRecord &other) const = default;
};

} // namespace timechunk

#endif // TIMECHUNK_PRIMITIVES_LINK_HPP

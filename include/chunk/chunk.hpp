// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#ifndef TIMECHUNK_CHUNK_CHUNK_HPP
#define TIMECHUNK_CHUNK_CHUNK_HPP

#include "chunk/network_params.hpp"
#include "primitives/entry.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace timechunk {
namespace chunk {

/**
 * ============================================================================
 * CHUNK INDEX
 * ============================================================================
 *
 * Time is cut into fixed windows of nMaxChunkInterval seconds starting at
 * nEpoch. Window i covers [nEpoch + i * interval, nEpoch + (i + 1) * interval).
 *
 * Chunks never point at each other. Their order is implied by the index
 * alone, so any peer can derive which chunk covers a timestamp, and which
 * chunks may exist at all, without seeing any other chunk.
 * ============================================================================
 */

struct ChunkWindow {
  int64_t start_time{0}; // inclusive
  int64_t end_time{0};   // exclusive

  bool Contains(int64_t timestamp) const {
    return timestamp >= start_time && timestamp < end_time;
  }

  bool operator==(const ChunkWindow &other) const = default;
};

/**
 * floor((timestamp - epoch) / interval)
 *
 * Total: timestamps before the epoch map to negative indices, which no chunk
 * may use. Callers treat a negative index as "before genesis".
 */
int64_t ChunkIndexFor(int64_t timestamp, const ChunkParams &params);

// Inverse of ChunkIndexFor: the window served by chunk `index`.
// Requires 0 <= index <= MaxChunkIndex(params).
ChunkWindow WindowFor(int64_t index, const ChunkParams &params);

// Highest index whose window end is representable as int64_t seconds
int64_t MaxChunkIndex(const ChunkParams &params);

/**
 * Chunk - the entry anchoring links made within one time window of one index
 *
 * A network hosts any number of independent indexes, told apart by name.
 * Identity is fully determined by the name, the index and the network's
 * interval: the entry content is (index, start_time, end_time, name), so every
 * peer building the chunk for a name and index produces the same bytes and
 * the same address. Chunks of different names never share an address, and
 * so never share links.
 *
 * Wire layout (little-endian):
 *   index(8) | start_time(8) | end_time(8) | name_len(1) | name(name_len)
 */
class Chunk {
public:
  static constexpr size_t FIXED_SIZE = 8 + 8 + 8 + 1;
  static constexpr size_t MAX_NAME_SIZE = 255;

  std::string name;
  int64_t index{0};
  int64_t start_time{0};
  int64_t end_time{0};

  // Canonical chunk for `index` of index `name` under `params`.
  // Requires name.size() <= MAX_NAME_SIZE.
  static Chunk ForIndex(const std::string &name, int64_t index,
                        const ChunkParams &params);

  ChunkWindow GetWindow() const { return ChunkWindow{start_time, end_time}; }

  // True iff index is in range and start_time/end_time are exactly
  // derivable from index and params
  bool HasCanonicalWindow(const ChunkParams &params) const;

  std::vector<uint8_t> Serialize() const;

  // Exact size only; rejects names longer than MAX_NAME_SIZE
  bool Deserialize(const uint8_t *data, size_t size);

  Entry ToEntry() const;
  EntryHash GetHash() const { return ToEntry().GetHash(); }

  // nullopt if the entry is not a well-formed CHUNK entry
  static std::optional<Chunk> FromEntry(const Entry &entry);

  std::string ToString() const;

  bool operator==(const Chunk &other) const = default;
};

} // namespace chunk
} // namespace timechunk

#endif // TIMECHUNK_CHUNK_CHUNK_HPP

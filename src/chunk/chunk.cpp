// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#include "chunk/chunk.hpp"
#include "util/endian.hpp"
#include <algorithm>
#include <limits>
#include <sstream>

namespace timechunk {
namespace chunk {

int64_t ChunkIndexFor(int64_t timestamp, const ChunkParams &params) {
  const uint64_t interval = static_cast<uint64_t>(params.nMaxChunkInterval);

  // Unsigned distances keep extreme timestamps free of signed overflow
  // (nEpoch is never negative, see CheckChunkParams)
  if (timestamp >= params.nEpoch) {
    const uint64_t forward =
        static_cast<uint64_t>(timestamp) - static_cast<uint64_t>(params.nEpoch);
    return static_cast<int64_t>(forward / interval);
  }

  const uint64_t back =
      static_cast<uint64_t>(params.nEpoch) - static_cast<uint64_t>(timestamp);
  uint64_t steps = back / interval + (back % interval != 0 ? 1 : 0);
  if (steps > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    steps = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  }
  return -static_cast<int64_t>(steps);
}

ChunkWindow WindowFor(int64_t index, const ChunkParams &params) {
  ChunkWindow window;
  window.start_time = params.nEpoch + index * params.nMaxChunkInterval;
  window.end_time = window.start_time + params.nMaxChunkInterval;
  return window;
}

int64_t MaxChunkIndex(const ChunkParams &params) {
  const int64_t room = std::numeric_limits<int64_t>::max() - params.nEpoch;
  return room / params.nMaxChunkInterval - 1;
}

Chunk Chunk::ForIndex(const std::string &name, int64_t index,
                      const ChunkParams &params) {
  const ChunkWindow window = WindowFor(index, params);
  Chunk chunk;
  chunk.name = name;
  chunk.index = index;
  chunk.start_time = window.start_time;
  chunk.end_time = window.end_time;
  return chunk;
}

bool Chunk::HasCanonicalWindow(const ChunkParams &params) const {
  if (index < 0 || index > MaxChunkIndex(params)) {
    return false;
  }
  return GetWindow() == WindowFor(index, params);
}

std::vector<uint8_t> Chunk::Serialize() const {
  std::vector<uint8_t> data(FIXED_SIZE + name.size());
  endian::WriteLE64(data.data() + 0, static_cast<uint64_t>(index));
  endian::WriteLE64(data.data() + 8, static_cast<uint64_t>(start_time));
  endian::WriteLE64(data.data() + 16, static_cast<uint64_t>(end_time));
  data[24] = static_cast<uint8_t>(name.size());
  std::copy(name.begin(), name.end(), data.begin() + FIXED_SIZE);
  return data;
}

bool Chunk::Deserialize(const uint8_t *data, size_t size) {
  // Exact size only: padding or truncation would give one chunk two addresses
  if (size < FIXED_SIZE || size != FIXED_SIZE + data[24]) {
    return false;
  }
  index = static_cast<int64_t>(endian::ReadLE64(data + 0));
  start_time = static_cast<int64_t>(endian::ReadLE64(data + 8));
  end_time = static_cast<int64_t>(endian::ReadLE64(data + 16));
  name.assign(reinterpret_cast<const char *>(data + FIXED_SIZE), data[24]);
  return true;
}

Entry Chunk::ToEntry() const {
  Entry entry;
  entry.type = EntryType::CHUNK;
  entry.payload = Serialize();
  return entry;
}

std::optional<Chunk> Chunk::FromEntry(const Entry &entry) {
  if (entry.type != EntryType::CHUNK) {
    return std::nullopt;
  }
  Chunk chunk;
  if (!chunk.Deserialize(entry.payload.data(), entry.payload.size())) {
    return std::nullopt;
  }
  return chunk;
}

std::string Chunk::ToString() const {
  std::stringstream s;
  s << "Chunk(name=" << name << ", index=" << index << ", start=" << start_time
    << ", end=" << end_time << ")";
  return s.str();
}

} // namespace chunk
} // namespace timechunk

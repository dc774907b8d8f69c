// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#include "chunk/chunk_manager.hpp"
#include "util/logging.hpp"

namespace timechunk {
namespace chunk {

using validation::RejectCode;
using validation::ValidationState;

ChunkManager::ChunkManager(const NetworkParams &params, store::EntryStore &store)
    : params_(params), store_(store) {}

std::optional<Chunk> ChunkManager::FetchChunk(const std::string &name,
                                              int64_t index,
                                              ValidationState &state) const {
  const ChunkParams &params = params_.GetChunkParams();
  if (name.size() > Chunk::MAX_NAME_SIZE || index < 0 ||
      index > MaxChunkIndex(params)) {
    return std::nullopt;
  }

  const Chunk canonical = Chunk::ForIndex(name, index, params);
  const EntryHash hash = canonical.GetHash();

  auto entry = store_.Get(hash);
  if (!entry) {
    return std::nullopt;
  }

  auto stored = Chunk::FromEntry(*entry);
  if (!stored || *stored != canonical) {
    LOG_CHUNK_WARN("Entry at chunk {} address {} does not match its window "
                   "(expected {})",
                   index, hash.ToString().substr(0, 16), canonical.ToString());
    state.Invalid(RejectCode::CHUNK_WINDOW_MISMATCH, "chunk-window-mismatch",
                  stored ? stored->ToString() : "entry is not a chunk");
    return std::nullopt;
  }

  return stored;
}

std::optional<Chunk> ChunkManager::GetOrCreateChunk(const std::string &name,
                                                    int64_t index,
                                                    ValidationState &state) {
  const ChunkParams &params = params_.GetChunkParams();

  if (name.size() > Chunk::MAX_NAME_SIZE) {
    state.Invalid(RejectCode::INVALID_INDEX_NAME, "index-name-too-long",
                  std::to_string(name.size()) + " bytes");
    return std::nullopt;
  }
  if (index < 0) {
    state.Invalid(RejectCode::CHUNK_BEFORE_EPOCH, "chunk-before-epoch",
                  "index " + std::to_string(index));
    return std::nullopt;
  }
  if (index > MaxChunkIndex(params)) {
    state.Invalid(RejectCode::INVALID_CHUNK_WINDOW, "bad-chunk-index",
                  "index " + std::to_string(index) + " out of range");
    return std::nullopt;
  }

  auto existing = FetchChunk(name, index, state);
  if (existing) {
    return existing;
  }
  if (!state.IsValid()) {
    return std::nullopt;
  }

  const Chunk chunk = Chunk::ForIndex(name, index, params);
  auto hash = store_.Put(chunk.ToEntry());
  if (!hash) {
    LOG_CHUNK_ERROR("Failed to commit chunk {} of index '{}'", index, name);
    state.Error(RejectCode::STORE_FAILURE, "chunk-commit-failed",
                "index " + std::to_string(index));
    return std::nullopt;
  }

  LOG_CHUNK_INFO("Created chunk {} of index '{}' [{}, {}) at {}", chunk.index,
                 chunk.name, chunk.start_time, chunk.end_time,
                 hash->ToString().substr(0, 16));
  return chunk;
}

std::optional<Chunk>
ChunkManager::GetPreviousChunk(const Chunk &chunk, int64_t back_steps,
                               ValidationState &state) const {
  if (back_steps < 0 || back_steps > chunk.index) {
    return std::nullopt;
  }
  return FetchChunk(chunk.name, chunk.index - back_steps, state);
}

} // namespace chunk
} // namespace timechunk

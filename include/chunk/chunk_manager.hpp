// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#ifndef TIMECHUNK_CHUNK_CHUNK_MANAGER_HPP
#define TIMECHUNK_CHUNK_CHUNK_MANAGER_HPP

#include "chunk/chunk.hpp"
#include "chunk/network_params.hpp"
#include "store/entry_store.hpp"
#include "validation/validation.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace timechunk {
namespace chunk {

/**
 * ChunkManager - chunk lifecycle on top of the entry store
 *
 * A chunk is created lazily by the first author that links inside its
 * window. Creation is idempotent: the canonical entry for an index always has
 * the same bytes, so concurrent creators write the same address.
 *
 * Lookups fail closed. An entry found at a chunk's address that does not
 * decode to the canonical window is reported as CHUNK_WINDOW_MISMATCH and
 * never returned.
 */
class ChunkManager {
public:
  ChunkManager(const NetworkParams &params, store::EntryStore &store);

  /**
   * Fetch the committed chunk for `index` of index `name`
   *
   * Returns nullopt with state left VALID if no chunk was committed for the
   * index (or the index or name is out of range); nullopt with state INVALID
   * (CHUNK_WINDOW_MISMATCH) if the stored entry does not match.
   */
  std::optional<Chunk> FetchChunk(const std::string &name, int64_t index,
                                  validation::ValidationState &state) const;

  /**
   * Fetch the chunk for `index`, committing the canonical entry if absent
   *
   * Failures:
   * - INVALID_INDEX_NAME (INVALID): name longer than Chunk::MAX_NAME_SIZE
   * - CHUNK_BEFORE_EPOCH (INVALID): index < 0
   * - INVALID_CHUNK_WINDOW (INVALID): index beyond the representable range
   * - CHUNK_WINDOW_MISMATCH (INVALID): see FetchChunk
   * - STORE_FAILURE (ERROR): the store refused the commit
   */
  std::optional<Chunk> GetOrCreateChunk(const std::string &name, int64_t index,
                                        validation::ValidationState &state);

  // The committed chunk of the same index name `back_steps` windows before
  // `chunk`, if any
  std::optional<Chunk> GetPreviousChunk(const Chunk &chunk, int64_t back_steps,
                                        validation::ValidationState &state) const;

  const ChunkParams &GetParams() const { return params_.GetChunkParams(); }

private:
  const NetworkParams &params_;
  store::EntryStore &store_;
};

} // namespace chunk
} // namespace timechunk

#endif // TIMECHUNK_CHUNK_CHUNK_MANAGER_HPP

// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#ifndef TIMECHUNK_INDEX_TIME_INDEX_HPP
#define TIMECHUNK_INDEX_TIME_INDEX_HPP

#include "chunk/chunk.hpp"
#include "chunk/chunk_manager.hpp"
#include "chunk/network_params.hpp"
#include "index/chunk_range.hpp"
#include "index/link_admission.hpp"
#include "primitives/entry.hpp"
#include "primitives/link.hpp"
#include "store/entry_store.hpp"
#include "validation/link_validator.hpp"
#include "validation/validation.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace timechunk {
namespace index {

// A chunk together with the targets linked from it
struct ChunkLinks {
  chunk::Chunk chunk;
  std::vector<EntryHash> targets;
};

// TimeIndex - one author's view of the time-chunked link index
// Write side: AddLink/IndexEntry (admission). Read side: chunk lookups, spans
// and link retrieval. Gossip side: ProcessIncomingLink (validation).
//
// A network hosts independent named indexes ("posts", "comments", ...). Every
// operation that selects chunks by time takes the index name; the name is
// part of the chunk entry, so each name has its own chunks and links.
//
// Every operation without an explicit time reads util::GetTime().
//
// LIFETIME: params, store and author chain must outlive this TimeIndex
// THREAD SAFETY: admission and gossip processing are serialized by
// admission_mutex_; queries take no lock of their own
class TimeIndex {
public:
  TimeIndex(const chunk::NetworkParams &params, store::EntryStore &store,
            store::AuthorChain &authors, const AgentId &author);
  virtual ~TimeIndex() = default;

  // Link `target` on the chunk of index `name` covering now
  // Failures: FUTURE_CHUNK, SPAM_LIMIT_EXCEEDED, CHUNK_WINDOW_MISMATCH,
  // CHUNK_BEFORE_EPOCH, TAG_TOO_LARGE, INVALID_INDEX_NAME (INVALID);
  // STORE_FAILURE (ERROR)
  std::optional<LinkRecord> AddLink(const std::string &name,
                                    const EntryHash &target,
                                    const std::string &tag,
                                    validation::ValidationState &state);

  // Link `target` on the chunk covering `timestamp`; the future check uses now
  std::optional<LinkRecord> AddLinkAt(const std::string &name, int64_t timestamp,
                                      const EntryHash &target,
                                      const std::string &tag,
                                      validation::ValidationState &state);

  // Store `entry` and link it on the chunk covering `entry_time`
  std::optional<LinkRecord> IndexEntry(const std::string &name,
                                       const Entry &entry, int64_t entry_time,
                                       const std::string &tag,
                                       validation::ValidationState &state);

  // Committed chunk covering now; nullopt with VALID state if uncommitted
  std::optional<chunk::Chunk>
  GetCurrentChunk(const std::string &name,
                  validation::ValidationState &state) const;
  std::optional<chunk::Chunk>
  GetCurrentChunkAt(const std::string &name, int64_t now,
                    validation::ValidationState &state) const;

  // Highest committed chunk at or below the chunk covering now
  std::optional<chunk::Chunk> GetLatestChunk(const std::string &name) const;
  std::optional<chunk::Chunk> GetLatestChunkAt(const std::string &name,
                                               int64_t now) const;

  // Committed chunks covering [start_time, end_time], ascending, lazy
  ChunkRange GetChunksForTimeSpan(const std::string &name, int64_t start_time,
                                  int64_t end_time) const;

  // Targets reachable from `chunk`, ordered by (author, author_sequence),
  // each target once. `tag` filters the result, never the traversal.
  std::vector<EntryHash>
  GetLinks(const chunk::Chunk &chunk,
           const std::optional<std::string> &tag = std::nullopt) const;

  // Records behind GetLinks(), unfiltered
  std::vector<LinkRecord> GetLinkRecords(const chunk::Chunk &chunk) const;

  std::optional<ChunkLinks>
  GetCurrentIndex(const std::string &name, const std::optional<std::string> &tag,
                  validation::ValidationState &state) const;
  std::optional<ChunkLinks>
  GetMostRecentIndex(const std::string &name,
                     const std::optional<std::string> &tag) const;

  // Every committed chunk in [from, until] with its links
  // Fails with TIME_FRAME_TOO_SMALL if until - from < MAX_CHUNK_INTERVAL
  std::optional<std::vector<ChunkLinks>>
  GetIndexesBetween(const std::string &name, int64_t from, int64_t until,
                    const std::optional<std::string> &tag,
                    validation::ValidationState &state) const;

  std::optional<chunk::Chunk>
  GetPreviousChunk(const chunk::Chunk &chunk, int64_t back_steps,
                   validation::ValidationState &state) const;

  // Validation rules against the local author history and now
  bool ValidateLink(const LinkRecord &record,
                    validation::ValidationState &state) const;

  // Gossip entry point: validate, then commit locally on accept
  // Rejections are logged and dropped, never forwarded
  bool ProcessIncomingLink(const LinkRecord &record,
                           validation::ValidationState &state);

  const AgentId &GetAuthor() const { return author_; }
  const chunk::NetworkParams &GetParams() const { return params_; }
  const chunk::ChunkManager &GetChunkManager() const { return chunk_manager_; }

private:
  ChunkLinks MakeChunkLinks(const chunk::Chunk &chunk,
                            const std::optional<std::string> &tag) const;

  const chunk::NetworkParams &params_;
  store::EntryStore &store_;
  store::AuthorChain &authors_;
  AgentId author_;

  chunk::ChunkManager chunk_manager_;
  validation::LinkValidator validator_;

  std::mutex admission_mutex_;
};

} // namespace index
} // namespace timechunk

#endif // TIMECHUNK_INDEX_TIME_INDEX_HPP

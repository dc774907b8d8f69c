// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#include "index/time_index.hpp"
#include "index/link_walker.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <set>

namespace timechunk {
namespace index {

using validation::RejectCode;
using validation::ValidationState;

TimeIndex::TimeIndex(const chunk::NetworkParams &params,
                     store::EntryStore &store, store::AuthorChain &authors,
                     const AgentId &author)
    : params_(params), store_(store), authors_(authors), author_(author),
      chunk_manager_(params, store), validator_(params, store, authors) {}

std::optional<LinkRecord> TimeIndex::AddLink(const std::string &name,
                                             const EntryHash &target,
                                             const std::string &tag,
                                             ValidationState &state) {
  return AddLinkAt(name, util::GetTime(), target, tag, state);
}

std::optional<LinkRecord> TimeIndex::AddLinkAt(const std::string &name,
                                               int64_t timestamp,
                                               const EntryHash &target,
                                               const std::string &tag,
                                               ValidationState &state) {
  const chunk::ChunkParams &params = params_.GetChunkParams();
  const int64_t now = util::GetTime();

  if (tag.size() > LinkRecord::MAX_TAG_SIZE) {
    state.Invalid(RejectCode::TAG_TOO_LARGE, "tag-too-large",
                  std::to_string(tag.size()) + " bytes");
    return std::nullopt;
  }
  if (name.size() > chunk::Chunk::MAX_NAME_SIZE) {
    state.Invalid(RejectCode::INVALID_INDEX_NAME, "index-name-too-long",
                  std::to_string(name.size()) + " bytes");
    return std::nullopt;
  }

  // 1. Chunk index for the timestamp, refusing windows not yet open
  const int64_t index = chunk::ChunkIndexFor(timestamp, params);
  if (index < 0) {
    state.Invalid(RejectCode::CHUNK_BEFORE_EPOCH, "chunk-before-epoch",
                  "timestamp " + std::to_string(timestamp) +
                      " precedes epoch " + std::to_string(params.nEpoch));
    return std::nullopt;
  }
  if (index > chunk::MaxChunkIndex(params)) {
    state.Invalid(RejectCode::FUTURE_CHUNK, "chunk-in-future",
                  "index " + std::to_string(index) + " out of range");
    return std::nullopt;
  }
  if (!validation::CheckChunkNotFuture(chunk::WindowFor(index, params), params,
                                       now, state)) {
    LOG_LINK_DEBUG("AddLink refused: {}", state.ToString());
    return std::nullopt;
  }

  // 2. Chunk entry (idempotent)
  auto chunk = chunk_manager_.GetOrCreateChunk(name, index, state);
  if (!chunk) {
    LOG_LINK_WARN("AddLink failed to obtain chunk {} of index '{}': {}", index,
                  name, state.ToString());
    return std::nullopt;
  }
  const EntryHash chunk_hash = chunk->GetHash();

  std::lock_guard<std::mutex> lock(admission_mutex_);

  // 3. Fresh per-(author, chunk) counts from the author's own history
  const std::vector<LinkRecord> history = authors_.GetHistory(author_);
  const validation::AuthorChunkState prior =
      validation::ReplayAuthorChunk(history, chunk_hash);

  // 4-6. Direct, chained or refused
  auto decision = DecideAdmission(prior, chunk_hash, params, state);
  if (!decision) {
    LOG_LINK_INFO("AddLink on chunk {} refused: {}", chunk->index,
                  state.ToString());
    return std::nullopt;
  }

  LinkRecord record;
  record.author = author_;
  record.author_sequence = authors_.NextSequence(author_);
  record.kind = decision->kind;
  record.chunk = chunk_hash;
  record.source = decision->source;
  record.target = target;
  record.tag = tag;

  // Our own record must pass the rules every other peer applies
  if (!validator_.ValidateLinkWithHistory(record, history, now, state)) {
    LOG_LINK_ERROR("Admitted record fails validation: {} ({})",
                   record.ToString(), state.ToString());
    return std::nullopt;
  }

  // 7. Append
  if (!store_.CommitLink(record)) {
    LOG_LINK_ERROR("Failed to commit link {} -> {}",
                   record.source.ToString().substr(0, 16),
                   record.target.ToString().substr(0, 16));
    state.Error(RejectCode::STORE_FAILURE, "link-commit-failed",
                "sequence " + std::to_string(record.author_sequence));
    return std::nullopt;
  }

  LOG_LINK_INFO("Added {} link on chunk {} (direct={}, total={}) -> {}",
                LinkKindToString(decision->kind), chunk->index,
                prior.direct_count +
                    (decision->kind == LinkKind::DIRECT ? 1 : 0),
                prior.total_count + 1, target.ToString().substr(0, 16));
  return record;
}

std::optional<LinkRecord> TimeIndex::IndexEntry(const std::string &name,
                                                const Entry &entry,
                                                int64_t entry_time,
                                                const std::string &tag,
                                                ValidationState &state) {
  auto hash = store_.Put(entry);
  if (!hash) {
    LOG_STORE_ERROR("Failed to store {} entry", EntryTypeToString(entry.type));
    state.Error(RejectCode::STORE_FAILURE, "entry-commit-failed");
    return std::nullopt;
  }
  return AddLinkAt(name, entry_time, *hash, tag, state);
}

std::optional<chunk::Chunk>
TimeIndex::GetCurrentChunk(const std::string &name,
                           ValidationState &state) const {
  return GetCurrentChunkAt(name, util::GetTime(), state);
}

std::optional<chunk::Chunk>
TimeIndex::GetCurrentChunkAt(const std::string &name, int64_t now,
                             ValidationState &state) const {
  const int64_t index = chunk::ChunkIndexFor(now, params_.GetChunkParams());
  return chunk_manager_.FetchChunk(name, index, state);
}

std::optional<chunk::Chunk>
TimeIndex::GetLatestChunk(const std::string &name) const {
  return GetLatestChunkAt(name, util::GetTime());
}

std::optional<chunk::Chunk>
TimeIndex::GetLatestChunkAt(const std::string &name, int64_t now) const {
  const chunk::ChunkParams &params = params_.GetChunkParams();
  int64_t index = std::min(chunk::ChunkIndexFor(now, params),
                           chunk::MaxChunkIndex(params));

  // Chunks are sparse: walk down to genesis
  for (; index >= 0; --index) {
    ValidationState state;
    auto found = chunk_manager_.FetchChunk(name, index, state);
    if (found) {
      return found;
    }
  }
  return std::nullopt;
}

ChunkRange TimeIndex::GetChunksForTimeSpan(const std::string &name,
                                           int64_t start_time,
                                           int64_t end_time) const {
  if (end_time < start_time) {
    return ChunkRange();
  }
  const chunk::ChunkParams &params = params_.GetChunkParams();
  return ChunkRange(chunk_manager_, name,
                    chunk::ChunkIndexFor(start_time, params),
                    chunk::ChunkIndexFor(end_time, params));
}

std::vector<LinkRecord>
TimeIndex::GetLinkRecords(const chunk::Chunk &chunk) const {
  return CollectChunkLinks(store_, chunk.GetHash(), params_.GetChunkParams());
}

std::vector<EntryHash>
TimeIndex::GetLinks(const chunk::Chunk &chunk,
                    const std::optional<std::string> &tag) const {
  std::vector<EntryHash> targets;
  std::set<EntryHash> seen;
  for (const auto &record : GetLinkRecords(chunk)) {
    if (tag && record.tag != *tag) {
      continue;
    }
    if (seen.insert(record.target).second) {
      targets.push_back(record.target);
    }
  }
  return targets;
}

ChunkLinks TimeIndex::MakeChunkLinks(const chunk::Chunk &chunk,
                                     const std::optional<std::string> &tag) const {
  ChunkLinks out;
  out.chunk = chunk;
  out.targets = GetLinks(chunk, tag);
  return out;
}

std::optional<ChunkLinks>
TimeIndex::GetCurrentIndex(const std::string &name,
                           const std::optional<std::string> &tag,
                           ValidationState &state) const {
  auto chunk = GetCurrentChunk(name, state);
  if (!chunk) {
    return std::nullopt;
  }
  return MakeChunkLinks(*chunk, tag);
}

std::optional<ChunkLinks>
TimeIndex::GetMostRecentIndex(const std::string &name,
                              const std::optional<std::string> &tag) const {
  auto chunk = GetLatestChunk(name);
  if (!chunk) {
    return std::nullopt;
  }
  return MakeChunkLinks(*chunk, tag);
}

std::optional<std::vector<ChunkLinks>>
TimeIndex::GetIndexesBetween(const std::string &name, int64_t from,
                             int64_t until,
                             const std::optional<std::string> &tag,
                             ValidationState &state) const {
  const chunk::ChunkParams &params = params_.GetChunkParams();
  if (until < from ||
      static_cast<uint64_t>(until) - static_cast<uint64_t>(from) <
          static_cast<uint64_t>(params.nMaxChunkInterval)) {
    state.Invalid(RejectCode::TIME_FRAME_TOO_SMALL, "time-frame-too-small",
                  "span must cover at least " +
                      std::to_string(params.nMaxChunkInterval) + " seconds");
    return std::nullopt;
  }

  std::vector<ChunkLinks> result;
  for (const auto &chunk : GetChunksForTimeSpan(name, from, until)) {
    result.push_back(MakeChunkLinks(chunk, tag));
  }
  return result;
}

std::optional<chunk::Chunk>
TimeIndex::GetPreviousChunk(const chunk::Chunk &chunk, int64_t back_steps,
                            ValidationState &state) const {
  return chunk_manager_.GetPreviousChunk(chunk, back_steps, state);
}

bool TimeIndex::ValidateLink(const LinkRecord &record,
                             ValidationState &state) const {
  return validator_.ValidateLink(record, util::GetTime(), state);
}

bool TimeIndex::ProcessIncomingLink(const LinkRecord &record,
                                    ValidationState &state) {
  std::lock_guard<std::mutex> lock(admission_mutex_);

  if (!validator_.ValidateLink(record, util::GetTime(), state)) {
    if (state.IsInvalid()) {
      LOG_VALIDATION_INFO("Dropping link {} from author {}: {}",
                          record.GetHash().ToString().substr(0, 16),
                          record.author.ToString().substr(0, 16),
                          state.ToString());
    } else {
      LOG_VALIDATION_DEBUG("Deferring link {} from author {}: {}",
                           record.GetHash().ToString().substr(0, 16),
                           record.author.ToString().substr(0, 16),
                           state.ToString());
    }
    return false;
  }

  if (!store_.CommitLink(record)) {
    LOG_STORE_ERROR("Failed to commit accepted link {}",
                    record.GetHash().ToString().substr(0, 16));
    return state.Error(RejectCode::STORE_FAILURE, "link-commit-failed");
  }

  LOG_VALIDATION_DEBUG("Accepted link {} (author {}, sequence {})",
                       record.GetHash().ToString().substr(0, 16),
                       record.author.ToString().substr(0, 16),
                       record.author_sequence);
  return true;
}

} // namespace index
} // namespace timechunk

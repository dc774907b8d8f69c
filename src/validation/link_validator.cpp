// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#include "validation/link_validator.hpp"
#include "util/logging.hpp"

namespace timechunk {
namespace validation {

LinkValidator::LinkValidator(const chunk::NetworkParams &params,
                             const store::EntryStore &entries,
                             const store::AuthorChain &authors)
    : params_(params), entries_(entries), authors_(authors) {}

std::optional<chunk::Chunk>
LinkValidator::ResolveChunk(const EntryHash &chunk_hash,
                            ValidationState &state) const {
  auto entry = entries_.Get(chunk_hash);
  if (!entry) {
    // May simply not have arrived yet
    state.Error(RejectCode::UNKNOWN_CHUNK, "chunk-not-found",
                chunk_hash.ToString());
    return std::nullopt;
  }

  auto chunk = chunk::Chunk::FromEntry(*entry);
  if (!chunk) {
    state.Invalid(RejectCode::UNKNOWN_CHUNK, "bad-chunk-entry",
                  "entry " + chunk_hash.ToString().substr(0, 16) +
                      " is not a chunk");
    return std::nullopt;
  }
  return chunk;
}

bool LinkValidator::ValidateLink(const LinkRecord &candidate, int64_t now,
                                 ValidationState &state) const {
  return ValidateLinkWithHistory(candidate, authors_.GetHistory(candidate.author),
                                 now, state);
}

bool LinkValidator::ValidateLinkWithHistory(
    const LinkRecord &candidate, const std::vector<LinkRecord> &history,
    int64_t now, ValidationState &state) const {
  const chunk::ChunkParams &params = params_.GetChunkParams();

  if (candidate.tag.size() > LinkRecord::MAX_TAG_SIZE) {
    return state.Invalid(RejectCode::TAG_TOO_LARGE, "tag-too-large",
                         std::to_string(candidate.tag.size()) + " bytes");
  }

  auto chunk = ResolveChunk(candidate.chunk, state);
  if (!chunk) {
    LOG_VALIDATION_DEBUG("Link {} rejected: {}",
                         candidate.GetHash().ToString().substr(0, 16),
                         state.ToString());
    return false;
  }

  if (!CheckChunkWindow(*chunk, params, state) ||
      !CheckChunkNotFuture(chunk->GetWindow(), params, now, state)) {
    LOG_VALIDATION_DEBUG("Link {} rejected: {}",
                         candidate.GetHash().ToString().substr(0, 16),
                         state.ToString());
    return false;
  }

  // Every earlier record of the author must be known before the record can
  // be judged; history is ordered and gap-free below its size
  uint64_t known = 0;
  for (const auto &record : history) {
    if (record.author_sequence == known) {
      ++known;
    } else if (record.author_sequence > known) {
      break;
    }
  }
  if (known < candidate.author_sequence) {
    return state.Error(RejectCode::MISSING_HISTORY, "missing-history",
                       "have " + std::to_string(known) +
                           " records, record is at sequence " +
                           std::to_string(candidate.author_sequence));
  }

  for (const auto &record : history) {
    if (record.author_sequence == candidate.author_sequence &&
        record != candidate) {
      LOG_VALIDATION_WARN("Conflicting records at sequence {} for author {}",
                          candidate.author_sequence,
                          candidate.author.ToString().substr(0, 16));
      return state.Invalid(RejectCode::CHAIN_DISCONTINUITY, "sequence-conflict",
                           "author already has a different record at sequence " +
                               std::to_string(candidate.author_sequence));
    }
  }

  AuthorChunkState prior =
      ReplayAuthorChunk(history, candidate.chunk, candidate.author_sequence);
  if (!CheckLinkAgainstHistory(candidate, prior, params, state)) {
    LOG_VALIDATION_DEBUG("Link {} rejected: {}",
                         candidate.GetHash().ToString().substr(0, 16),
                         state.ToString());
    return false;
  }

  LOG_VALIDATION_TRACE("Link {} valid ({} on chunk {})",
                       candidate.GetHash().ToString().substr(0, 16),
                       LinkKindToString(candidate.kind),
                       chunk->index);
  return true;
}

} // namespace validation
} // namespace timechunk

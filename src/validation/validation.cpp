// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#include "validation/validation.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace timechunk {
namespace validation {

std::string RejectCodeToString(RejectCode code) {
  switch (code) {
  case RejectCode::NONE:
    return "none";
  case RejectCode::FUTURE_CHUNK:
    return "future-chunk";
  case RejectCode::CHUNK_BEFORE_EPOCH:
    return "chunk-before-epoch";
  case RejectCode::CHUNK_WINDOW_MISMATCH:
    return "chunk-window-mismatch";
  case RejectCode::INVALID_CHUNK_WINDOW:
    return "invalid-chunk-window";
  case RejectCode::UNKNOWN_CHUNK:
    return "unknown-chunk";
  case RejectCode::DIRECT_LIMIT_EXCEEDED:
    return "direct-limit-exceeded";
  case RejectCode::SPAM_LIMIT_EXCEEDED:
    return "spam-limit-exceeded";
  case RejectCode::CHAIN_DISCONTINUITY:
    return "chain-discontinuity";
  case RejectCode::TIME_FRAME_TOO_SMALL:
    return "time-frame-too-small";
  case RejectCode::MISSING_HISTORY:
    return "missing-history";
  case RejectCode::TAG_TOO_LARGE:
    return "tag-too-large";
  case RejectCode::INVALID_INDEX_NAME:
    return "invalid-index-name";
  case RejectCode::STORE_FAILURE:
    return "store-failure";
  }
  return "unknown";
}

std::string ValidationState::ToString() const {
  if (IsValid()) {
    return "valid";
  }
  std::string out = IsInvalid() ? "invalid: " : "error: ";
  out += reject_reason_;
  if (!debug_message_.empty()) {
    out += " (" + debug_message_ + ")";
  }
  return out;
}

AuthorChunkState ReplayAuthorChunk(const std::vector<LinkRecord> &history,
                                   const EntryHash &chunk_hash,
                                   uint64_t before_sequence) {
  std::vector<const LinkRecord *> on_chunk;
  for (const auto &record : history) {
    if (record.chunk == chunk_hash && record.author_sequence < before_sequence) {
      on_chunk.push_back(&record);
    }
  }
  std::sort(on_chunk.begin(), on_chunk.end(),
            [](const LinkRecord *a, const LinkRecord *b) {
              return a->author_sequence < b->author_sequence;
            });

  AuthorChunkState state;
  for (const LinkRecord *record : on_chunk) {
    if (record->IsDirect()) {
      ++state.direct_count;
    }
    ++state.total_count;
    state.tip = *record;
  }
  return state;
}

bool CheckChunkWindow(const chunk::Chunk &chunk,
                      const chunk::ChunkParams &params, ValidationState &state) {
  if (chunk.index < 0 || chunk.index > chunk::MaxChunkIndex(params)) {
    return state.Invalid(RejectCode::INVALID_CHUNK_WINDOW, "bad-chunk-index",
                         "chunk index " + std::to_string(chunk.index) +
                             " out of range");
  }

  const chunk::ChunkWindow expected = chunk::WindowFor(chunk.index, params);
  if (chunk.GetWindow() != expected) {
    return state.Invalid(
        RejectCode::INVALID_CHUNK_WINDOW, "bad-chunk-window",
        "chunk " + std::to_string(chunk.index) + " stores [" +
            std::to_string(chunk.start_time) + ", " +
            std::to_string(chunk.end_time) + "), expected [" +
            std::to_string(expected.start_time) + ", " +
            std::to_string(expected.end_time) + ")");
  }
  return true;
}

bool CheckChunkNotFuture(const chunk::ChunkWindow &window,
                         const chunk::ChunkParams &params, int64_t now,
                         ValidationState &state) {
  if (window.start_time > now + params.nMaxFutureDrift) {
    return state.Invalid(RejectCode::FUTURE_CHUNK, "chunk-in-future",
                         "chunk starts at " + std::to_string(window.start_time) +
                             " > " +
                             std::to_string(now + params.nMaxFutureDrift));
  }
  return true;
}

bool CheckLinkAgainstHistory(const LinkRecord &candidate,
                             const AuthorChunkState &prior,
                             const chunk::ChunkParams &params,
                             ValidationState &state) {
  if (candidate.IsDirect()) {
    if (candidate.source != candidate.chunk) {
      return state.Invalid(RejectCode::CHAIN_DISCONTINUITY,
                           "direct-source-mismatch",
                           "direct record at sequence " +
                               std::to_string(candidate.author_sequence) +
                               " is not sourced at its chunk");
    }
  } else {
    // Chained: must continue from the author's immediately preceding record
    if (!prior.tip) {
      return state.Invalid(RejectCode::CHAIN_DISCONTINUITY, "chain-without-root",
                           "chained record at sequence " +
                               std::to_string(candidate.author_sequence) +
                               " has no prior record on its chunk");
    }
    if (candidate.source != prior.tip->target) {
      return state.Invalid(
          RejectCode::CHAIN_DISCONTINUITY, "chain-discontinuity",
          "source " + candidate.source.ToString().substr(0, 16) +
              " != prior tip target " +
              prior.tip->target.ToString().substr(0, 16));
    }
  }

  if (prior.total_count + 1 > params.nEnforceSpamLimit) {
    return state.Invalid(RejectCode::SPAM_LIMIT_EXCEEDED, "spam-limit-exceeded",
                         "author already has " +
                             std::to_string(prior.total_count) +
                             " links on chunk (limit " +
                             std::to_string(params.nEnforceSpamLimit) + ")");
  }

  if (candidate.IsDirect() &&
      prior.direct_count + 1 > params.nDirectChunkLinkLimit) {
    return state.Invalid(RejectCode::DIRECT_LIMIT_EXCEEDED,
                         "direct-limit-exceeded",
                         "author already has " +
                             std::to_string(prior.direct_count) +
                             " direct links on chunk (limit " +
                             std::to_string(params.nDirectChunkLinkLimit) + ")");
  }

  return true;
}

} // namespace validation
} // namespace timechunk

// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#ifndef TIMECHUNK_VALIDATION_VALIDATION_HPP
#define TIMECHUNK_VALIDATION_VALIDATION_HPP

#include "chunk/chunk.hpp"
#include "chunk/network_params.hpp"
#include "primitives/link.hpp"
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace timechunk {
namespace validation {

/**
 * ============================================================================
 * LINK VALIDATION ARCHITECTURE
 * ============================================================================
 *
 * Every peer decides membership of a link record on its own, from:
 * - the record itself
 * - the author's history before the record (AuthorChain)
 * - the chunk entry the record is filed under
 * - the fixed ChunkParams of the network
 * - its own clock (future-chunk check only)
 *
 * No peer trusts the author's admission logic and no peer asks any other
 * peer. Admission (index/link_admission) derives its decision from the same
 * ReplayAuthorChunk() and the same limit checks, so an honest author never
 * produces a record an honest validator rejects.
 *
 * LAYER 1: Chunk checks
 * - CheckChunkWindow()    : stored window derivable from index
 * - CheckChunkNotFuture() : chunk does not start beyond now + drift
 *
 * LAYER 2: Per-author checks
 * - ReplayAuthorChunk()       : direct/total counts and tip before the record
 * - CheckLinkAgainstHistory() : chain continuity, direct and spam limits
 *
 * INTEGRATION POINT:
 * - LinkValidator::ValidateLink() runs both layers against store data
 * ============================================================================
 */

/**
 * Typed rejection reasons
 */
enum class RejectCode {
  NONE,
  FUTURE_CHUNK,          // Window starts beyond now + drift
  CHUNK_BEFORE_EPOCH,    // Timestamp earlier than chunk 0
  CHUNK_WINDOW_MISMATCH, // Fetched chunk content disagrees with its index
  INVALID_CHUNK_WINDOW,  // Record filed under a non-canonical chunk
  UNKNOWN_CHUNK,         // Record names a chunk entry we cannot use
  DIRECT_LIMIT_EXCEEDED, // Direct link beyond DIRECT_CHUNK_LINK_LIMIT
  SPAM_LIMIT_EXCEEDED,   // Link beyond ENFORCE_SPAM_LIMIT
  CHAIN_DISCONTINUITY,   // Chained source is not the author's prior tip
  TIME_FRAME_TOO_SMALL,  // Range query narrower than one chunk
  MISSING_HISTORY,       // Author's prior records not seen yet
  TAG_TOO_LARGE,         // Tag longer than LinkRecord::MAX_TAG_SIZE
  INVALID_INDEX_NAME,    // Index name longer than Chunk::MAX_NAME_SIZE
  STORE_FAILURE,         // Collaborator store failed
};

std::string RejectCodeToString(RejectCode code);

/**
 * Validation state - tracks why an operation failed
 *
 * INVALID is a permanent rule failure: retrying with the same inputs gives the
 * same answer. ERROR is transient (store failure, data not arrived yet) and
 * the whole operation may be retried.
 */
class ValidationState {
public:
  enum class Result {
    VALID,
    INVALID, // Rule violation (permanent)
    ERROR    // Collaborator failure (temporary)
  };

  ValidationState() : result_(Result::VALID) {}

  bool IsValid() const { return result_ == Result::VALID; }
  bool IsInvalid() const { return result_ == Result::INVALID; }
  bool IsError() const { return result_ == Result::ERROR; }

  bool Invalid(RejectCode code, const std::string &reject_reason,
               const std::string &debug_message = "") {
    result_ = Result::INVALID;
    code_ = code;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  bool Error(RejectCode code, const std::string &reject_reason,
             const std::string &debug_message = "") {
    result_ = Result::ERROR;
    code_ = code;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  Result GetResult() const { return result_; }
  RejectCode GetRejectCode() const { return code_; }
  std::string GetRejectReason() const { return reject_reason_; }
  std::string GetDebugMessage() const { return debug_message_; }

  std::string ToString() const;

private:
  Result result_;
  RejectCode code_{RejectCode::NONE};
  std::string reject_reason_;
  std::string debug_message_;
};

/**
 * Per-(author, chunk) state derived from the author's history
 *
 * Never stored: recomputed on every admission and every validation.
 */
struct AuthorChunkState {
  uint32_t direct_count{0};
  uint32_t total_count{0};

  // Author's highest-sequence record on the chunk (chain tip)
  std::optional<LinkRecord> tip;
};

/**
 * Replay an author's history on one chunk
 *
 * Counts records filed under `chunk_hash` whose author_sequence is below
 * `before_sequence`, in author_sequence order. The input need not be sorted.
 */
AuthorChunkState ReplayAuthorChunk(
    const std::vector<LinkRecord> &history, const EntryHash &chunk_hash,
    uint64_t before_sequence = std::numeric_limits<uint64_t>::max());

/**
 * Check that a chunk's stored window is exactly the one derivable from its
 * index under the network parameters.
 */
bool CheckChunkWindow(const chunk::Chunk &chunk,
                      const chunk::ChunkParams &params, ValidationState &state);

/**
 * Check that a chunk window does not start beyond now + nMaxFutureDrift.
 * Used with the author's clock on admission and with the validator's own
 * clock on validation.
 */
bool CheckChunkNotFuture(const chunk::ChunkWindow &window,
                         const chunk::ChunkParams &params, int64_t now,
                         ValidationState &state);

/**
 * Check a record against the author's prior state on its chunk
 *
 * Checks:
 * - direct:  source == chunk
 * - chained: a prior record exists and source == its target
 * - total_count after the record <= ENFORCE_SPAM_LIMIT
 * - direct:  direct_count after the record <= DIRECT_CHUNK_LINK_LIMIT
 */
bool CheckLinkAgainstHistory(const LinkRecord &candidate,
                             const AuthorChunkState &prior,
                             const chunk::ChunkParams &params,
                             ValidationState &state);

} // namespace validation
} // namespace timechunk

#endif // TIMECHUNK_VALIDATION_VALIDATION_HPP

// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#ifndef TIMECHUNK_VALIDATION_LINK_VALIDATOR_HPP
#define TIMECHUNK_VALIDATION_LINK_VALIDATOR_HPP

#include "chunk/network_params.hpp"
#include "store/entry_store.hpp"
#include "validation/validation.hpp"
#include <optional>
#include <vector>

namespace timechunk {
namespace validation {

/**
 * LinkValidator - decides whether a link record is a valid member of its chunk
 *
 * Stateless beyond its references; safe to call concurrently as long as the
 * store and author chain are.
 *
 * Check order (first failure wins):
 *   0. tag size                                    TAG_TOO_LARGE
 *   1. chunk entry resolvable and well-formed      UNKNOWN_CHUNK
 *   2. chunk window canonical                      INVALID_CHUNK_WINDOW
 *   3. chunk not in the future                     FUTURE_CHUNK
 *   4. author history present up to the record     MISSING_HISTORY
 *   5. no conflicting record at the same sequence  CHAIN_DISCONTINUITY
 *   6. chain continuity, spam and direct limits    (CheckLinkAgainstHistory)
 */
class LinkValidator {
public:
  LinkValidator(const chunk::NetworkParams &params,
                const store::EntryStore &entries,
                const store::AuthorChain &authors);
  virtual ~LinkValidator() = default;

  // Validate against the author history held by the AuthorChain
  bool ValidateLink(const LinkRecord &candidate, int64_t now,
                    ValidationState &state) const;

  // Validate against an explicit history (records at any sequence; only
  // those below candidate.author_sequence are considered)
  bool ValidateLinkWithHistory(const LinkRecord &candidate,
                               const std::vector<LinkRecord> &history,
                               int64_t now, ValidationState &state) const;

protected:
  // Chunk entry named by the record, or nullopt with state set
  virtual std::optional<chunk::Chunk>
  ResolveChunk(const EntryHash &chunk_hash, ValidationState &state) const;

private:
  const chunk::NetworkParams &params_;
  const store::EntryStore &entries_;
  const store::AuthorChain &authors_;
};

} // namespace validation
} // namespace timechunk

#endif // TIMECHUNK_VALIDATION_LINK_VALIDATOR_HPP

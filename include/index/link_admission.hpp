// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#ifndef TIMECHUNK_INDEX_LINK_ADMISSION_HPP
#define TIMECHUNK_INDEX_LINK_ADMISSION_HPP

#include "chunk/network_params.hpp"
#include "primitives/link.hpp"
#include "validation/validation.hpp"
#include <optional>

namespace timechunk {
namespace index {

struct AdmissionDecision {
  LinkKind kind{LinkKind::DIRECT};
  EntryHash source;
};

/**
 * Decide how the author's next link on a chunk is attached
 *
 *   total_count >= ENFORCE_SPAM_LIMIT      -> SPAM_LIMIT_EXCEEDED
 *   direct_count < DIRECT_CHUNK_LINK_LIMIT -> DIRECT
 *   otherwise                              -> CHAINED from the tip
 *
 * A full direct budget is never surfaced as DIRECT_LIMIT_EXCEEDED here; it
 * turns the link into a chain continuation instead.
 */
std::optional<AdmissionDecision>
DecideAdmission(const validation::AuthorChunkState &prior,
                const EntryHash &chunk_hash, const chunk::ChunkParams &params,
                validation::ValidationState &state);

} // namespace index
} // namespace timechunk

#endif // TIMECHUNK_INDEX_LINK_ADMISSION_HPP

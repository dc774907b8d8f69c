// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#include "index/link_admission.hpp"

namespace timechunk {
namespace index {

using validation::RejectCode;

std::optional<AdmissionDecision>
DecideAdmission(const validation::AuthorChunkState &prior,
                const EntryHash &chunk_hash, const chunk::ChunkParams &params,
                validation::ValidationState &state) {
  if (prior.total_count >= params.nEnforceSpamLimit) {
    state.Invalid(RejectCode::SPAM_LIMIT_EXCEEDED, "spam-limit-exceeded",
                  std::to_string(prior.total_count) + " links on chunk (limit " +
                      std::to_string(params.nEnforceSpamLimit) + ")");
    return std::nullopt;
  }

  if (prior.direct_count < params.nDirectChunkLinkLimit) {
    return AdmissionDecision{LinkKind::DIRECT, chunk_hash};
  }

  // direct_count >= limit > 0, so at least one record exists on the chunk
  if (!prior.tip) {
    state.Invalid(RejectCode::CHAIN_DISCONTINUITY, "chain-without-root");
    return std::nullopt;
  }
  return AdmissionDecision{LinkKind::CHAINED, prior.tip->target};
}

} // namespace index
} // namespace timechunk

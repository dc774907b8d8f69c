// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#ifndef TIMECHUNK_INDEX_LINK_WALKER_HPP
#define TIMECHUNK_INDEX_LINK_WALKER_HPP

#include "chunk/network_params.hpp"
#include "primitives/link.hpp"
#include "store/entry_store.hpp"
#include <vector>

namespace timechunk {
namespace index {

/**
 * Collect every record reachable from a chunk
 *
 * Starts from the direct records filed under the chunk and follows each
 * author's chain: the continuation of record r is the author's
 * lowest-sequence chained record on the same chunk whose source is r.target
 * and whose sequence is above r's. The walk is iterative and takes at most
 * ENFORCE_SPAM_LIMIT steps per author.
 *
 * Result is ordered by (author, author_sequence) with no record repeated.
 */
std::vector<LinkRecord> CollectChunkLinks(const store::EntryStore &store,
                                          const EntryHash &chunk_hash,
                                          const chunk::ChunkParams &params);

} // namespace index
} // namespace timechunk

#endif // TIMECHUNK_INDEX_LINK_WALKER_HPP

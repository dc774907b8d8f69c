// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#include "index/link_walker.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <map>
#include <set>

namespace timechunk {
namespace index {

namespace {

// Next record of `cur`'s chain, if any
const LinkRecord *FindContinuation(const std::vector<LinkRecord> &outgoing,
                                   const LinkRecord &cur) {
  const LinkRecord *next = nullptr;
  for (const auto &candidate : outgoing) {
    if (candidate.author != cur.author || candidate.chunk != cur.chunk ||
        candidate.IsDirect() ||
        candidate.author_sequence <= cur.author_sequence) {
      continue;
    }
    if (!next || candidate.author_sequence < next->author_sequence) {
      next = &candidate;
    }
  }
  return next;
}

} // namespace

std::vector<LinkRecord> CollectChunkLinks(const store::EntryStore &store,
                                          const EntryHash &chunk_hash,
                                          const chunk::ChunkParams &params) {
  // author -> direct records on this chunk
  std::map<AgentId, std::vector<LinkRecord>> roots;
  for (auto &record : store.GetLinksFrom(chunk_hash)) {
    if (record.chunk == chunk_hash && record.IsDirect()) {
      roots[record.author].push_back(std::move(record));
    }
  }

  std::vector<LinkRecord> result;
  for (auto &[author, directs] : roots) {
    std::sort(directs.begin(), directs.end(),
              [](const LinkRecord &a, const LinkRecord &b) {
                return a.author_sequence < b.author_sequence;
              });

    std::map<uint64_t, LinkRecord> collected; // author_sequence -> record
    std::set<EntryHash> visited;
    uint32_t steps = 0;

    for (const auto &direct : directs) {
      if (!visited.insert(direct.GetHash()).second) {
        continue;
      }
      collected.emplace(direct.author_sequence, direct);
      ++steps;

      LinkRecord cur = direct;
      while (steps < params.nEnforceSpamLimit) {
        const auto outgoing = store.GetLinksFrom(cur.target);
        const LinkRecord *next = FindContinuation(outgoing, cur);
        if (!next) {
          break;
        }
        if (!visited.insert(next->GetHash()).second) {
          break;
        }
        collected.emplace(next->author_sequence, *next);
        ++steps;
        cur = *next;
      }

      if (steps >= params.nEnforceSpamLimit) {
        LOG_LINK_TRACE("Walk for author {} stopped at spam limit",
                       author.ToString().substr(0, 16));
        break;
      }
    }

    for (auto &[seq, record] : collected) {
      result.push_back(std::move(record));
    }
  }

  return result;
}

} // namespace index
} // namespace timechunk

// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#ifndef TIMECHUNK_STORE_ENTRY_STORE_HPP
#define TIMECHUNK_STORE_ENTRY_STORE_HPP

#include "primitives/entry.hpp"
#include "primitives/link.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace timechunk {
namespace store {

/**
 * EntryStore - content-addressed storage and edge index
 *
 * Stands in for the replicated store beneath the index. Every call may block
 * on a network round trip; a failed call must leave nothing behind.
 */
class EntryStore {
public:
  virtual ~EntryStore() = default;

  // Store an entry; returns its address, or nullopt on commit failure.
  // Storing an entry that already exists is not an error.
  virtual std::optional<EntryHash> Put(const Entry &entry) = 0;

  virtual std::optional<Entry> Get(const EntryHash &hash) const = 0;

  virtual bool Has(const EntryHash &hash) const { return Get(hash).has_value(); }

  /**
   * Commit a link record as an outgoing edge of record.source and as the
   * next record of record.author's history.
   *
   * Fails (returns false, nothing stored) if record.author_sequence is not
   * the author's next sequence, unless the identical record is already
   * stored, in which case it succeeds without change.
   */
  virtual bool CommitLink(const LinkRecord &record) = 0;

  // Every committed record whose source is `base`
  virtual std::vector<LinkRecord> GetLinksFrom(const EntryHash &base) const = 0;
};

/**
 * AuthorChain - ordered personal history of each author
 *
 * The only total order the index relies on. Integrity of the history
 * (signatures, hash chaining) is verified beneath this interface.
 */
class AuthorChain {
public:
  virtual ~AuthorChain() = default;

  // All records by `author`, ascending author_sequence
  virtual std::vector<LinkRecord> GetHistory(const AgentId &author) const = 0;

  // Sequence number the author's next record must carry
  virtual uint64_t NextSequence(const AgentId &author) const = 0;
};

} // namespace store
} // namespace timechunk

#endif // TIMECHUNK_STORE_ENTRY_STORE_HPP

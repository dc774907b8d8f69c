// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#ifndef TIMECHUNK_STORE_MEMORY_STORE_HPP
#define TIMECHUNK_STORE_MEMORY_STORE_HPP

#include "store/entry_store.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace timechunk {
namespace store {

// MemoryStore - in-process EntryStore and AuthorChain
//
// Holds one peer's local view. CommitLink updates the edge index and the
// author's history under one lock, so a record is either in both or in
// neither.
//
// THREAD SAFETY: all public methods lock mutex_.

class MemoryStore : public EntryStore, public AuthorChain {
public:
  MemoryStore();
  ~MemoryStore() override;

  std::optional<EntryHash> Put(const Entry &entry) override;
  std::optional<Entry> Get(const EntryHash &hash) const override;
  bool Has(const EntryHash &hash) const override;
  bool CommitLink(const LinkRecord &record) override;
  std::vector<LinkRecord> GetLinksFrom(const EntryHash &base) const override;

  std::vector<LinkRecord> GetHistory(const AgentId &author) const override;
  uint64_t NextSequence(const AgentId &author) const override;

  size_t GetEntryCount() const;
  size_t GetLinkCount() const;

  // Persist everything as JSON. Returns false on I/O failure.
  bool Save(const std::string &filepath) const;

  // Replace contents from a file written by Save(). Re-derives every address
  // and re-checks every history, rejecting files that do not verify.
  // Returns false (and leaves the store empty) on any failure.
  bool Load(const std::string &filepath);

private:
  mutable std::mutex mutex_;

  // address -> entry
  std::map<EntryHash, Entry> m_entries;

  // base address -> records whose source is base, in commit order
  std::map<EntryHash, std::vector<LinkRecord>> m_links;

  // author -> history, index == author_sequence
  std::map<AgentId, std::vector<LinkRecord>> m_histories;

  size_t m_link_count{0};

  // Assumes mutex_ held
  bool CommitLinkLocked(const LinkRecord &record);
};

} // namespace store
} // namespace timechunk

#endif // TIMECHUNK_STORE_MEMORY_STORE_HPP

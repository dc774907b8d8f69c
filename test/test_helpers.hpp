// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license
// Shared fixtures for index tests

#ifndef TIMECHUNK_TEST_HELPERS_HPP
#define TIMECHUNK_TEST_HELPERS_HPP

#include "chunk/network_params.hpp"
#include "primitives/entry.hpp"
#include "store/memory_store.hpp"
#include <map>
#include <memory>
#include <string>

namespace timechunk {
namespace test {

// Epoch used by all fixture networks (2023-11-14 22:13:20 UTC)
constexpr int64_t TEST_EPOCH = 1700000000;

/**
 * Fixture network: DIRECT_CHUNK_LINK_LIMIT=2, ENFORCE_SPAM_LIMIT=5,
 * MAX_CHUNK_INTERVAL=3600s, 60s drift
 */
inline std::unique_ptr<chunk::NetworkParams>
MakeTestParams(uint32_t direct_limit = 2, uint32_t spam_limit = 5,
               int64_t interval = 3600) {
    chunk::ChunkParams p;
    p.nEpoch = TEST_EPOCH;
    p.nMaxChunkInterval = interval;
    p.nDirectChunkLinkLimit = direct_limit;
    p.nEnforceSpamLimit = spam_limit;
    p.nMaxFutureDrift = 60;
    return chunk::NetworkParams::CreateCustom(p, "unittest");
}

// Index name used by tests that exercise a single index
inline const std::string TEST_INDEX = "posts";

// Timestamp `offset` seconds into chunk `index` of the fixture network
inline int64_t TimeInChunk(int64_t index, int64_t offset = 100,
                           int64_t interval = 3600) {
    return TEST_EPOCH + index * interval + offset;
}

// Deterministic content address for a label
inline EntryHash MakeTarget(const std::string& label) {
    return Entry::FromString(label).GetHash();
}

inline AgentId MakeAgent(uint8_t id) {
    AgentId agent;
    agent.data()[0] = id;
    agent.data()[31] = 0xa5;
    return agent;
}

/**
 * FailingStore - MemoryStore whose commits can be made to fail
 *
 * Simulates a store round trip that times out: the call reports failure and
 * nothing is stored.
 */
class FailingStore : public store::MemoryStore {
public:
    bool fail_puts = false;
    bool fail_commits = false;

    std::optional<EntryHash> Put(const Entry& entry) override {
        if (fail_puts) {
            return std::nullopt;
        }
        return MemoryStore::Put(entry);
    }

    bool CommitLink(const LinkRecord& record) override {
        if (fail_commits) {
            return false;
        }
        return MemoryStore::CommitLink(record);
    }
};

/**
 * TamperingStore - MemoryStore that serves forged content at chosen addresses
 */
class TamperingStore : public store::MemoryStore {
public:
    void Forge(const EntryHash& address, const Entry& content) {
        forged_[address] = content;
    }

    std::optional<Entry> Get(const EntryHash& hash) const override {
        auto it = forged_.find(hash);
        if (it != forged_.end()) {
            return it->second;
        }
        return MemoryStore::Get(hash);
    }

    bool Has(const EntryHash& hash) const override {
        return forged_.count(hash) > 0 || MemoryStore::Has(hash);
    }

private:
    std::map<EntryHash, Entry> forged_;
};

} // namespace test
} // namespace timechunk

#endif // TIMECHUNK_TEST_HELPERS_HPP

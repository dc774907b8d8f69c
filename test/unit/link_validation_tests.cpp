// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license
// Unit tests for peer-side link validation and gossip processing

#include <catch2/catch_test_macros.hpp>
#include "index/time_index.hpp"
#include "test_helpers.hpp"
#include "util/time.hpp"
#include "validation/link_validator.hpp"
#include "validation/validation.hpp"

using namespace timechunk;
using namespace timechunk::validation;
using timechunk::index::TimeIndex;
using timechunk::test::MakeAgent;
using timechunk::test::MakeTarget;
using timechunk::test::MakeTestParams;
using timechunk::test::TEST_INDEX;
using timechunk::test::TimeInChunk;
using timechunk::util::MockTimeScope;

namespace {

LinkRecord Direct(const AgentId& author, uint64_t seq, const EntryHash& chunk,
                  const std::string& target) {
    LinkRecord r;
    r.author = author;
    r.author_sequence = seq;
    r.chunk = chunk;
    r.source = chunk;
    r.target = MakeTarget(target);
    return r;
}

LinkRecord Chained(const LinkRecord& prev, const std::string& target) {
    LinkRecord r = prev;
    r.author_sequence = prev.author_sequence + 1;
    r.kind = LinkKind::CHAINED;
    r.source = prev.target;
    r.target = MakeTarget(target);
    return r;
}

// Two peers, each with its own local store. Alice authors; Bob validates.
struct TwoPeers {
    std::unique_ptr<chunk::NetworkParams> params = MakeTestParams(2, 5);
    store::MemoryStore alice_store;
    store::MemoryStore bob_store;
    TimeIndex alice{*params, alice_store, alice_store, MakeAgent(1)};
    TimeIndex bob{*params, bob_store, bob_store, MakeAgent(2)};

    // Propagate the chunk entry a record is filed under
    void ShareChunk(const LinkRecord& record) {
        auto entry = alice_store.Get(record.chunk);
        REQUIRE(entry.has_value());
        REQUIRE(bob_store.Put(*entry).has_value());
    }
};

} // namespace

TEST_CASE("ReplayAuthorChunk", "[validation]") {
    const AgentId alice = MakeAgent(1);
    const EntryHash c1 = MakeTarget("chunk-1");
    const EntryHash c2 = MakeTarget("chunk-2");

    LinkRecord a0 = Direct(alice, 0, c1, "T1");
    LinkRecord a1 = Direct(alice, 1, c2, "U1");
    LinkRecord a2 = Direct(alice, 2, c1, "T2");
    LinkRecord a3 = Chained(a2, "T3");
    std::vector<LinkRecord> history{a3, a0, a2, a1}; // unsorted on purpose

    SECTION("Counts only the requested chunk") {
        AuthorChunkState s = ReplayAuthorChunk(history, c1);
        REQUIRE(s.direct_count == 2);
        REQUIRE(s.total_count == 3);
        REQUIRE(s.tip == a3);

        AuthorChunkState other = ReplayAuthorChunk(history, c2);
        REQUIRE(other.direct_count == 1);
        REQUIRE(other.total_count == 1);
    }

    SECTION("Stops before the given sequence") {
        AuthorChunkState s = ReplayAuthorChunk(history, c1, 3);
        REQUIRE(s.direct_count == 2);
        REQUIRE(s.total_count == 2);
        REQUIRE(s.tip == a2);
    }

    SECTION("Empty history") {
        AuthorChunkState s = ReplayAuthorChunk({}, c1);
        REQUIRE(s.total_count == 0);
        REQUIRE_FALSE(s.tip.has_value());
    }
}

TEST_CASE("CheckLinkAgainstHistory", "[validation]") {
    auto params = MakeTestParams(2, 3);
    const auto& p = params->GetChunkParams();
    const AgentId alice = MakeAgent(1);
    const EntryHash c = MakeTarget("chunk");

    LinkRecord d0 = Direct(alice, 0, c, "T1");
    LinkRecord d1 = Direct(alice, 1, c, "T2");

    SECTION("Third direct link exceeds the direct limit") {
        AuthorChunkState prior = ReplayAuthorChunk({d0, d1}, c);
        ValidationState state;
        REQUIRE_FALSE(CheckLinkAgainstHistory(Direct(alice, 2, c, "T3"), prior, p, state));
        REQUIRE(state.GetRejectCode() == RejectCode::DIRECT_LIMIT_EXCEEDED);
    }

    SECTION("Chain must continue from the tip") {
        AuthorChunkState prior = ReplayAuthorChunk({d0, d1}, c);
        ValidationState good;
        REQUIRE(CheckLinkAgainstHistory(Chained(d1, "T3"), prior, p, good));

        LinkRecord from_old = Chained(d1, "T3");
        from_old.source = d0.target;
        ValidationState state;
        REQUIRE_FALSE(CheckLinkAgainstHistory(from_old, prior, p, state));
        REQUIRE(state.GetRejectCode() == RejectCode::CHAIN_DISCONTINUITY);
    }

    SECTION("Chain continues from a tip whose target is the chunk itself") {
        LinkRecord self = Direct(alice, 1, c, "T2");
        self.target = c;
        AuthorChunkState prior = ReplayAuthorChunk({d0, self}, c);
        REQUIRE(prior.direct_count == 2);

        LinkRecord next = Chained(self, "T3");
        REQUIRE(next.source == next.chunk);
        REQUIRE_FALSE(next.IsDirect());
        ValidationState state;
        REQUIRE(CheckLinkAgainstHistory(next, prior, p, state));

        AuthorChunkState after = ReplayAuthorChunk({d0, self, next}, c);
        REQUIRE(after.direct_count == 2);
        REQUIRE(after.total_count == 3);
    }

    SECTION("Direct record must be sourced at its chunk") {
        LinkRecord stray = Direct(alice, 0, c, "T1");
        stray.source = MakeTarget("elsewhere");
        ValidationState state;
        REQUIRE_FALSE(CheckLinkAgainstHistory(stray, AuthorChunkState{}, p, state));
        REQUIRE(state.GetRejectCode() == RejectCode::CHAIN_DISCONTINUITY);
        REQUIRE(state.GetRejectReason() == "direct-source-mismatch");
    }

    SECTION("Chain without any prior record") {
        LinkRecord orphan = Chained(d0, "T2");
        orphan.author_sequence = 0;
        ValidationState state;
        REQUIRE_FALSE(CheckLinkAgainstHistory(orphan, AuthorChunkState{}, p, state));
        REQUIRE(state.GetRejectCode() == RejectCode::CHAIN_DISCONTINUITY);
    }

    SECTION("Total beyond the spam limit") {
        LinkRecord c2 = Chained(d1, "T3");
        AuthorChunkState prior = ReplayAuthorChunk({d0, d1, c2}, c);
        ValidationState state;
        REQUIRE_FALSE(CheckLinkAgainstHistory(Chained(c2, "T4"), prior, p, state));
        REQUIRE(state.GetRejectCode() == RejectCode::SPAM_LIMIT_EXCEEDED);
    }
}

TEST_CASE("Gossip between two peers", "[validation]") {
    TwoPeers peers;
    MockTimeScope time(TimeInChunk(10));

    std::vector<LinkRecord> records;
    for (int i = 1; i <= 5; ++i) {
        ValidationState state;
        auto record = peers.alice.AddLink(TEST_INDEX, MakeTarget("T" + std::to_string(i)), "", state);
        REQUIRE(record.has_value());
        records.push_back(*record);
    }
    peers.ShareChunk(records[0]);

    SECTION("Honest records are accepted in order") {
        for (const auto& record : records) {
            ValidationState state;
            REQUIRE(peers.bob.ProcessIncomingLink(record, state));
        }
        REQUIRE(peers.bob_store.GetLinkCount() == 5);

        ValidationState lookup;
        auto chunk = peers.bob.GetCurrentChunk(TEST_INDEX, lookup);
        REQUIRE(chunk.has_value());
        REQUIRE(peers.bob.GetLinks(*chunk) == peers.alice.GetLinks(*chunk));
    }

    SECTION("Duplicate delivery is harmless") {
        ValidationState s1, s2;
        REQUIRE(peers.bob.ProcessIncomingLink(records[0], s1));
        REQUIRE(peers.bob.ProcessIncomingLink(records[0], s2));
        REQUIRE(peers.bob_store.GetLinkCount() == 1);
    }

    SECTION("Record ahead of its history is deferred") {
        ValidationState early;
        REQUIRE_FALSE(peers.bob.ProcessIncomingLink(records[2], early));
        REQUIRE(early.IsError());
        REQUIRE(early.GetRejectCode() == RejectCode::MISSING_HISTORY);
        REQUIRE(peers.bob_store.GetLinkCount() == 0);

        for (const auto& record : records) {
            ValidationState state;
            REQUIRE(peers.bob.ProcessIncomingLink(record, state));
        }
    }

    SECTION("Record on a chunk the peer has not seen") {
        store::MemoryStore empty;
        TimeIndex carol(*peers.params, empty, empty, MakeAgent(3));
        ValidationState state;
        REQUIRE_FALSE(carol.ProcessIncomingLink(records[0], state));
        REQUIRE(state.IsError());
        REQUIRE(state.GetRejectCode() == RejectCode::UNKNOWN_CHUNK);
    }

    SECTION("Forged direct link beyond the limit is dropped") {
        ValidationState s0, s1;
        REQUIRE(peers.bob.ProcessIncomingLink(records[0], s0));
        REQUIRE(peers.bob.ProcessIncomingLink(records[1], s1));

        LinkRecord third_direct = Direct(records[0].author, 2, records[0].chunk, "X");
        ValidationState state;
        REQUIRE_FALSE(peers.bob.ProcessIncomingLink(third_direct, state));
        REQUIRE(state.IsInvalid());
        REQUIRE(state.GetRejectCode() == RejectCode::DIRECT_LIMIT_EXCEEDED);
        REQUIRE(peers.bob_store.GetLinkCount() == 2);
    }

    SECTION("Broken chain is dropped") {
        ValidationState s0, s1, s2;
        REQUIRE(peers.bob.ProcessIncomingLink(records[0], s0));
        REQUIRE(peers.bob.ProcessIncomingLink(records[1], s1));

        LinkRecord broken = records[2];
        broken.source = records[0].target;
        ValidationState state;
        REQUIRE_FALSE(peers.bob.ProcessIncomingLink(broken, state));
        REQUIRE(state.GetRejectCode() == RejectCode::CHAIN_DISCONTINUITY);
    }

    SECTION("Equivocating record at a used sequence") {
        ValidationState s0, s1;
        REQUIRE(peers.bob.ProcessIncomingLink(records[0], s0));
        REQUIRE(peers.bob.ProcessIncomingLink(records[1], s1));

        LinkRecord conflict = records[1];
        conflict.target = MakeTarget("other");
        ValidationState state;
        REQUIRE_FALSE(peers.bob.ProcessIncomingLink(conflict, state));
        REQUIRE(state.GetRejectCode() == RejectCode::CHAIN_DISCONTINUITY);
    }

    SECTION("Validator clock decides future chunks") {
        // Alice's clock runs an hour ahead of Bob's
        MockTimeScope alice_clock(TimeInChunk(11));
        ValidationState s;
        auto ahead = peers.alice.AddLink(TEST_INDEX, MakeTarget("F1"), "", s);
        REQUIRE(ahead.has_value());
        peers.ShareChunk(*ahead);

        for (const auto& record : records) {
            ValidationState state;
            REQUIRE(peers.bob.ProcessIncomingLink(record, state));
        }

        MockTimeScope bob_clock(TimeInChunk(10));
        ValidationState state;
        REQUIRE_FALSE(peers.bob.ProcessIncomingLink(*ahead, state));
        REQUIRE(state.GetRejectCode() == RejectCode::FUTURE_CHUNK);

        // Accepted once Bob's clock catches up
        MockTimeScope caught_up(TimeInChunk(11));
        ValidationState later;
        REQUIRE(peers.bob.ProcessIncomingLink(*ahead, later));
    }
}

TEST_CASE("Records filed under non-canonical chunks", "[validation]") {
    auto params = MakeTestParams(2, 5);
    const auto& p = params->GetChunkParams();
    store::MemoryStore store;
    LinkValidator validator(*params, store, store);
    const AgentId mallory = MakeAgent(9);
    const int64_t now = TimeInChunk(10);

    SECTION("Stretched window") {
        chunk::Chunk wide = chunk::Chunk::ForIndex(TEST_INDEX, 10, p);
        wide.end_time += 3600;
        REQUIRE(store.Put(wide.ToEntry()));

        ValidationState state;
        REQUIRE_FALSE(validator.ValidateLinkWithHistory(
            Direct(mallory, 0, wide.GetHash(), "T"), {}, now, state));
        REQUIRE(state.GetRejectCode() == RejectCode::INVALID_CHUNK_WINDOW);
    }

    SECTION("Negative index") {
        chunk::Chunk before;
        before.index = -1;
        before.start_time = p.nEpoch - p.nMaxChunkInterval;
        before.end_time = p.nEpoch;
        REQUIRE(store.Put(before.ToEntry()));

        ValidationState state;
        REQUIRE_FALSE(validator.ValidateLinkWithHistory(
            Direct(mallory, 0, before.GetHash(), "T"), {}, now, state));
        REQUIRE(state.GetRejectCode() == RejectCode::INVALID_CHUNK_WINDOW);
    }

    SECTION("Source names a content entry, not a chunk") {
        const EntryHash content = *store.Put(Entry::FromString("plain"));
        ValidationState state;
        REQUIRE_FALSE(validator.ValidateLinkWithHistory(
            Direct(mallory, 0, content, "T"), {}, now, state));
        REQUIRE(state.IsInvalid());
        REQUIRE(state.GetRejectCode() == RejectCode::UNKNOWN_CHUNK);
    }

    SECTION("Canonical chunk passes") {
        chunk::Chunk good = chunk::Chunk::ForIndex(TEST_INDEX, 10, p);
        REQUIRE(store.Put(good.ToEntry()));
        ValidationState state;
        REQUIRE(validator.ValidateLinkWithHistory(
            Direct(mallory, 0, good.GetHash(), "T"), {}, now, state));
        REQUIRE(state.IsValid());
    }
}

// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license
// Unit tests for chunk lookups, time spans and link retrieval

#include <catch2/catch_test_macros.hpp>
#include "index/time_index.hpp"
#include "test_helpers.hpp"
#include "util/time.hpp"

using namespace timechunk;
using namespace timechunk::index;
using timechunk::test::MakeAgent;
using timechunk::test::MakeTarget;
using timechunk::test::MakeTestParams;
using timechunk::test::TEST_INDEX;
using timechunk::test::TamperingStore;
using timechunk::test::TimeInChunk;
using timechunk::util::MockTimeScope;
using timechunk::validation::RejectCode;
using timechunk::validation::ValidationState;

TEST_CASE("Current and latest chunk", "[query]") {
    auto params = MakeTestParams();
    store::MemoryStore store;
    TimeIndex index(*params, store, store, MakeAgent(1));

    MockTimeScope time(TimeInChunk(20));

    SECTION("Nothing committed yet") {
        ValidationState state;
        REQUIRE_FALSE(index.GetCurrentChunk(TEST_INDEX, state).has_value());
        REQUIRE(state.IsValid());
        REQUIRE_FALSE(index.GetLatestChunk(TEST_INDEX).has_value());
        REQUIRE_FALSE(index.GetMostRecentIndex(TEST_INDEX, std::nullopt).has_value());
    }

    SECTION("Latest finds the chunk after one link") {
        ValidationState state;
        REQUIRE(index.AddLink(TEST_INDEX, MakeTarget("T1"), "", state));
        auto latest = index.GetLatestChunk(TEST_INDEX);
        REQUIRE(latest.has_value());
        REQUIRE(latest->index == 20);
        REQUIRE(index.GetCurrentChunk(TEST_INDEX, state) == latest);
    }

    SECTION("Latest searches back across unused windows") {
        ValidationState state;
        REQUIRE(index.AddLinkAt(TEST_INDEX, TimeInChunk(3), MakeTarget("old"), "", state));
        REQUIRE(index.AddLinkAt(TEST_INDEX, TimeInChunk(12), MakeTarget("newer"), "", state));

        REQUIRE_FALSE(index.GetCurrentChunk(TEST_INDEX, state).has_value());
        auto latest = index.GetLatestChunk(TEST_INDEX);
        REQUIRE(latest.has_value());
        REQUIRE(latest->index == 12);

        REQUIRE(index.GetLatestChunkAt(TEST_INDEX, TimeInChunk(11))->index == 3);
        REQUIRE_FALSE(index.GetLatestChunkAt(TEST_INDEX, TimeInChunk(2)).has_value());
        REQUIRE_FALSE(index.GetLatestChunkAt(TEST_INDEX, test::TEST_EPOCH - 10).has_value());
    }

    SECTION("Current and most recent index carry links") {
        ValidationState state;
        REQUIRE(index.AddLink(TEST_INDEX, MakeTarget("T1"), "news", state));
        REQUIRE(index.AddLink(TEST_INDEX, MakeTarget("T2"), "misc", state));

        auto current = index.GetCurrentIndex(TEST_INDEX, std::nullopt, state);
        REQUIRE(current.has_value());
        REQUIRE(current->targets.size() == 2);

        auto news = index.GetMostRecentIndex(TEST_INDEX, std::string("news"));
        REQUIRE(news.has_value());
        REQUIRE(news->targets == std::vector<EntryHash>{MakeTarget("T1")});
    }
}

TEST_CASE("Current chunk with a tampered entry", "[query]") {
    auto params = MakeTestParams();
    TamperingStore store;
    TimeIndex index(*params, store, store, MakeAgent(1));

    MockTimeScope time(TimeInChunk(5));

    ValidationState setup;
    REQUIRE(index.AddLinkAt(TEST_INDEX, TimeInChunk(4), MakeTarget("T"), "", setup));

    chunk::Chunk canonical = chunk::Chunk::ForIndex(TEST_INDEX, 5, params->GetChunkParams());
    chunk::Chunk forged = canonical;
    forged.start_time -= 1;
    store.Forge(canonical.GetHash(), forged.ToEntry());

    ValidationState state;
    REQUIRE_FALSE(index.GetCurrentChunk(TEST_INDEX, state).has_value());
    REQUIRE(state.GetRejectCode() == RejectCode::CHUNK_WINDOW_MISMATCH);

    // Scans skip it and fall back to the previous good chunk
    auto latest = index.GetLatestChunk(TEST_INDEX);
    REQUIRE(latest.has_value());
    REQUIRE(latest->index == 4);

    ValidationState add;
    REQUIRE_FALSE(index.AddLink(TEST_INDEX, MakeTarget("T2"), "", add));
    REQUIRE(add.GetRejectCode() == RejectCode::CHUNK_WINDOW_MISMATCH);
}

TEST_CASE("Chunks for a time span", "[query]") {
    auto params = MakeTestParams();
    store::MemoryStore store;
    TimeIndex index(*params, store, store, MakeAgent(1));

    MockTimeScope time(TimeInChunk(30));

    ValidationState state;
    for (int64_t i : {4, 5, 6, 8}) {
        REQUIRE(index.AddLinkAt(TEST_INDEX, TimeInChunk(i), MakeTarget("T" + std::to_string(i)), "", state));
    }

    SECTION("Two intervals cover at most three chunks") {
        const int64_t start = TimeInChunk(4, 1800);
        auto chunks = index.GetChunksForTimeSpan(TEST_INDEX, start, start + 2 * 3600).ToVector();
        REQUIRE(chunks.size() == 3);
        REQUIRE(chunks[0].index == 4);
        REQUIRE(chunks[1].index == 5);
        REQUIRE(chunks[2].index == 6);
    }

    SECTION("Unused windows are skipped") {
        auto chunks = index.GetChunksForTimeSpan(TEST_INDEX, TimeInChunk(5), TimeInChunk(9)).ToVector();
        REQUIRE(chunks.size() == 3);
        REQUIRE(chunks[2].index == 8);

        const int64_t start = TimeInChunk(6, 1800);
        auto sparse = index.GetChunksForTimeSpan(TEST_INDEX, start, start + 2 * 3600).ToVector();
        REQUIRE(sparse.size() == 2);
    }

    SECTION("Empty and inverted spans") {
        REQUIRE(index.GetChunksForTimeSpan(TEST_INDEX, TimeInChunk(10), TimeInChunk(20)).empty());
        REQUIRE(index.GetChunksForTimeSpan(TEST_INDEX, TimeInChunk(8), TimeInChunk(4)).empty());
        REQUIRE(index.GetChunksForTimeSpan(TEST_INDEX, 0, test::TEST_EPOCH - 1).empty());
    }

    SECTION("Span before the epoch is clamped") {
        auto chunks = index.GetChunksForTimeSpan(TEST_INDEX, 0, TimeInChunk(4)).ToVector();
        REQUIRE(chunks.size() == 1);
        REQUIRE(chunks[0].index == 4);
    }

    SECTION("Ranges are lazy and restartable") {
        auto range = index.GetChunksForTimeSpan(TEST_INDEX, TimeInChunk(4), TimeInChunk(8));
        REQUIRE(range.ToVector().size() == 4);

        REQUIRE(index.AddLinkAt(TEST_INDEX, TimeInChunk(7), MakeTarget("T7"), "", state));

        size_t count = 0;
        int64_t last = -1;
        for (const auto& chunk : range) {
            REQUIRE(chunk.index > last);
            last = chunk.index;
            ++count;
        }
        REQUIRE(count == 5);
    }
}

TEST_CASE("Indexes between two times", "[query]") {
    auto params = MakeTestParams();
    store::MemoryStore store;
    TimeIndex index(*params, store, store, MakeAgent(1));

    MockTimeScope time(TimeInChunk(30));

    ValidationState setup;
    REQUIRE(index.AddLinkAt(TEST_INDEX, TimeInChunk(2), MakeTarget("a"), "x", setup));
    REQUIRE(index.AddLinkAt(TEST_INDEX, TimeInChunk(3), MakeTarget("b"), "y", setup));

    SECTION("Spans shorter than one interval are refused") {
        ValidationState state;
        REQUIRE_FALSE(index.GetIndexesBetween(TEST_INDEX, TimeInChunk(2), TimeInChunk(2) + 3599,
                                              std::nullopt, state));
        REQUIRE(state.GetRejectCode() == RejectCode::TIME_FRAME_TOO_SMALL);

        ValidationState inverted;
        REQUIRE_FALSE(index.GetIndexesBetween(TEST_INDEX, TimeInChunk(3), TimeInChunk(2),
                                              std::nullopt, inverted));
        REQUIRE(inverted.GetRejectCode() == RejectCode::TIME_FRAME_TOO_SMALL);
    }

    SECTION("Each chunk with its links") {
        ValidationState state;
        auto result = index.GetIndexesBetween(TEST_INDEX, TimeInChunk(2), TimeInChunk(3),
                                              std::nullopt, state);
        REQUIRE(result.has_value());
        REQUIRE(result->size() == 2);
        REQUIRE((*result)[0].targets == std::vector<EntryHash>{MakeTarget("a")});
        REQUIRE((*result)[1].targets == std::vector<EntryHash>{MakeTarget("b")});
    }

    SECTION("Tag filter keeps chunks, filters targets") {
        ValidationState state;
        auto result = index.GetIndexesBetween(TEST_INDEX, TimeInChunk(2), TimeInChunk(3),
                                              std::string("y"), state);
        REQUIRE(result.has_value());
        REQUIRE(result->size() == 2);
        REQUIRE((*result)[0].targets.empty());
        REQUIRE((*result)[1].targets.size() == 1);
    }
}

TEST_CASE("GetLinks across authors", "[query]") {
    auto params = MakeTestParams(2, 5);
    store::MemoryStore store;
    TimeIndex alice(*params, store, store, MakeAgent(1));
    TimeIndex bob(*params, store, store, MakeAgent(2));

    MockTimeScope time(TimeInChunk(7));

    ValidationState state;
    // Interleaved writes; each author chains independently
    for (int i = 1; i <= 4; ++i) {
        REQUIRE(alice.AddLink(TEST_INDEX, MakeTarget("A" + std::to_string(i)), i % 2 ? "odd" : "even", state));
        REQUIRE(bob.AddLink(TEST_INDEX, MakeTarget("B" + std::to_string(i)), "", state));
    }

    auto chunk = alice.GetCurrentChunk(TEST_INDEX, state);
    REQUIRE(chunk.has_value());

    SECTION("Ordered by author then sequence") {
        std::vector<EntryHash> expected;
        for (int i = 1; i <= 4; ++i) {
            expected.push_back(MakeTarget("A" + std::to_string(i)));
        }
        for (int i = 1; i <= 4; ++i) {
            expected.push_back(MakeTarget("B" + std::to_string(i)));
        }
        REQUIRE(alice.GetLinks(*chunk) == expected);
        REQUIRE(bob.GetLinks(*chunk) == expected);
    }

    SECTION("Tag filter does not cut the chain walk") {
        auto even = alice.GetLinks(*chunk, std::string("even"));
        REQUIRE(even == std::vector<EntryHash>{MakeTarget("A2"), MakeTarget("A4")});
    }

    SECTION("Repeated targets are returned once") {
        TimeIndex carol(*params, store, store, MakeAgent(3));
        REQUIRE(carol.AddLink(TEST_INDEX, MakeTarget("A1"), "", state));
        auto links = carol.GetLinks(*chunk);
        REQUIRE(links.size() == 8);
    }

    SECTION("Chains on other chunks are not followed") {
        MockTimeScope later(TimeInChunk(8));
        // Alice links A4 again on the next chunk; A4 is the tip target on chunk 7
        for (int i = 0; i < 3; ++i) {
            REQUIRE(alice.AddLink(TEST_INDEX, MakeTarget("A4"), "", state));
        }
        REQUIRE(alice.GetLinks(*chunk).size() == 8);
    }
}

TEST_CASE("Named indexes on the same window stay apart", "[query]") {
    auto params = MakeTestParams();
    store::MemoryStore store;
    TimeIndex index(*params, store, store, MakeAgent(1));

    MockTimeScope time(TimeInChunk(9));

    ValidationState state;
    auto post = index.AddLink("posts", MakeTarget("P1"), "", state);
    auto comment = index.AddLink("comments", MakeTarget("C1"), "", state);
    REQUIRE(post.has_value());
    REQUIRE(comment.has_value());
    REQUIRE(post->chunk != comment->chunk);

    auto posts = index.GetCurrentChunk("posts", state);
    auto comments = index.GetCurrentChunk("comments", state);
    REQUIRE(posts.has_value());
    REQUIRE(comments.has_value());
    REQUIRE(posts->index == comments->index);
    REQUIRE(posts->name == "posts");
    REQUIRE(comments->name == "comments");

    SECTION("Links are not shared") {
        REQUIRE(index.GetLinks(*posts) ==
                std::vector<EntryHash>{MakeTarget("P1")});
        REQUIRE(index.GetLinks(*comments) ==
                std::vector<EntryHash>{MakeTarget("C1")});
    }

    SECTION("Lookups only see their own name") {
        REQUIRE_FALSE(index.GetLatestChunk("other").has_value());
        REQUIRE(index.GetChunksForTimeSpan("posts", TimeInChunk(0),
                                           TimeInChunk(9))
                    .ToVector()
                    .size() == 1);

        auto recent = index.GetMostRecentIndex("comments", std::nullopt);
        REQUIRE(recent.has_value());
        REQUIRE(recent->targets == std::vector<EntryHash>{MakeTarget("C1")});

        ValidationState between;
        auto spans = index.GetIndexesBetween("posts", TimeInChunk(8),
                                             TimeInChunk(9), std::nullopt,
                                             between);
        REQUIRE(spans.has_value());
        REQUIRE(spans->size() == 1);
        REQUIRE((*spans)[0].chunk == *posts);
    }

    SECTION("IndexEntry files under the given name") {
        Entry entry = Entry::FromString("reply");
        auto record = index.IndexEntry("comments", entry, TimeInChunk(9), "",
                                       state);
        REQUIRE(record.has_value());
        REQUIRE(record->chunk == comments->GetHash());
        REQUIRE(index.GetLinks(*posts).size() == 1);
        REQUIRE(index.GetLinks(*comments).size() == 2);
    }
}

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <summon/core/progress.hpp>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace summon::core;

TEST_CASE("ChunkProgress::percent", "[progress]") {
    CHECK(ChunkProgress{0, 0, 1000}.percent() == 0);
    CHECK(ChunkProgress{0, 500, 1000}.percent() == 50);
    CHECK(ChunkProgress{0, 1000, 1000}.percent() == 100);

    SECTION("Rounds to nearest") {
        CHECK(ChunkProgress{0, 1, 3}.percent() == 33);
        CHECK(ChunkProgress{0, 2, 3}.percent() == 67);
        CHECK(ChunkProgress{0, 5, 1000}.percent() == 1);
    }

    SECTION("Empty chunk is done") {
        CHECK(ChunkProgress{0, 0, 0}.percent() == 100);
        CHECK(ChunkProgress{0, 0, 0}.complete());
    }
}

TEST_CASE("ChunkProgress::filled_cells", "[progress]") {
    CHECK(ChunkProgress{0, 0, 100}.filled_cells(40) == 0);
    CHECK(ChunkProgress{0, 50, 100}.filled_cells(40) == 20);
    CHECK(ChunkProgress{0, 100, 100}.filled_cells(40) == 40);

    // 67% of 10 cells floors to 6
    CHECK(ChunkProgress{0, 2, 3}.filled_cells(10) == 6);
}

TEST_CASE("ProgressTracker seeds and snapshots", "[progress]") {
    std::vector<ChunkProgress> seeds{{0, 0, 250}, {1, 100, 250}, {2, 250, 250}};
    ProgressTracker tracker(seeds);

    CHECK(tracker.size() == 3);
    CHECK(tracker.snapshot(1) == ChunkProgress{1, 100, 250});
    CHECK(tracker.total() == 750);
    CHECK(tracker.downloaded() == 350);

    tracker.increment(0, 10);
    tracker.increment(0, 15);
    CHECK(tracker.snapshot(0).curr == 25);

    SECTION("snapshot_all is in ascending index order") {
        auto frame = tracker.snapshot_all();
        REQUIRE(frame.size() == 3);
        for (std::size_t i = 0; i < frame.size(); ++i) {
            CHECK(frame[i].index == i);
        }
        CHECK(frame[2].complete());
    }

    SECTION("Unknown index is ignored") {
        tracker.increment(7, 100);
        CHECK(tracker.downloaded() == 375);
    }
}

TEST_CASE("ProgressTracker rejects unordered seeds", "[progress]") {
    std::vector<ChunkProgress> seeds{{1, 0, 10}, {0, 0, 10}};
    CHECK_THROWS_AS(ProgressTracker(seeds), std::invalid_argument);
}

TEST_CASE("ProgressTracker loses no concurrent increments", "[progress]") {
    constexpr std::uint32_t chunks = 8;
    constexpr std::uint32_t rounds = 20'000;

    std::vector<ChunkProgress> seeds;
    for (std::uint32_t i = 0; i < chunks; ++i) {
        seeds.push_back({i, 0, rounds * 3ull * 2});
    }
    ProgressTracker tracker(seeds);

    // Two writers per index to stress the counters as well
    std::vector<std::jthread> writers;
    for (std::uint32_t i = 0; i < chunks * 2; ++i) {
        writers.emplace_back([&tracker, i] {
            for (std::uint32_t r = 0; r < rounds; ++r) {
                tracker.increment(i % chunks, 3);
            }
        });
    }
    writers.clear();

    for (std::uint32_t i = 0; i < chunks; ++i) {
        CHECK(tracker.snapshot(i).curr == rounds * 3ull * 2);
    }
    CHECK(tracker.downloaded() == tracker.total());
}

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <summon/core/resume_state.hpp>
#include "test_support.hpp"

using namespace summon::core;
using summon::test::TempDir;
using summon::test::write_file;

namespace {

std::vector<ChunkRange> plan_1000() {
    return *plan_ranges(1000, 4);
}

} // namespace

TEST_CASE("reconcile without records returns the plan", "[resume]") {
    auto plan = plan_1000();
    auto result = reconcile(plan, {});
    REQUIRE(result.has_value());

    CHECK(result->pending == plan);
    REQUIRE(result->progress.size() == 4);
    for (const auto& p : result->progress) {
        CHECK(p.curr == 0);
        CHECK(p.total == 250);
    }
}

TEST_CASE("reconcile advances partial chunks", "[resume]") {
    auto plan = plan_1000();
    std::vector<ResumeRecord> records{{0, 100}, {1, 0}, {2, 249}, {3, 0}};

    auto result = reconcile(plan, records);
    REQUIRE(result.has_value());
    REQUIRE(result->pending.size() == 4);

    CHECK(result->pending[0] == ChunkRange{0, 100, 249});
    CHECK(result->pending[1] == ChunkRange{1, 250, 499});
    CHECK(result->pending[2] == ChunkRange{2, 749, 749});

    CHECK(result->progress[0] == ChunkProgress{0, 100, 250});
    CHECK(result->progress[2] == ChunkProgress{2, 249, 250});
}

TEST_CASE("reconcile skips complete chunks", "[resume]") {
    auto plan = plan_1000();
    std::vector<ResumeRecord> records{{0, 250}, {1, 10}, {2, 250}, {3, 250}};

    auto result = reconcile(plan, records);
    REQUIRE(result.has_value());
    REQUIRE(result->pending.size() == 1);
    CHECK(result->pending[0] == ChunkRange{1, 260, 499});

    // Every chunk still has a progress entry
    REQUIRE(result->progress.size() == 4);
    CHECK(result->progress[0].complete());
    CHECK(result->progress[3].complete());
    CHECK_FALSE(result->progress[1].complete());
}

TEST_CASE("reconcile rejects inconsistent state", "[resume]") {
    auto plan = plan_1000();
    const auto corrupt = make_error_code(DownloadErrc::corrupt_resume_state);

    SECTION("More bytes than the range holds") {
        std::vector<ResumeRecord> records{{0, 0}, {1, 251}};
        auto result = reconcile(plan, records);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == corrupt);
    }

    SECTION("Unknown chunk") {
        std::vector<ResumeRecord> records{{4, 10}};
        auto result = reconcile(plan, records);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == corrupt);
    }
}

TEST_CASE("load_records reads chunk file sizes", "[resume]") {
    TempDir dir;
    std::vector<std::string> paths{dir.file("a.part0"), dir.file("a.part1"), dir.file("a.part2")};
    write_file(paths[0], std::string(120, 'x'));
    write_file(paths[2], std::string(7, 'y'));

    auto records = load_records(paths);
    REQUIRE(records.has_value());
    REQUIRE(records->size() == 3);

    CHECK((*records)[0].index == 0);
    CHECK((*records)[0].bytes_written == 120);
    CHECK((*records)[1].bytes_written == 0);   // Missing
    CHECK((*records)[2].bytes_written == 7);
}

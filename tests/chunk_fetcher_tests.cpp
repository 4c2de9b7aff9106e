// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <summon/core/chunk_fetcher.hpp>
#include "test_support.hpp"
#include <vector>

using namespace summon;
using namespace summon::core;
using summon::test::MemoryTransport;
using summon::test::TempDir;
using summon::test::make_payload;
using summon::test::read_file;

namespace {

struct FetchFixture {
    TempDir dir;
    std::string body = make_payload(1000);
    MemoryTransport transport{body};
    ChunkRange range{1, 250, 499};
    std::vector<ChunkProgress> seeds{{0, 0, 250}, {1, 0, 250}};
    ProgressTracker progress{seeds};
    disk::File file = *disk::File::open(dir.file(".out.part1"), disk::OpenMode::truncate);

    std::string written() {
        file.close();
        return read_file(dir.file(".out.part1"));
    }
};

} // namespace

TEST_CASE_METHOD(FetchFixture, "ChunkFetcher streams its range into the chunk file", "[fetcher]") {
    ChunkFetcher fetcher(transport, "http://example.com/f", range, file, progress);

    auto ec = fetcher.fetch({});
    REQUIRE_FALSE(ec);
    CHECK(fetcher.http_status() == 206);
    CHECK(fetcher.received() == 250);

    CHECK(progress.snapshot(1) == ChunkProgress{1, 250, 250});
    CHECK(progress.snapshot(0).curr == 0);

    auto requests = transport.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0] == std::pair<std::uint64_t, std::uint64_t>{250, 499});

    CHECK(written() == body.substr(250, 250));
}

TEST_CASE_METHOD(FetchFixture, "ChunkFetcher rejects unexpected status", "[fetcher]") {
    transport.fail_range(250, 404);
    ChunkFetcher fetcher(transport, "http://example.com/f", range, file, progress);

    auto ec = fetcher.fetch({});
    CHECK(ec == make_error_code(DownloadErrc::unexpected_status));
    CHECK(fetcher.http_status() == 404);
    CHECK(progress.snapshot(1).curr == 0);
    CHECK(written().empty());
}

TEST_CASE_METHOD(FetchFixture, "ChunkFetcher accepts a plain 200 for the whole resource", "[fetcher]") {
    ChunkRange whole{0, 0, 999};
    std::vector<ChunkProgress> one{{0, 0, 1000}};
    ProgressTracker single(one);
    transport.ignore_ranges(true);

    ChunkFetcher fetcher(transport, "http://example.com/f", whole, file, single);
    REQUIRE_FALSE(fetcher.fetch({}));
    CHECK(fetcher.http_status() == 200);
    CHECK(written() == body);
}

TEST_CASE_METHOD(FetchFixture, "ChunkFetcher detects a server ignoring Range", "[fetcher]") {
    transport.ignore_ranges(true);
    ChunkFetcher fetcher(transport, "http://example.com/f", range, file, progress);

    auto ec = fetcher.fetch({});
    CHECK(ec == make_error_code(DownloadErrc::length_mismatch));
    CHECK(progress.snapshot(1).curr <= 250);
}

TEST_CASE_METHOD(FetchFixture, "ChunkFetcher stops on request", "[fetcher]") {
    SECTION("Before the request is sent") {
        std::stop_source stop;
        stop.request_stop();
        ChunkFetcher fetcher(transport, "http://example.com/f", range, file, progress);

        CHECK(fetcher.fetch(stop.get_token()) == make_error_code(DownloadErrc::cancelled));
        CHECK(transport.requests().empty());
    }

    SECTION("Between buffers") {
        std::stop_source stop;
        transport.buffer_size(50);
        transport.on_buffer([&stop](std::uint64_t, std::uint64_t sent) {
            if (sent >= 100) stop.request_stop();
        });
        ChunkFetcher fetcher(transport, "http://example.com/f", range, file, progress);

        CHECK(fetcher.fetch(stop.get_token()) == make_error_code(DownloadErrc::cancelled));
        CHECK(fetcher.received() == 100);
        CHECK(progress.snapshot(1).curr == 100);
        CHECK(written() == body.substr(250, 100));
    }
}

TEST_CASE_METHOD(FetchFixture, "ChunkFetcher returns transport errors", "[fetcher]") {
    transport.buffer_size(40);
    transport.fail_after(250, 100, make_error_code(DownloadErrc::network_error));
    ChunkFetcher fetcher(transport, "http://example.com/f", range, file, progress);

    CHECK(fetcher.fetch({}) == make_error_code(DownloadErrc::network_error));
    CHECK(fetcher.received() == 100);
    CHECK(progress.snapshot(1).curr == 100);
    CHECK(written() == body.substr(250, 100));
}

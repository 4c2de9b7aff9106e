// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <summon/core/error.hpp>
#include <summon/core/http_session.hpp>
#include <summon/core/progress.hpp>
#include <summon/core/range_planner.hpp>
#include <summon/disk/file.hpp>
#include <cstdint>
#include <string>
#include <stop_token>

namespace summon::core {

// Downloads one chunk: a ranged GET streamed into the chunk's own file.
// Writes only to its file and to its own progress entry.
class ChunkFetcher final : public BodySink {
public:
    ChunkFetcher(Transport& transport, std::string url, ChunkRange range,
                 disk::File& file, ProgressTracker& progress) noexcept;

    // Non-copyable, non-movable (the transport holds a pointer while fetching)
    ChunkFetcher(const ChunkFetcher&) = delete;
    ChunkFetcher& operator=(const ChunkFetcher&) = delete;

    // Run the transfer to completion. Returns cancelled when stop was
    // requested, unexpected_status for anything but 200/206, length_mismatch
    // when the body does not match the range, or the transport/disk error.
    [[nodiscard]] std::error_code fetch(std::stop_token stop) noexcept;

    [[nodiscard]] const ChunkRange& range() const noexcept { return range_; }
    [[nodiscard]] std::int32_t http_status() const noexcept { return status_; }
    [[nodiscard]] std::uint64_t received() const noexcept { return received_; }

    // BodySink
    [[nodiscard]] std::error_code on_status(std::int32_t status) noexcept override;
    [[nodiscard]] std::error_code on_data(const char* data, std::size_t size) noexcept override;
    [[nodiscard]] bool stop_requested() const noexcept override { return stop_.stop_requested(); }

private:
    Transport& transport_;
    std::string url_;
    ChunkRange range_;
    disk::File& file_;
    ProgressTracker& progress_;

    std::stop_token stop_;
    std::int32_t status_{0};
    std::uint64_t received_{0};
};

} // namespace summon::core

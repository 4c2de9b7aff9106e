// Copyright (c) 2026 changcheng967. All rights reserved.

#include <summon/core/range_planner.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace summon::core {

std::expected<std::vector<ChunkRange>, std::error_code>
plan_ranges(std::int64_t content_length, std::int64_t concurrency, bool range_supported) noexcept {
    if (content_length <= 0 || concurrency <= 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_input));
    }

    if (!range_supported && concurrency > 1) {
        spdlog::info("Server does not support byte ranges, using a single connection");
        concurrency = 1;
    }

    // Every range holds at least one byte
    concurrency = std::min(concurrency, content_length);

    const auto length = static_cast<std::uint64_t>(content_length);
    const auto count = static_cast<std::uint32_t>(concurrency);
    const std::uint64_t span = length / count;

    std::vector<ChunkRange> ranges;
    try {
        ranges.reserve(count);
    } catch (...) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_input));
    }

    for (std::uint32_t i = 0; i < count; ++i) {
        ChunkRange range;
        range.index = i;
        range.start = static_cast<std::uint64_t>(i) * span;
        range.end = (i + 1 == count) ? length - 1 : range.start + span - 1;
        ranges.push_back(range);
    }

    return ranges;
}

} // namespace summon::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <summon/core/error.hpp>
#include <cstdint>
#include <expected>
#include <vector>

namespace summon::core {

// Inclusive byte span [start, end] of the remote resource
struct ChunkRange {
    std::uint32_t index{0};
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] constexpr std::uint64_t length() const noexcept { return end - start + 1; }

    constexpr bool operator==(const ChunkRange&) const = default;
};

// Split [0, content_length - 1] into `concurrency` contiguous ranges; the
// last one absorbs the remainder. Without range support the whole resource
// is a single range. invalid_input if either argument is not positive.
[[nodiscard]] std::expected<std::vector<ChunkRange>, std::error_code>
plan_ranges(std::int64_t content_length, std::int64_t concurrency, bool range_supported = true) noexcept;

} // namespace summon::core

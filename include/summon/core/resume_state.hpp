// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <summon/core/error.hpp>
#include <summon/core/progress.hpp>
#include <summon/core/range_planner.hpp>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace summon::core {

// Bytes a previous run already wrote for one chunk
struct ResumeRecord {
    std::uint32_t index{0};
    std::uint64_t bytes_written{0};
};

struct Reconciled {
    std::vector<ChunkRange> pending;      // Ranges still to fetch, start advanced past written bytes
    std::vector<ChunkProgress> progress;  // One seed per planned chunk, ascending index
};

// Fold on-disk state into a fresh plan. Fully written chunks are left out of
// `pending` and seeded as complete. corrupt_resume_state when a record
// claims more bytes than its range holds or names an unknown chunk.
// With no records the result is the plan itself with zeroed progress.
[[nodiscard]] std::expected<Reconciled, std::error_code>
reconcile(std::span<const ChunkRange> plan, std::span<const ResumeRecord> on_disk) noexcept;

// One record per path, from the file sizes; missing files count as empty
[[nodiscard]] std::expected<std::vector<ResumeRecord>, std::error_code>
load_records(std::span<const std::string> chunk_paths) noexcept;

} // namespace summon::core

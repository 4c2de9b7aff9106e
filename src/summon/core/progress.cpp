// Copyright (c) 2026 changcheng967. All rights reserved.

#include <summon/core/progress.hpp>
#include <cmath>
#include <stdexcept>

namespace summon::core {

//=============================================================================
// ChunkProgress
//=============================================================================

std::uint32_t ChunkProgress::percent() const noexcept {
    if (total == 0) return 100;
    double ratio = static_cast<double>(curr) / static_cast<double>(total);
    return static_cast<std::uint32_t>(std::round(ratio * 100.0));
}

std::uint32_t ChunkProgress::filled_cells(std::uint32_t width) const noexcept {
    double cells = static_cast<double>(percent()) / 100.0 * static_cast<double>(width);
    auto filled = static_cast<std::uint32_t>(std::floor(cells));
    return filled > width ? width : filled;
}

//=============================================================================
// ProgressTracker
//=============================================================================

ProgressTracker::ProgressTracker(std::span<const ChunkProgress> seeds)
    : counters_(std::make_unique<Counter[]>(seeds.size()))
    , count_(seeds.size()) {
    for (std::size_t i = 0; i < seeds.size(); ++i) {
        if (seeds[i].index != i) {
            throw std::invalid_argument("progress seeds must be ordered by chunk index");
        }
        counters_[i].curr.store(seeds[i].curr, std::memory_order_relaxed);
        counters_[i].total = seeds[i].total;
    }
}

void ProgressTracker::increment(std::uint32_t index, std::uint64_t delta) noexcept {
    if (index >= count_) return;
    counters_[index].curr.fetch_add(delta, std::memory_order_relaxed);
}

ChunkProgress ProgressTracker::snapshot(std::uint32_t index) const noexcept {
    if (index >= count_) return {index, 0, 0};
    return {index, counters_[index].curr.load(std::memory_order_relaxed), counters_[index].total};
}

std::vector<ChunkProgress> ProgressTracker::snapshot_all() const {
    std::vector<ChunkProgress> frame;
    frame.reserve(count_);
    for (std::size_t i = 0; i < count_; ++i) {
        frame.push_back(snapshot(static_cast<std::uint32_t>(i)));
    }
    return frame;
}

std::uint64_t ProgressTracker::downloaded() const noexcept {
    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < count_; ++i) {
        sum += counters_[i].curr.load(std::memory_order_relaxed);
    }
    return sum;
}

std::uint64_t ProgressTracker::total() const noexcept {
    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < count_; ++i) {
        sum += counters_[i].total;
    }
    return sum;
}

} // namespace summon::core

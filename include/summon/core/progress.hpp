// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <cstddef>
#include <atomic>
#include <memory>
#include <span>
#include <vector>

namespace summon::core {

// Bytes received so far for one chunk
struct ChunkProgress {
    std::uint32_t index{0};
    std::uint64_t curr{0};
    std::uint64_t total{0};

    // round(curr / total * 100); an empty chunk counts as done
    [[nodiscard]] std::uint32_t percent() const noexcept;

    // floor(percent / 100 * width)
    [[nodiscard]] std::uint32_t filled_cells(std::uint32_t width) const noexcept;

    [[nodiscard]] bool complete() const noexcept { return curr >= total; }

    bool operator==(const ChunkProgress&) const = default;
};

// Per-chunk counters shared by all fetchers of a job. Each fetcher only
// touches its own index, so counters are independent atomics instead of a
// map behind one lock.
class ProgressTracker {
public:
    // seeds[i].index must equal i
    explicit ProgressTracker(std::span<const ChunkProgress> seeds);

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    void increment(std::uint32_t index, std::uint64_t delta) noexcept;

    [[nodiscard]] ChunkProgress snapshot(std::uint32_t index) const noexcept;

    // Every chunk in ascending index order
    [[nodiscard]] std::vector<ChunkProgress> snapshot_all() const;

    [[nodiscard]] std::size_t size() const noexcept { return count_; }
    [[nodiscard]] std::uint64_t downloaded() const noexcept;
    [[nodiscard]] std::uint64_t total() const noexcept;

private:
    struct Counter {
        std::atomic<std::uint64_t> curr{0};
        std::uint64_t total{0};
    };

    std::unique_ptr<Counter[]> counters_;
    std::size_t count_{0};
};

} // namespace summon::core

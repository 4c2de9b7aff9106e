// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <summon/core/error.hpp>
#include <summon/core/config.hpp>
#include <summon/core/http_session.hpp>
#include <summon/core/progress.hpp>
#include <summon/core/range_planner.hpp>
#include <summon/disk/file.hpp>
#include <cstdint>
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <stop_token>
#include <vector>

namespace summon::core {

// Everything the job needs, resolved by the caller
struct DownloadOptions {
    std::string url;
    std::string output_path;        // Absolute destination path
    ResourceInfo resource;          // Result of probe()
    std::uint32_t connections{DEFAULT_CONNECTIONS};
    bool resume{false};
    std::chrono::milliseconds progress_interval{PROGRESS_INTERVAL};
};

// Called from the reporter thread on every tick with all chunks in index
// order, and exactly once more with final = true after every fetcher ended.
using ProgressCallback = std::function<void(std::span<const ChunkProgress> frame, bool final)>;

// Runs one chunked download: plan (or reconcile a previous run), fetch all
// chunks concurrently, then combine them into the output file.
class DownloadEngine {
public:
    DownloadEngine(Transport& transport, DownloadOptions options);

    // Non-copyable, non-movable (fetch threads reference members)
    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;
    DownloadEngine(DownloadEngine&&) noexcept = delete;
    DownloadEngine& operator=(DownloadEngine&&) noexcept = delete;

    // Set progress callback (before run)
    void callback(ProgressCallback cb) noexcept { callback_ = std::move(cb); }

    // Blocks until the job ends. Returns the bytes written to the output
    // file. A stop through `stop` ends the job with cancelled, keeping the
    // chunk files for a later resume.
    [[nodiscard]] std::expected<std::uint64_t, JobError> run(std::stop_token stop = {}) noexcept;

    [[nodiscard]] const DownloadOptions& options() const noexcept { return options_; }

    // The full plan of the last run (before resume adjustments)
    [[nodiscard]] const std::vector<ChunkRange>& ranges() const noexcept { return ranges_; }

private:
    // Plan or reconcile, open every file, persist the sidecar
    [[nodiscard]] std::expected<std::vector<ChunkRange>, JobError> prepare() noexcept;

    // Ranges of a previous run if its sidecar matches this resource, empty
    // when there is no sidecar
    [[nodiscard]] std::expected<std::vector<ChunkRange>, JobError> previous_plan() const noexcept;

    // Launch one fetcher per pending range, join them and the reporter
    [[nodiscard]] std::optional<JobError> fetch_all(std::span<const ChunkRange> pending,
                                                    std::stop_token stop) noexcept;

    // Reporter thread body
    void report_loop(std::stop_token stop) noexcept;

    void emit(bool final) noexcept;
    void close_files(bool remove_temp) noexcept;
    void remove_chunk_files() noexcept;

    // Chunk files of an earlier, wider plan
    void remove_stale_chunks() noexcept;

    Transport& transport_;
    DownloadOptions options_;
    ProgressCallback callback_;

    std::vector<ChunkRange> ranges_;
    std::unique_ptr<ProgressTracker> progress_;
    std::vector<disk::File> chunk_files_;
    std::optional<disk::File> temp_file_;
};

} // namespace summon::core

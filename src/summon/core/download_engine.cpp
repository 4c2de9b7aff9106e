// Copyright (c) 2026 changcheng967. All rights reserved.

#include <summon/core/download_engine.hpp>
#include <summon/core/chunk_fetcher.hpp>
#include <summon/core/combiner.hpp>
#include <summon/core/download_meta.hpp>
#include <summon/core/resume_state.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <new>
#include <system_error>
#include <thread>

namespace summon::core {

namespace {

// First failure wins; later ones (usually fallout of the stop it caused) are dropped
class FirstError {
public:
    bool set(JobError error) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        if (error_) return false;
        error_ = std::move(error);
        return true;
    }

    [[nodiscard]] std::optional<JobError> get() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_;
    }

private:
    mutable std::mutex mutex_;
    std::optional<JobError> error_;
};

JobError job_error(std::error_code ec, std::uint32_t chunk = 0) noexcept {
    return JobError{ec, chunk, 0};
}

} // namespace

//=============================================================================
// DownloadEngine
//=============================================================================

DownloadEngine::DownloadEngine(Transport& transport, DownloadOptions options)
    : transport_(transport)
    , options_(std::move(options)) {}

std::expected<std::uint64_t, JobError> DownloadEngine::run(std::stop_token stop) noexcept {
    auto pending = prepare();
    if (!pending) {
        close_files(true);
        return std::unexpected(pending.error());
    }

    spdlog::info("Downloading {} ({} bytes) with {} connection(s), {} chunk(s) to fetch",
                 options_.url, options_.resource.content_length, ranges_.size(), pending->size());

    if (auto failure = fetch_all(*pending, stop)) {
        close_files(true);
        if (failure->cancelled()) {
            spdlog::info("Download stopped; chunk files kept for --resume");
        } else {
            spdlog::error("Download failed: {}", failure->message());
        }
        return std::unexpected(*failure);
    }

    std::vector<disk::File*> handles;
    try {
        handles.reserve(chunk_files_.size());
        for (auto& file : chunk_files_) {
            handles.push_back(&file);
        }
    } catch (const std::bad_alloc&) {
        close_files(true);
        return std::unexpected(job_error(std::make_error_code(std::errc::not_enough_memory)));
    }

    spdlog::info("Combining {} chunk(s)", handles.size());
    auto written = combine_chunks(handles, *temp_file_, options_.output_path,
                                  options_.resource.content_length);
    if (!written) {
        // A failed rename keeps the combined temp file for manual recovery
        const bool keep_temp = written.error().code == make_error_code(DownloadErrc::rename_failed);
        close_files(!keep_temp);
        return std::unexpected(written.error());
    }

    // The temp file now lives at output_path
    temp_file_->close();
    temp_file_.reset();
    close_files(false);
    remove_chunk_files();
    DownloadMeta::remove(options_.output_path);

    spdlog::info("Wrote {} bytes to {}", *written, options_.output_path);
    return *written;
}

std::expected<std::vector<ChunkRange>, JobError> DownloadEngine::prepare() noexcept {
    try {
        const auto& resource = options_.resource;
        std::uint32_t concurrency = options_.connections;
        bool resume = options_.resume;

        if (resume && !resource.accepts_ranges) {
            spdlog::warn("Server does not support byte ranges, cannot resume; starting over");
            resume = false;
        }

        if (resume) {
            auto previous = previous_plan();
            if (!previous) {
                return std::unexpected(previous.error());
            }
            if (!previous->empty()) {
                concurrency = static_cast<std::uint32_t>(previous->size());
            }
        }

        auto plan = plan_ranges(static_cast<std::int64_t>(resource.content_length),
                                static_cast<std::int64_t>(concurrency), resource.accepts_ranges);
        if (!plan) {
            return std::unexpected(job_error(plan.error()));
        }
        ranges_ = std::move(*plan);

        std::vector<std::string> paths;
        paths.reserve(ranges_.size());
        for (const auto& range : ranges_) {
            paths.push_back(DownloadMeta::chunk_path(options_.output_path, range.index));
        }

        std::vector<ResumeRecord> records;
        if (resume) {
            auto loaded = load_records(paths);
            if (!loaded) {
                return std::unexpected(job_error(loaded.error()));
            }
            records = std::move(*loaded);
        }

        auto reconciled = reconcile(ranges_, records);
        if (!reconciled) {
            return std::unexpected(job_error(reconciled.error()));
        }

        // Without a sidecar the chunk files could never be resumed safely
        DownloadMeta meta;
        meta.url = options_.url;
        meta.content_length = resource.content_length;
        meta.accepts_ranges = resource.accepts_ranges;
        meta.ranges = ranges_;
        if (auto ec = meta.save(DownloadMeta::meta_path(options_.output_path))) {
            spdlog::error("Could not save resume state: {}", ec.message());
            return std::unexpected(job_error(ec));
        }

        if (!resume) {
            remove_stale_chunks();
        }
        progress_ = std::make_unique<ProgressTracker>(reconciled->progress);

        // Every handle is acquired before the first fetch starts
        chunk_files_.clear();
        chunk_files_.reserve(paths.size());
        const auto mode = resume ? disk::OpenMode::append : disk::OpenMode::truncate;
        for (std::size_t i = 0; i < paths.size(); ++i) {
            auto file = disk::File::open(paths[i], mode);
            if (!file) {
                spdlog::error("Cannot open chunk file {}: {}", paths[i], file.error().message());
                return std::unexpected(job_error(file.error(), static_cast<std::uint32_t>(i)));
            }
            chunk_files_.push_back(std::move(*file));
        }

        std::filesystem::path output(options_.output_path);
        auto temp = disk::File::create_temp(output.parent_path().string(), output.filename().string());
        if (!temp) {
            spdlog::error("Cannot create temporary output in {}: {}",
                          output.parent_path().string(), temp.error().message());
            return std::unexpected(job_error(temp.error()));
        }
        temp_file_.emplace(std::move(*temp));

        return std::move(reconciled->pending);
    } catch (const std::exception& e) {
        spdlog::error("Preparing download failed: {}", e.what());
        return std::unexpected(job_error(std::make_error_code(std::errc::not_enough_memory)));
    }
}

std::expected<std::vector<ChunkRange>, JobError> DownloadEngine::previous_plan() const noexcept {
    try {
        const auto corrupt = std::unexpected(job_error(make_error_code(DownloadErrc::corrupt_resume_state)));

        if (!DownloadMeta::exists(options_.output_path)) {
            // Chunk bytes without the plan that produced them cannot be placed
            for (const auto& path : DownloadMeta::existing_chunks(options_.output_path)) {
                auto size = disk::file_size(path);
                if (!size || *size > 0) {
                    spdlog::error("Found {} but no resume state describing it", path);
                    return corrupt;
                }
            }
            spdlog::info("No resume state next to {}, using {} connection(s)",
                         options_.output_path, options_.connections);
            return std::vector<ChunkRange>{};
        }

        auto meta = DownloadMeta::load(DownloadMeta::meta_path(options_.output_path));
        if (!meta) {
            spdlog::error("Resume state is unreadable: {}", meta.error().message());
            return corrupt;
        }

        if (meta->url != options_.url || meta->content_length != options_.resource.content_length) {
            spdlog::error("Resume state belongs to a different download ({}, {} bytes)",
                          meta->url, meta->content_length);
            return corrupt;
        }

        // The sidecar must describe exactly the plan we would make again
        auto replanned = plan_ranges(static_cast<std::int64_t>(meta->content_length),
                                     static_cast<std::int64_t>(meta->ranges.size()),
                                     options_.resource.accepts_ranges);
        if (!replanned || *replanned != meta->ranges) {
            spdlog::error("Resume state ranges do not match a {}-way plan", meta->ranges.size());
            return corrupt;
        }

        spdlog::info("Resuming with {} connection(s) from the previous run", meta->ranges.size());
        return std::move(meta->ranges);
    } catch (const std::exception& e) {
        spdlog::error("Reading resume state failed: {}", e.what());
        return std::unexpected(job_error(make_error_code(DownloadErrc::corrupt_resume_state)));
    }
}

std::optional<JobError> DownloadEngine::fetch_all(std::span<const ChunkRange> pending,
                                                  std::stop_token stop) noexcept {
    std::stop_source job_stop;
    // An external stop reaches every fetcher through the job's own source
    std::stop_callback forward(stop, [&job_stop] { job_stop.request_stop(); });

    FirstError first_error;
    std::atomic<bool> interrupted{false};

    std::jthread reporter;
    try {
        if (callback_) {
            reporter = std::jthread([this](std::stop_token st) { report_loop(st); });
        }

        std::vector<std::jthread> fetchers;
        fetchers.reserve(pending.size());
        try {
            for (const auto& range : pending) {
                fetchers.emplace_back([&, range] {
                    ChunkFetcher fetcher(transport_, options_.url, range,
                                         chunk_files_[range.index], *progress_);
                    auto ec = fetcher.fetch(job_stop.get_token());
                    if (!ec) {
                        return;
                    }
                    if (ec == make_error_code(DownloadErrc::cancelled)) {
                        interrupted.store(true, std::memory_order_relaxed);
                        return;
                    }
                    first_error.set(JobError{ec, range.index, fetcher.http_status()});
                    job_stop.request_stop();
                });
            }
        } catch (const std::system_error& e) {
            spdlog::error("Cannot start fetch thread: {}", e.what());
            first_error.set(job_error(e.code()));
            job_stop.request_stop();
        }

        // Wait for every fetcher before touching the results
        for (auto& fetcher : fetchers) {
            fetcher.join();
        }
    } catch (const std::exception& e) {
        spdlog::error("Fetch supervision failed: {}", e.what());
        first_error.set(job_error(std::make_error_code(std::errc::resource_unavailable_try_again)));
        job_stop.request_stop();
    }

    // The reporter draws its final frame and exits; joining is its acknowledgment
    if (reporter.joinable()) {
        reporter.request_stop();
        reporter.join();
    }

    if (auto error = first_error.get()) {
        return error;
    }
    if (interrupted.load(std::memory_order_relaxed)) {
        return job_error(make_error_code(DownloadErrc::cancelled));
    }
    return std::nullopt;
}

void DownloadEngine::report_loop(std::stop_token stop) noexcept {
    std::mutex mutex;
    std::condition_variable_any wakeup;
    std::unique_lock<std::mutex> lock(mutex);

    while (!wakeup.wait_for(lock, stop, options_.progress_interval,
                            [&stop] { return stop.stop_requested(); })) {
        emit(false);
    }
    emit(true);
}

void DownloadEngine::emit(bool final) noexcept {
    try {
        auto frame = progress_->snapshot_all();
        callback_(frame, final);
    } catch (const std::exception& e) {
        spdlog::warn("Progress callback failed: {}", e.what());
    }
}

void DownloadEngine::close_files(bool remove_temp) noexcept {
    for (auto& file : chunk_files_) {
        file.close();
    }
    if (temp_file_) {
        std::string path = temp_file_->path();
        temp_file_->close();
        if (remove_temp) {
            (void)disk::remove_file(path);
        }
        temp_file_.reset();
    }
}

void DownloadEngine::remove_chunk_files() noexcept {
    try {
        for (const auto& path : DownloadMeta::existing_chunks(options_.output_path)) {
            if (auto ec = disk::remove_file(path)) {
                spdlog::warn("Could not remove {}: {}", path, ec.message());
            }
        }
    } catch (const std::exception& e) {
        spdlog::warn("Could not remove chunk files: {}", e.what());
    }
}

void DownloadEngine::remove_stale_chunks() noexcept {
    try {
        for (const auto& path : DownloadMeta::existing_chunks(options_.output_path)) {
            const auto in_plan = std::any_of(ranges_.begin(), ranges_.end(), [&](const ChunkRange& range) {
                return DownloadMeta::chunk_path(options_.output_path, range.index) == path;
            });
            if (in_plan) {
                continue;
            }
            spdlog::debug("Removing {} left by an earlier run", path);
            if (auto ec = disk::remove_file(path)) {
                spdlog::warn("Could not remove {}: {}", path, ec.message());
            }
        }
    } catch (const std::exception& e) {
        spdlog::warn("Could not remove stale chunk files: {}", e.what());
    }
}

} // namespace summon::core

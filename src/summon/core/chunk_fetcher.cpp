// Copyright (c) 2026 changcheng967. All rights reserved.

#include <summon/core/chunk_fetcher.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

namespace summon::core {

ChunkFetcher::ChunkFetcher(Transport& transport, std::string url, ChunkRange range,
                           disk::File& file, ProgressTracker& progress) noexcept
    : transport_(transport)
    , url_(std::move(url))
    , range_(range)
    , file_(file)
    , progress_(progress) {}

std::error_code ChunkFetcher::fetch(std::stop_token stop) noexcept {
    stop_ = std::move(stop);
    status_ = 0;
    received_ = 0;

    if (stop_.stop_requested()) {
        return make_error_code(DownloadErrc::cancelled);
    }

    spdlog::debug("Chunk {}: downloading bytes={}-{}", range_.index + 1, range_.start, range_.end);
    const auto started = std::chrono::steady_clock::now();

    auto ec = transport_.get(url_, range_.start, range_.end, *this);
    if (!ec && received_ != range_.length()) {
        spdlog::warn("Chunk {}: received {} bytes, expected {}", range_.index + 1, received_, range_.length());
        ec = make_error_code(DownloadErrc::length_mismatch);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (!ec) {
        spdlog::debug("Chunk {}: done in {} ms", range_.index + 1, elapsed.count());
    } else if (ec == make_error_code(DownloadErrc::cancelled)) {
        spdlog::debug("Chunk {}: stopped after {} bytes", range_.index + 1, received_);
    } else {
        spdlog::debug("Chunk {}: failed after {} ms: {}", range_.index + 1, elapsed.count(), ec.message());
    }
    return ec;
}

std::error_code ChunkFetcher::on_status(std::int32_t status) noexcept {
    status_ = status;
    // 206 = Partial Content
    if (status != 200 && status != 206) {
        spdlog::error("Chunk {}: server answered {} to bytes={}-{}",
                      range_.index + 1, status, range_.start, range_.end);
        return make_error_code(DownloadErrc::unexpected_status);
    }
    return {};
}

std::error_code ChunkFetcher::on_data(const char* data, std::size_t size) noexcept {
    if (stop_.stop_requested()) {
        return make_error_code(DownloadErrc::cancelled);
    }

    // A server that ignores Range sends more than the chunk holds
    if (received_ + size > range_.length()) {
        spdlog::warn("Chunk {}: response body is larger than bytes={}-{}",
                     range_.index + 1, range_.start, range_.end);
        return make_error_code(DownloadErrc::length_mismatch);
    }

    if (auto ec = file_.write(data, size)) {
        spdlog::error("Chunk {}: write to {} failed: {}", range_.index + 1, file_.path(), ec.message());
        return ec;
    }

    received_ += size;
    progress_.increment(range_.index, size);
    return {};
}

} // namespace summon::core

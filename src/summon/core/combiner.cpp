// Copyright (c) 2026 changcheng967. All rights reserved.

#include <summon/core/combiner.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>

namespace summon::core {

std::expected<std::uint64_t, JobError>
combine_chunks(std::span<disk::File* const> chunks, disk::File& temp,
               const std::string& final_path, std::uint64_t expected_bytes) noexcept {
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i] == nullptr || !chunks[i]->is_open()) {
            return std::unexpected(JobError{make_error_code(DownloadErrc::missing_chunk),
                                            static_cast<std::uint32_t>(i), 0});
        }
    }

    spdlog::debug("Combining {} chunks into {}", chunks.size(), temp.path());

    // Strictly ascending: any other order corrupts the output
    std::uint64_t written = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        auto* chunk = chunks[i];
        const auto index = static_cast<std::uint32_t>(i);

        // Fetchers leave the cursor at the end of what they wrote
        if (auto ec = chunk->rewind()) {
            return std::unexpected(JobError{ec, index, 0});
        }

        auto copied = chunk->copy_to(temp);
        if (!copied) {
            spdlog::error("Copying chunk {} into {} failed: {}", i + 1, temp.path(), copied.error().message());
            return std::unexpected(JobError{copied.error(), index, 0});
        }
        written += *copied;
    }

    if (expected_bytes != 0 && written != expected_bytes) {
        spdlog::error("Combined {} bytes, expected {}", written, expected_bytes);
        return std::unexpected(JobError{make_error_code(DownloadErrc::length_mismatch), 0, 0});
    }

    if (auto ec = temp.flush()) {
        return std::unexpected(JobError{ec, 0, 0});
    }

    spdlog::debug("Renaming {} to {}", temp.path(), final_path);

    std::error_code ec;
    std::filesystem::rename(temp.path(), final_path, ec);
    if (ec) {
        spdlog::error("Renaming {} to {} failed: {}", temp.path(), final_path, ec.message());
        return std::unexpected(JobError{make_error_code(DownloadErrc::rename_failed), 0, 0});
    }

    return written;
}

} // namespace summon::core

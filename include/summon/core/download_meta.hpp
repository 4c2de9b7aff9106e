// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <summon/core/range_planner.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <expected>
#include <system_error>

namespace summon::core {

// Sidecar describing an in-progress download, kept next to its chunk files
struct DownloadMeta {
    std::string url;
    std::uint64_t content_length{0};
    bool accepts_ranges{false};
    std::vector<ChunkRange> ranges;

    // "<dir>/.<filename>.summon" for a given output file
    [[nodiscard]] static std::string meta_path(std::string_view output_path);

    // "<dir>/.<filename>.part<index>"
    [[nodiscard]] static std::string chunk_path(std::string_view output_path, std::uint32_t index);

    // Every "<dir>/.<filename>.part<N>" currently on disk, whatever its index
    [[nodiscard]] static std::vector<std::string> existing_chunks(std::string_view output_path);

    // Save metadata to file
    [[nodiscard]] std::error_code save(std::string_view path) const noexcept;

    // Load metadata from file; corrupt_resume_state if it does not parse
    [[nodiscard]] static std::expected<DownloadMeta, std::error_code>
    load(std::string_view path) noexcept;

    // Check if a sidecar exists for the given output
    [[nodiscard]] static bool exists(std::string_view output_path) noexcept;

    // Delete the sidecar
    static void remove(std::string_view output_path) noexcept;
};

} // namespace summon::core

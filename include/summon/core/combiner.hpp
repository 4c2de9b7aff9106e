// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <summon/core/error.hpp>
#include <summon/disk/file.hpp>
#include <cstdint>
#include <expected>
#include <span>
#include <string>

namespace summon::core {

// Concatenate chunk files, chunks[i] holding chunk i, into temp and then
// rename temp onto final_path. Nothing is renamed unless every copy
// succeeded and, when expected_bytes is non-zero, the total matches it.
// missing_chunk names the first absent index; rename_failed leaves temp and
// chunks on disk.
[[nodiscard]] std::expected<std::uint64_t, JobError>
combine_chunks(std::span<disk::File* const> chunks, disk::File& temp,
               const std::string& final_path, std::uint64_t expected_bytes = 0) noexcept;

} // namespace summon::core

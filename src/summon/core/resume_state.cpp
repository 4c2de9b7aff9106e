// Copyright (c) 2026 changcheng967. All rights reserved.

#include <summon/core/resume_state.hpp>
#include <summon/disk/error.hpp>
#include <summon/disk/file.hpp>
#include <spdlog/spdlog.h>

namespace summon::core {

std::expected<Reconciled, std::error_code>
reconcile(std::span<const ChunkRange> plan, std::span<const ResumeRecord> on_disk) noexcept {
    try {
        std::vector<std::uint64_t> written(plan.size(), 0);
        for (const auto& record : on_disk) {
            if (record.index >= plan.size()) {
                spdlog::error("Resume state names chunk {} but the plan has {}", record.index + 1, plan.size());
                return std::unexpected(make_error_code(DownloadErrc::corrupt_resume_state));
            }
            written[record.index] = record.bytes_written;
        }

        Reconciled result;
        result.pending.reserve(plan.size());
        result.progress.reserve(plan.size());

        for (std::size_t i = 0; i < plan.size(); ++i) {
            const auto& range = plan[i];
            const auto planned = range.length();
            const auto done = written[i];

            if (done > planned) {
                spdlog::error("Chunk {} holds {} bytes but its range is only {}", range.index + 1, done, planned);
                return std::unexpected(make_error_code(DownloadErrc::corrupt_resume_state));
            }

            result.progress.push_back({range.index, done, planned});

            if (done == planned) {
                spdlog::debug("Chunk {} already complete", range.index + 1);
                continue;
            }

            ChunkRange remaining = range;
            remaining.start += done;
            result.pending.push_back(remaining);
        }

        return result;
    } catch (...) {
        return std::unexpected(make_error_code(DownloadErrc::corrupt_resume_state));
    }
}

std::expected<std::vector<ResumeRecord>, std::error_code>
load_records(std::span<const std::string> chunk_paths) noexcept {
    try {
        std::vector<ResumeRecord> records;
        records.reserve(chunk_paths.size());

        for (std::size_t i = 0; i < chunk_paths.size(); ++i) {
            ResumeRecord record;
            record.index = static_cast<std::uint32_t>(i);

            auto size = disk::file_size(chunk_paths[i]);
            if (size) {
                record.bytes_written = *size;
            } else if (size.error() != make_error_code(disk::DiskErrc::file_not_found)) {
                return std::unexpected(size.error());
            }

            spdlog::debug("Resume: chunk {} has {} bytes on disk", i + 1, record.bytes_written);
            records.push_back(record);
        }
        return records;
    } catch (...) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

} // namespace summon::core

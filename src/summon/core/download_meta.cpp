// Copyright (c) 2026 changcheng967. All rights reserved.

#include <summon/core/download_meta.hpp>
#include <summon/core/config.hpp>
#include <summon/core/error.hpp>
#include <summon/disk/error.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <filesystem>

namespace summon::core {

namespace {

// Line-based format:
//   url
//   content_length
//   accepts_ranges (0 or 1)
//   range_count
// then per range: index start end

std::string sidecar_path(std::string_view output_path, std::string_view suffix) {
    std::filesystem::path p(output_path);
    std::string name = "." + p.filename().string() + std::string(suffix);
    return (p.parent_path() / name).string();
}

} // namespace

std::string DownloadMeta::meta_path(std::string_view output_path) {
    return sidecar_path(output_path, META_SUFFIX);
}

std::string DownloadMeta::chunk_path(std::string_view output_path, std::uint32_t index) {
    return sidecar_path(output_path, std::string(CHUNK_SUFFIX) + std::to_string(index));
}

std::vector<std::string> DownloadMeta::existing_chunks(std::string_view output_path) {
    std::filesystem::path output(output_path);
    const std::string prefix = "." + output.filename().string() + std::string(CHUNK_SUFFIX);
    auto dir = output.parent_path();
    if (dir.empty()) {
        dir = ".";
    }

    std::vector<std::string> chunks;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (name.size() <= prefix.size() || !name.starts_with(prefix)) {
            continue;
        }
        const auto digits = std::string_view(name).substr(prefix.size());
        if (std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            chunks.push_back(it->path().string());
        }
    }
    if (ec) {
        spdlog::warn("Cannot list chunk files in {}: {}", dir.string(), ec.message());
    }

    std::sort(chunks.begin(), chunks.end());
    return chunks;
}

std::error_code DownloadMeta::save(std::string_view path) const noexcept {
    try {
        std::ofstream file{std::string(path), std::ios::binary | std::ios::trunc};
        if (!file) {
            return make_error_code(disk::DiskErrc::write_error);
        }

        file << url << '\n';
        file << content_length << '\n';
        file << (accepts_ranges ? 1 : 0) << '\n';
        file << ranges.size() << '\n';

        for (const auto& range : ranges) {
            file << range.index << ' ' << range.start << ' ' << range.end << '\n';
        }

        file.flush();
        if (!file) {
            return make_error_code(disk::DiskErrc::write_error);
        }
        return {};
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::expected<DownloadMeta, std::error_code>
DownloadMeta::load(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path), std::ios::binary};
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }

        const auto corrupt = std::unexpected(make_error_code(DownloadErrc::corrupt_resume_state));

        DownloadMeta meta;
        if (!std::getline(file, meta.url) || meta.url.empty()) {
            return corrupt;
        }

        std::string line;
        if (!std::getline(file, line)) {
            return corrupt;
        }
        meta.content_length = std::stoull(line);

        if (!std::getline(file, line) || (line != "0" && line != "1")) {
            return corrupt;
        }
        meta.accepts_ranges = line == "1";

        if (!std::getline(file, line)) {
            return corrupt;
        }
        std::size_t range_count = std::stoull(line);
        if (range_count == 0 || range_count > meta.content_length) {
            return corrupt;
        }

        meta.ranges.reserve(range_count);
        for (std::size_t i = 0; i < range_count; ++i) {
            if (!std::getline(file, line)) {
                return corrupt;
            }

            ChunkRange range;
            std::istringstream iss(line);
            if (!(iss >> range.index >> range.start >> range.end) || range.index != i || range.end < range.start) {
                return corrupt;
            }
            meta.ranges.push_back(range);
        }

        return meta;
    } catch (const std::exception&) {
        // std::stoull on garbage
        return std::unexpected(make_error_code(DownloadErrc::corrupt_resume_state));
    }
}

bool DownloadMeta::exists(std::string_view output_path) noexcept {
    try {
        std::error_code ec;
        return std::filesystem::exists(meta_path(output_path), ec);
    } catch (const std::exception& e) {
        spdlog::warn("Cannot check resume state for {}: {}", output_path, e.what());
        return false;
    }
}

void DownloadMeta::remove(std::string_view output_path) noexcept {
    try {
        std::error_code ec;
        std::filesystem::remove(meta_path(output_path), ec);
        if (ec) {
            spdlog::warn("Could not remove resume state for {}: {}", output_path, ec.message());
        }
    } catch (const std::exception& e) {
        spdlog::warn("Could not remove resume state for {}: {}", output_path, e.what());
    }
}

} // namespace summon::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <summon/core/progress.hpp>
#include <cstdint>
#include <iosfwd>
#include <span>
#include <string>

namespace summon::cli {

// Multi-line per-chunk progress display. Each frame prints one line per
// chunk; non-final frames move the cursor back up so the next frame
// overwrites them.
class ProgressBar {
public:
    explicit ProgressBar(std::ostream& out, std::uint32_t width = terminal_bar_width()) noexcept;

    void draw(std::span<const core::ChunkProgress> frame, bool final);

    [[nodiscard]] std::uint32_t width() const noexcept { return width_; }

    // "Connection 2  - [=====     ] 50%"
    [[nodiscard]] static std::string render_line(const core::ChunkProgress& chunk, std::uint32_t width);

    // 1024-based: "512 B", "1.5 KB", "3.2 MB"
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);

    // Bar cells that fit the current terminal next to the label and percent
    [[nodiscard]] static std::uint32_t terminal_bar_width() noexcept;

private:
    std::ostream& out_;
    std::uint32_t width_;
};

} // namespace summon::cli

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <summon/cli/progress_bar.hpp>
#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>

namespace summon::cli {

namespace {

constexpr std::uint32_t DEFAULT_BAR_WIDTH = 40;
constexpr std::uint32_t MIN_BAR_WIDTH = 10;
constexpr std::uint32_t MAX_BAR_WIDTH = 60;

// "Connection NN  - [" + "] 100%"
constexpr std::uint32_t LINE_OVERHEAD = 26;

// Move the cursor to the start of the previous line
constexpr const char* CURSOR_UP = "\033[F";

} // namespace

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::ostream& out, std::uint32_t width) noexcept
    : out_(out)
    , width_(std::max(width, 1u)) {}

void ProgressBar::draw(std::span<const core::ChunkProgress> frame, bool final) {
    std::string text;
    for (const auto& chunk : frame) {
        text += render_line(chunk, width_);
        text += '\n';
    }
    if (!final) {
        for (std::size_t i = 0; i < frame.size(); ++i) {
            text += CURSOR_UP;
        }
    }
    out_ << text << std::flush;
}

std::string ProgressBar::render_line(const core::ChunkProgress& chunk, std::uint32_t width) {
    const auto filled = chunk.filled_cells(width);

    std::string line = "Connection " + std::to_string(chunk.index + 1) + "  - [";
    line.append(filled, '=');
    line.append(width - std::min(filled, width), ' ');
    line += "] ";
    line += std::to_string(chunk.percent());
    line += '%';
    return line;
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    if (bytes < KB) {
        return std::to_string(bytes) + " B";
    }

    const char* unit = "KB";
    double value = static_cast<double>(bytes) / KB;
    if (bytes >= TB) {
        unit = "TB";
        value = static_cast<double>(bytes) / TB;
    } else if (bytes >= GB) {
        unit = "GB";
        value = static_cast<double>(bytes) / GB;
    } else if (bytes >= MB) {
        unit = "MB";
        value = static_cast<double>(bytes) / MB;
    }

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value << ' ' << unit;
    return ss.str();
}

std::uint32_t ProgressBar::terminal_bar_width() noexcept {
    winsize ws{};
    if (::isatty(STDOUT_FILENO) == 0 || ::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) != 0 || ws.ws_col == 0) {
        return DEFAULT_BAR_WIDTH;
    }
    if (ws.ws_col <= LINE_OVERHEAD + MIN_BAR_WIDTH) {
        return MIN_BAR_WIDTH;
    }
    return std::min<std::uint32_t>(ws.ws_col - LINE_OVERHEAD, MAX_BAR_WIDTH);
}

} // namespace summon::cli

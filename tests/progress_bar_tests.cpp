// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <summon/cli/progress_bar.hpp>
#include <sstream>
#include <vector>

using namespace summon::cli;
using summon::core::ChunkProgress;

namespace {

std::size_t count_of(const std::string& text, const std::string& needle) {
    std::size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

} // namespace

TEST_CASE("ProgressBar::render_line", "[progress_bar]") {
    CHECK(ProgressBar::render_line({0, 0, 100}, 10) == "Connection 1  - [          ] 0%");
    CHECK(ProgressBar::render_line({1, 50, 100}, 10) == "Connection 2  - [=====     ] 50%");
    CHECK(ProgressBar::render_line({3, 100, 100}, 10) == "Connection 4  - [==========] 100%");

    SECTION("Filled cells floor the rounded percent") {
        // 2/3 rounds to 67%, 6.7 cells floor to 6
        CHECK(ProgressBar::render_line({0, 2, 3}, 10) == "Connection 1  - [======    ] 67%");
    }
}

TEST_CASE("ProgressBar::draw", "[progress_bar]") {
    std::ostringstream out;
    ProgressBar bar(out, 4);
    std::vector<ChunkProgress> frame{{0, 1, 4}, {1, 2, 4}, {2, 4, 4}};

    SECTION("Ticks move the cursor back over every line") {
        bar.draw(frame, false);
        const auto text = out.str();
        CHECK(count_of(text, "Connection ") == 3);
        CHECK(count_of(text, "\033[F") == 3);
        CHECK(text.find("Connection 1") < text.find("Connection 2"));
        CHECK(text.find("Connection 2") < text.find("Connection 3"));
    }

    SECTION("Final frame stays on screen") {
        bar.draw(frame, true);
        const auto text = out.str();
        CHECK(count_of(text, "Connection ") == 3);
        CHECK(count_of(text, "\033[F") == 0);
        CHECK(text.ends_with("100%\n"));
    }
}

TEST_CASE("ProgressBar::format_bytes", "[progress_bar]") {
    CHECK(ProgressBar::format_bytes(0) == "0 B");
    CHECK(ProgressBar::format_bytes(1023) == "1023 B");
    CHECK(ProgressBar::format_bytes(1024) == "1.0 KB");
    CHECK(ProgressBar::format_bytes(1536) == "1.5 KB");
    CHECK(ProgressBar::format_bytes(5ull * 1024 * 1024) == "5.0 MB");
    CHECK(ProgressBar::format_bytes(3ull * 1024 * 1024 * 1024) == "3.0 GB");
    CHECK(ProgressBar::format_bytes(2ull * 1024 * 1024 * 1024 * 1024) == "2.0 TB");
}

TEST_CASE("ProgressBar::terminal_bar_width stays in bounds", "[progress_bar]") {
    auto width = ProgressBar::terminal_bar_width();
    CHECK(width >= 10);
    CHECK(width <= 60);
}

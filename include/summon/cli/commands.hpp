// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <summon/core/http_session.hpp>
#include <summon/core/url.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace summon::cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_CANCELLED = 130;   // 128 + SIGINT

// CLI result: the process exit code
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string url;
    std::string output_file;
    std::uint32_t connections{0};     // 0 = default
    bool resume{false};
    bool info{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;                // Set when the arguments are unusable
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Install the stderr logger; debug with verbose, warnings only with quiet
void setup_logging(bool verbose, bool quiet) noexcept;

// Absolute destination: explicit path, else the server's filename, else the
// URL's last path segment
[[nodiscard]] std::string resolve_output_path(std::string_view explicit_path,
                                              const core::ResourceInfo& resource,
                                              const core::Url& url);

// Probe, download and combine one URL
[[nodiscard]] CliResult download(const CliArgs& args) noexcept;

// Probe only; print what the server reports
[[nodiscard]] CliResult info(const std::string& url) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace summon::cli

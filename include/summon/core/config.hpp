// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <cstddef>
#include <chrono>
#include <string_view>

namespace summon::core {

constexpr std::uint32_t DEFAULT_CONNECTIONS = 4;
constexpr std::uint32_t MAX_CONNECTIONS = 32;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t PROBE_TIMEOUT_SEC = 5;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 60;                     // Abort a transfer stuck below 1 B/s

constexpr std::size_t CHUNK_BUFFER_SIZE = 16 * 1024;                // Receive buffer per fetch
constexpr std::size_t COPY_BUFFER_SIZE = 256 * 1024;                // Combine copy buffer

constexpr std::chrono::milliseconds PROGRESS_INTERVAL{1000};

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

// <dir>/.<filename><suffix>
constexpr std::string_view CHUNK_SUFFIX = ".part";
constexpr std::string_view META_SUFFIX = ".summon";

} // namespace summon::core

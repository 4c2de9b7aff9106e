// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <summon/core/error.hpp>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <expected>
#include <map>

namespace summon::core {

// HTTP response headers
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;  // Lower-cased names
    std::uint64_t content_length{0};
    bool has_content_length{false};
    bool accepts_ranges{false};
    std::string filename; // From Content-Disposition
};

// Receives a GET response as it streams in
class BodySink {
public:
    virtual ~BodySink() = default;

    // Final status code, reported once before any body bytes
    [[nodiscard]] virtual std::error_code on_status(std::int32_t status) noexcept = 0;

    // One received buffer; an error aborts the transfer
    [[nodiscard]] virtual std::error_code on_data(const char* data, std::size_t size) noexcept = 0;

    // Polled before each buffer and while the transfer is idle
    [[nodiscard]] virtual bool stop_requested() const noexcept = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    // HEAD request; transport failures only, the status is left to the caller
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept = 0;

    // GET bytes [first, last] into sink. Returns the sink's error,
    // cancelled if the sink asked to stop, or network_error.
    [[nodiscard]] virtual std::error_code
    get(const std::string& url, std::uint64_t first, std::uint64_t last, BodySink& sink) noexcept = 0;
};

// libcurl transport, one easy handle per request
class HttpSession final : public Transport {
public:
    HttpSession() = default;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept override;

    [[nodiscard]] std::error_code
    get(const std::string& url, std::uint64_t first, std::uint64_t last, BodySink& sink) noexcept override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

    // Parse "attachment; filename=file.zip"
    [[nodiscard]] static std::string parse_content_disposition(std::string_view content_disposition);
};

// What the HEAD probe learned about the resource
struct ResourceInfo {
    std::uint64_t content_length{0};
    bool accepts_ranges{false};
    std::string filename;
};

// Capability probe: size and range support. Any failure is probe_failed.
[[nodiscard]] std::expected<ResourceInfo, std::error_code>
probe(Transport& transport, const std::string& url) noexcept;

} // namespace summon::core

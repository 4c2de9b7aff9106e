// Copyright (c) 2026 changcheng967. All rights reserved.

#include <summon/core/http_session.hpp>
#include <summon/core/config.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace summon::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

void apply_common_options(CURL* curl, const std::string& url) noexcept {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);

    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }
}

// Header callback for HEAD responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) noexcept {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    try {
        std::string_view header(buffer, total);

        // A new status line starts a new response (redirects)
        if (header.starts_with("HTTP/")) {
            headers->clear();
            return total;
        }

        auto colon = header.find(':');
        if (colon == std::string_view::npos) return total;

        auto name = header.substr(0, colon);
        auto value = header.substr(colon + 1);

        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
            value.remove_prefix(1);
        }
        while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
            value.remove_suffix(1);
        }

        std::string lower_name;
        lower_name.reserve(name.size());
        for (char c : name) {
            lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        (*headers)[lower_name] = std::string(value);
    } catch (...) {
        return 0;
    }
    return total;
}

// State shared with the GET callbacks
struct TransferContext {
    CURL* curl{nullptr};
    BodySink* sink{nullptr};
    bool status_reported{false};
    std::error_code error;
};

std::error_code report_status(TransferContext& ctx) noexcept {
    if (ctx.status_reported) {
        return ctx.error;
    }
    ctx.status_reported = true;

    long http_code = 0;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &http_code);
    ctx.error = ctx.sink->on_status(static_cast<std::int32_t>(http_code));
    return ctx.error;
}

std::size_t body_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* ctx = static_cast<TransferContext*>(userdata);
    std::size_t bytes = size * nmemb;

    if (ctx->sink->stop_requested()) {
        ctx->error = make_error_code(DownloadErrc::cancelled);
        return 0;
    }
    if (report_status(*ctx)) {
        return 0;
    }

    ctx->error = ctx->sink->on_data(ptr, bytes);
    // Returning less than bytes aborts the transfer with CURLE_WRITE_ERROR
    return ctx->error ? 0 : bytes;
}

// Lets a stop request interrupt a transfer that is not receiving data
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (ctx->sink->stop_requested()) {
        if (!ctx->error) {
            ctx->error = make_error_code(DownloadErrc::cancelled);
        }
        return 1;
    }
    return 0;
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HttpResponse response{};

    apply_common_options(curl.ptr, url);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, static_cast<long>(PROBE_TIMEOUT_SEC));
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        spdlog::debug("HEAD {} failed: {}", url, curl_easy_strerror(result));
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    // CURLINFO_CONTENT_LENGTH_DOWNLOAD_T is not filled for HEAD
    if (auto it = response.headers.find("content-length"); it != response.headers.end()) {
        const auto& text = it->second;
        std::uint64_t value = 0;
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc{} && end == text.data() + text.size()) {
            response.content_length = value;
            response.has_content_length = true;
        }
    }

    if (auto it = response.headers.find("accept-ranges"); it != response.headers.end()) {
        response.accepts_ranges = it->second == "bytes";
    }

    if (auto it = response.headers.find("content-disposition"); it != response.headers.end()) {
        try {
            response.filename = parse_content_disposition(it->second);
        } catch (...) {
            response.filename.clear();
        }
    }

    return response;
}

std::error_code HttpSession::get(const std::string& url, std::uint64_t first,
                                 std::uint64_t last, BodySink& sink) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return make_error_code(DownloadErrc::network_error);
    }

    TransferContext ctx;
    ctx.curl = curl.ptr;
    ctx.sink = &sink;

    std::string range;
    try {
        range = std::to_string(first) + "-" + std::to_string(last);
    } catch (...) {
        return make_error_code(DownloadErrc::network_error);
    }

    apply_common_options(curl.ptr, url);
    curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());

    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, body_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(CHUNK_BUFFER_SIZE));

    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    // Stalled connections fail instead of hanging forever
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(STALL_TIMEOUT_SEC));

    CURLcode result = curl_easy_perform(curl.ptr);

    // Errors raised by the sink or a stop request win over the curl code they caused
    if (ctx.error) {
        return ctx.error;
    }
    if (result != CURLE_OK) {
        spdlog::debug("GET {} range {} failed: {}", url, range, curl_easy_strerror(result));
        return make_error_code(DownloadErrc::network_error);
    }

    // Bodies without bytes (e.g. an empty 404) never reached body_callback
    return report_status(ctx);
}

std::string HttpSession::parse_content_disposition(std::string_view content_disposition) {
    auto filename_pos = content_disposition.find("filename=");
    if (filename_pos == std::string_view::npos) {
        return {};
    }

    auto filename = content_disposition.substr(filename_pos + 9);
    filename = filename.substr(0, filename.find(';'));
    while (!filename.empty() && (filename.back() == ' ' || filename.back() == '\t')) {
        filename.remove_suffix(1);
    }
    if (filename.size() >= 2 && (filename.front() == '"' || filename.front() == '\'')
        && filename.back() == filename.front()) {
        filename.remove_prefix(1);
        filename.remove_suffix(1);
    }

    // Never let the server pick a directory
    if (auto slash = filename.find_last_of("/\\"); slash != std::string_view::npos) {
        filename.remove_prefix(slash + 1);
    }
    if (filename == "." || filename == "..") {
        return {};
    }
    return std::string(filename);
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

//=============================================================================
// Capability probe
//=============================================================================

std::expected<ResourceInfo, std::error_code>
probe(Transport& transport, const std::string& url) noexcept {
    auto response = transport.head(url);
    if (!response) {
        spdlog::error("Probe of {} failed: {}", url, response.error().message());
        return std::unexpected(make_error_code(DownloadErrc::probe_failed));
    }

    if (response->status_code != 200 && response->status_code != 206) {
        spdlog::error("Probe of {} returned status {}", url, response->status_code);
        return std::unexpected(make_error_code(DownloadErrc::probe_failed));
    }

    if (!response->has_content_length) {
        spdlog::error("Probe of {} returned no usable Content-Length", url);
        return std::unexpected(make_error_code(DownloadErrc::probe_failed));
    }

    ResourceInfo info;
    info.content_length = response->content_length;
    info.accepts_ranges = response->accepts_ranges;
    try {
        info.filename = response->filename;
    } catch (...) {
        return std::unexpected(make_error_code(DownloadErrc::probe_failed));
    }

    spdlog::debug("Probe: length={} ranges={} filename='{}'",
                  info.content_length, info.accepts_ranges, info.filename);
    return info;
}

} // namespace summon::core

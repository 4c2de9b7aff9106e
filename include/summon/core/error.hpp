// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace summon::core {

enum class DownloadErrc {
    success = 0,
    invalid_input,
    invalid_url,
    probe_failed,
    unexpected_status,
    network_error,
    length_mismatch,
    cancelled,
    missing_chunk,
    corrupt_resume_state,
    rename_failed,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "summon::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:              return "Success";
            case DownloadErrc::invalid_input:        return "Invalid download parameters";
            case DownloadErrc::invalid_url:          return "Invalid URL";
            case DownloadErrc::probe_failed:         return "Could not determine resource size";
            case DownloadErrc::unexpected_status:    return "Unexpected HTTP status";
            case DownloadErrc::network_error:        return "Network error";
            case DownloadErrc::length_mismatch:      return "Received byte count does not match the requested range";
            case DownloadErrc::cancelled:            return "Download cancelled";
            case DownloadErrc::missing_chunk:        return "Chunk file missing";
            case DownloadErrc::corrupt_resume_state: return "Resume state does not match the download";
            case DownloadErrc::rename_failed:        return "Could not move the output file into place";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

// The single error a job reports to its caller
struct JobError {
    std::error_code code;
    std::uint32_t chunk_index{0};
    std::int32_t http_status{0};   // Set for unexpected_status only

    [[nodiscard]] bool cancelled() const noexcept {
        return code == make_error_code(DownloadErrc::cancelled);
    }

    [[nodiscard]] std::string message() const {
        std::string text = code.message();
        if (code == make_error_code(DownloadErrc::unexpected_status)) {
            text += " " + std::to_string(http_status) + " for chunk " + std::to_string(chunk_index + 1);
        } else if (code == make_error_code(DownloadErrc::missing_chunk)) {
            text += " (chunk " + std::to_string(chunk_index + 1) + ")";
        }
        return text;
    }
};

} // namespace summon::core

namespace std {

template<>
struct is_error_code_enum<summon::core::DownloadErrc> : true_type {};

} // namespace std

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <summon/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace summon::core {

namespace {

bool is_digits(std::string_view s) noexcept {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    try {
        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        Url url;
        for (char c : url_str.substr(0, scheme_end)) {
            url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (url.scheme_ != "http" && url.scheme_ != "https") {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        // Fragments never reach the server
        auto without_fragment = url_str.substr(0, std::min(url_str.find('#'), url_str.size()));

        auto rest = without_fragment.substr(scheme_end + 3);
        auto authority_end = std::min(rest.find_first_of("/?"), rest.size());
        auto authority = rest.substr(0, authority_end);
        auto target = rest.substr(authority_end);

        // Drop user:pass@
        if (auto at = authority.rfind('@'); at != std::string_view::npos) {
            authority.remove_prefix(at + 1);
        }

        if (!authority.empty() && authority.front() == '[') {
            // IPv6 literal [::1]:8080
            auto close = authority.find(']');
            if (close == std::string_view::npos) {
                return std::unexpected(make_error_code(DownloadErrc::invalid_url));
            }
            url.host_ = authority.substr(0, close + 1);
            auto after = authority.substr(close + 1);
            if (!after.empty()) {
                if (after.front() != ':') {
                    return std::unexpected(make_error_code(DownloadErrc::invalid_url));
                }
                url.port_ = after.substr(1);
            }
        } else if (auto colon = authority.find(':'); colon != std::string_view::npos) {
            url.host_ = authority.substr(0, colon);
            url.port_ = authority.substr(colon + 1);
        } else {
            url.host_ = authority;
        }

        if (url.host_.empty() || (!url.port_.empty() && !is_digits(url.port_))) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        if (authority.find_first_of(" \t") != std::string_view::npos) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        auto query_start = target.find('?');
        url.path_ = target.substr(0, query_start);
        if (url.path_.empty()) {
            url.path_ = "/";
        }
        if (query_start != std::string_view::npos) {
            url.query_ = target.substr(query_start + 1);
        }

        url.str_ = without_fragment;
        return url;
    } catch (...) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    auto name = last_slash == std::string::npos ? path_ : path_.substr(last_slash + 1);
    if (name.empty() || name == "." || name == "..") {
        return "index.html";
    }
    return name;
}

} // namespace summon::core

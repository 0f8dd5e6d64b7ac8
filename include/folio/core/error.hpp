// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>
#include <string_view>

namespace folio::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    not_found,
    server_error,
    http_error,
    permission_denied,
    invalid_url,
    invalid_range,
    size_mismatch,
    cancelled,
    too_many_redirects,
    ssl_error,
    dns_error,
    connection_lost,
    no_source_url,
    book_not_found,
    shutdown_in_progress,
    invalid_state,
    parse_error,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "folio::download";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:              return "Success";
            case DownloadErrc::network_error:        return "Network error";
            case DownloadErrc::timeout:              return "Operation timed out";
            case DownloadErrc::refused:              return "Connection refused";
            case DownloadErrc::not_found:            return "Resource not found (404)";
            case DownloadErrc::server_error:         return "Server error (5xx)";
            case DownloadErrc::http_error:           return "HTTP error status";
            case DownloadErrc::permission_denied:    return "Permission denied";
            case DownloadErrc::invalid_url:          return "Invalid URL";
            case DownloadErrc::invalid_range:        return "Invalid byte range";
            case DownloadErrc::size_mismatch:        return "Downloaded size does not match expected size";
            case DownloadErrc::cancelled:            return "Download cancelled";
            case DownloadErrc::too_many_redirects:   return "Too many redirects";
            case DownloadErrc::ssl_error:            return "SSL/TLS error";
            case DownloadErrc::dns_error:            return "DNS resolution failed";
            case DownloadErrc::connection_lost:      return "Connection lost";
            case DownloadErrc::no_source_url:        return "No download URL known for book";
            case DownloadErrc::book_not_found:       return "Book not found in catalog";
            case DownloadErrc::shutdown_in_progress: return "Shutdown in progress";
            case DownloadErrc::invalid_state:        return "Operation not valid in current state";
            case DownloadErrc::parse_error:          return "Malformed data";
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

// True when a server answered with an error status, false for transport failures
[[nodiscard]] inline bool is_http_status_error(const std::error_code& ec) noexcept {
    if (ec.category() != download_errc_category()) return false;
    switch (static_cast<DownloadErrc>(ec.value())) {
        case DownloadErrc::not_found:
        case DownloadErrc::server_error:
        case DownloadErrc::http_error:
        case DownloadErrc::permission_denied:
        case DownloadErrc::invalid_range:
            return true;
        default:
            return false;
    }
}

} // namespace folio::core

namespace std {

template<>
struct is_error_code_enum<folio::core::DownloadErrc> : true_type {};

} // namespace std

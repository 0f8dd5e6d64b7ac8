// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <expected>

namespace folio::core {

class Url {
public:
    [[nodiscard]] static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }
    [[nodiscard]] std::string_view fragment() const noexcept { return fragment_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string base() const;  // scheme://host[:port]
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }

    [[nodiscard]] std::uint16_t default_port() const noexcept;
    [[nodiscard]] std::string filename() const;

    void scheme(std::string_view s) { scheme_ = s; }

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

// True when host equals domain or is a subdomain of it
[[nodiscard]] bool in_domain(std::string_view host, std::string_view domain) noexcept;

} // namespace folio::core

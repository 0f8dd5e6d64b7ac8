// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/config.hpp>
#include <folio/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <span>
#include <string>

namespace folio::core {

// HTTP response status and headers
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;  // lowercase names
    std::uint64_t content_length{0};             // 0 when unknown
    bool accepts_ranges{false};
    std::string content_type;

    [[nodiscard]] bool is_partial() const noexcept { return status_code == 206; }
};

// Called once with the response status before any body bytes
using ResponseHandler = std::function<bool(const HttpResponse&)>;

// Called for every received body chunk
using ChunkHandler = std::function<bool(std::span<const std::byte>)>;

struct HttpOptions {
    std::string user_agent;
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};
    std::uint32_t head_timeout_sec{HEALTH_CHECK_TIMEOUT_SEC};
    std::size_t buffer_size{CHUNK_SIZE};
    bool verify_tls{true};
};

// Maps an HTTP status to an error, empty for non-error statuses
[[nodiscard]] std::error_code status_to_error(std::int32_t status) noexcept;

// Transport used by the download engine and health checks.
// Implementations must be safe to call from several threads at once.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Existence probe; error statuses are returned as errors
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept = 0;

    // Streaming GET. A non-zero offset sends "Range: bytes=<offset>-".
    // Returning false from a handler aborts the transfer with DownloadErrc::cancelled.
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    get(const std::string& url,
        std::uint64_t offset,
        const ResponseHandler& on_response,
        const ChunkHandler& on_chunk) noexcept = 0;
};

// libcurl implementation, one easy handle per request
class CurlHttpClient final : public HttpClient {
public:
    CurlHttpClient() = default;
    explicit CurlHttpClient(HttpOptions options) : options_(std::move(options)) {}

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept override;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const std::string& url,
        std::uint64_t offset,
        const ResponseHandler& on_response,
        const ChunkHandler& on_chunk) noexcept override;

    [[nodiscard]] const HttpOptions& options() const noexcept { return options_; }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    HttpOptions options_;
};

} // namespace folio::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/error.hpp>
#include <folio/core/http_client.hpp>
#include <algorithm>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace folio::testing {

struct FakeResponse {
    std::int32_t status{200};
    std::string body;
    bool accepts_ranges{true};
    bool honor_range{true};                          // answer ranged requests with 206
    std::optional<std::uint64_t> announced_length;   // Content-Length override
    std::error_code transport_error;                 // fail before any response
    std::optional<std::size_t> drop_after;           // lose the connection after this many bytes
};

// In-process HttpClient serving scripted responses
class FakeHttpClient final : public core::HttpClient {
public:
    struct Request {
        std::string method;
        std::string url;
        std::uint64_t offset{0};
    };

    static constexpr std::size_t CHUNK = 4096;

    // Default answer for url
    void serve(const std::string& url, FakeResponse response) {
        std::lock_guard lock(mutex_);
        defaults_[url] = std::move(response);
    }

    void serve_body(const std::string& url, std::string body) {
        FakeResponse r;
        r.body = std::move(body);
        serve(url, std::move(r));
    }

    // One-shot answers consumed in order before the default
    void enqueue(const std::string& url, FakeResponse response) {
        std::lock_guard lock(mutex_);
        scripted_[url].push_back(std::move(response));
    }

    [[nodiscard]] std::vector<Request> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    [[nodiscard]] std::size_t count(const std::string& url) const {
        std::lock_guard lock(mutex_);
        return static_cast<std::size_t>(std::count_if(requests_.begin(), requests_.end(),
            [&](const Request& r) { return r.url == url; }));
    }

    std::expected<core::HttpResponse, std::error_code>
    head(const std::string& url) noexcept override {
        auto r = next("HEAD", url, 0);
        if (r.transport_error) {
            return std::unexpected(r.transport_error);
        }
        if (auto ec = core::status_to_error(r.status)) {
            return std::unexpected(ec);
        }

        core::HttpResponse response;
        response.status_code = r.status;
        response.content_length = r.announced_length.value_or(r.body.size());
        response.accepts_ranges = r.accepts_ranges;
        return response;
    }

    std::expected<core::HttpResponse, std::error_code>
    get(const std::string& url,
        std::uint64_t offset,
        const core::ResponseHandler& on_response,
        const core::ChunkHandler& on_chunk) noexcept override {
        auto r = next("GET", url, offset);
        if (r.transport_error) {
            return std::unexpected(r.transport_error);
        }
        if (auto ec = core::status_to_error(r.status)) {
            return std::unexpected(ec);
        }

        core::HttpResponse response;
        response.status_code = r.status;
        response.accepts_ranges = r.accepts_ranges;

        std::string_view payload = r.body;
        if (offset > 0 && r.honor_range && r.status == 200) {
            if (offset >= r.body.size()) {
                return std::unexpected(core::status_to_error(416));
            }
            response.status_code = 206;
            payload = payload.substr(static_cast<std::size_t>(offset));
        }
        response.content_length = r.announced_length.value_or(payload.size());

        if (on_response && !on_response(response)) {
            return std::unexpected(make_error_code(core::DownloadErrc::cancelled));
        }

        const std::size_t limit = std::min(r.drop_after.value_or(payload.size()), payload.size());
        for (std::size_t pos = 0; pos < limit; pos += CHUNK) {
            auto piece = payload.substr(pos, std::min(CHUNK, limit - pos));
            auto bytes = std::as_bytes(std::span<const char>(piece.data(), piece.size()));
            if (on_chunk && !on_chunk(bytes)) {
                return std::unexpected(make_error_code(core::DownloadErrc::cancelled));
            }
        }
        if (limit < payload.size()) {
            return std::unexpected(make_error_code(core::DownloadErrc::connection_lost));
        }
        return response;
    }

private:
    FakeResponse next(const char* method, const std::string& url, std::uint64_t offset) {
        std::lock_guard lock(mutex_);
        requests_.push_back({method, url, offset});

        if (auto it = scripted_.find(url); it != scripted_.end() && !it->second.empty()) {
            auto r = std::move(it->second.front());
            it->second.pop_front();
            return r;
        }
        if (auto it = defaults_.find(url); it != defaults_.end()) {
            return it->second;
        }
        FakeResponse missing;
        missing.status = 404;
        return missing;
    }

    std::map<std::string, FakeResponse> defaults_;
    std::map<std::string, std::deque<FakeResponse>> scripted_;
    std::vector<Request> requests_;
    mutable std::mutex mutex_;
};

} // namespace folio::testing

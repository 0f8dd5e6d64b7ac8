// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/core/http_client.hpp>
#include <folio/core/logger.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string_view>

namespace folio::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// Header callback for HEAD/GET responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);

    // New status line after a redirect starts a fresh header block
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
    return total;
}

struct Transfer {
    CURL* curl{nullptr};
    const ResponseHandler* on_response{nullptr};
    const ChunkHandler* on_chunk{nullptr};
    HttpResponse response;
    bool response_ready{false};
    bool aborted{false};
};

std::uint64_t parse_length(const std::map<std::string, std::string>& headers) noexcept {
    auto it = headers.find("content-length");
    if (it == headers.end() || it->second.empty()) return 0;

    char* end = nullptr;
    unsigned long long val = std::strtoull(it->second.c_str(), &end, 10);
    return end == it->second.c_str() + it->second.size() ? static_cast<std::uint64_t>(val) : 0;
}

void fill_response(CURL* curl, HttpResponse& response) noexcept {
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    curl_off_t cl = -1;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl) == CURLE_OK && cl > 0) {
        response.content_length = static_cast<std::uint64_t>(cl);
    } else {
        // CURLINFO_CONTENT_LENGTH_DOWNLOAD_T is not set for HEAD
        response.content_length = parse_length(response.headers);
    }

    char* ct = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct) {
        response.content_type = ct;
    }

    auto ar_it = response.headers.find("accept-ranges");
    response.accepts_ranges = ar_it != response.headers.end()
        && ar_it->second.find("bytes") != std::string::npos;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    std::size_t total = size * nitems;

    try {
        if (!t->response_ready) {
            fill_response(t->curl, t->response);
            t->response_ready = true;

            // Error bodies are not interesting
            if (status_to_error(t->response.status_code)) {
                return 0;
            }
            if (*t->on_response && !(*t->on_response)(t->response)) {
                t->aborted = true;
                return 0;
            }
        }

        if (*t->on_chunk &&
            !(*t->on_chunk)(std::span<const std::byte>(reinterpret_cast<const std::byte*>(ptr), total))) {
            t->aborted = true;
            return 0;
        }
    } catch (const std::exception& e) {
        FOLIO_LOG_ERROR("Transfer handler threw: {}", e.what());
        t->aborted = true;
        return 0;
    }

    return total;
}

std::error_code curl_to_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(DownloadErrc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(DownloadErrc::dns_error);
        case CURLE_COULDNT_CONNECT:
            return make_error_code(DownloadErrc::refused);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(DownloadErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
            return make_error_code(DownloadErrc::connection_lost);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(DownloadErrc::invalid_url);
        case CURLE_RANGE_ERROR:
            return make_error_code(DownloadErrc::invalid_range);
        default:
            return make_error_code(DownloadErrc::network_error);
    }
}

void configure(CURL* curl, const std::string& url, const HttpOptions& options,
               std::map<std::string, std::string>* headers) noexcept {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connect_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.verify_tls ? 2L : 0L);
    if (!options.user_agent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, headers);
}

} // namespace

std::error_code status_to_error(std::int32_t status) noexcept {
    if (status < 400) return {};
    if (status == 404) return make_error_code(DownloadErrc::not_found);
    if (status == 416) return make_error_code(DownloadErrc::invalid_range);
    if (status == 401 || status == 403) return make_error_code(DownloadErrc::permission_denied);
    if (status >= 500) return make_error_code(DownloadErrc::server_error);
    return make_error_code(DownloadErrc::http_error);
}

//=============================================================================
// CurlHttpClient
//=============================================================================

std::expected<HttpResponse, std::error_code>
CurlHttpClient::head(const std::string& url) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HttpResponse response{};
    configure(curl.ptr, url, options_, &response.headers);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, static_cast<long>(options_.head_timeout_sec));

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        FOLIO_LOG_DEBUG("HEAD {} failed: {}", url, curl_easy_strerror(result));
        return std::unexpected(curl_to_error(result));
    }

    fill_response(curl.ptr, response);
    if (auto ec = status_to_error(response.status_code)) {
        return std::unexpected(ec);
    }
    return response;
}

std::expected<HttpResponse, std::error_code>
CurlHttpClient::get(const std::string& url,
                    std::uint64_t offset,
                    const ResponseHandler& on_response,
                    const ChunkHandler& on_chunk) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    Transfer transfer;
    transfer.curl = curl.ptr;
    transfer.on_response = &on_response;
    transfer.on_chunk = &on_chunk;

    configure(curl.ptr, url, options_, &transfer.response.headers);

    std::string range;
    if (offset > 0) {
        range = std::to_string(offset) + "-";
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
    }

    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.stall_timeout_sec));
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(options_.buffer_size));
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &transfer);

    CURLcode result = curl_easy_perform(curl.ptr);

    if (!transfer.response_ready) {
        fill_response(curl.ptr, transfer.response);
    }

    if (auto ec = status_to_error(transfer.response.status_code)) {
        return std::unexpected(ec);
    }
    if (transfer.aborted) {
        return std::unexpected(make_error_code(DownloadErrc::cancelled));
    }
    if (result != CURLE_OK) {
        FOLIO_LOG_DEBUG("GET {} failed: {}", url, curl_easy_strerror(result));
        return std::unexpected(curl_to_error(result));
    }

    // Empty body: the response handler has not run yet
    if (!transfer.response_ready) {
        transfer.response_ready = true;
        try {
            if (on_response && !on_response(transfer.response)) {
                return std::unexpected(make_error_code(DownloadErrc::cancelled));
            }
        } catch (const std::exception& e) {
            FOLIO_LOG_ERROR("Transfer handler threw: {}", e.what());
            return std::unexpected(make_error_code(DownloadErrc::cancelled));
        }
    }

    return transfer.response;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void CurlHttpClient::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlHttpClient::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace folio::core

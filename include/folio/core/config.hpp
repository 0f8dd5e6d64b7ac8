// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <cstddef>
#include <chrono>
#include <string_view>

namespace folio::core {

// Transfer
constexpr std::size_t CHUNK_SIZE = 8192;
constexpr std::uint32_t DOWNLOAD_ATTEMPTS = 3;
constexpr std::chrono::seconds BACKOFF_BASE{1};                     // doubled per attempt
constexpr std::uint64_t INCOMPLETE_THRESHOLD = 10 * 1024;           // 10 KB
constexpr std::uint64_t RECORD_UPDATE_INTERVAL = 256 * 1024;        // bytes between record writes

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 30;
constexpr std::uint32_t HEALTH_CHECK_TIMEOUT_SEC = 10;
constexpr std::uint32_t MAX_REDIRECTS = 10;

// Mirror health
constexpr double HEALTH_MIN = 0.1;
constexpr double HEALTH_MAX = 1.0;
constexpr double FAILURE_DECAY = 0.8;                               // multiplicative
constexpr double SUCCESS_BOOST = 1.1;                               // multiplicative
constexpr double SUCCESS_BONUS = 0.05;                              // additive after boost
constexpr double PROBE_RECOVERY = 0.1;
constexpr double PROBE_DECAY = 0.2;
constexpr double TRANSPORT_DECAY = 0.3;
constexpr std::uint32_t FAILURE_THRESHOLD = 3;
constexpr std::size_t RECENT_CAPACITY = 10;
constexpr std::size_t RECENT_EXCLUSION = 3;

// Queue
constexpr std::uint32_t DEFAULT_WORKERS = 3;
constexpr std::uint32_t MAX_RETRIES = 3;
constexpr std::uint32_t METADATA_CONCURRENCY = 5;
constexpr std::chrono::milliseconds QUEUE_POLL_INTERVAL{1000};
constexpr std::chrono::milliseconds SHUTDOWN_TIMEOUT{2000};
constexpr std::size_t MAX_FILENAME_LENGTH = 100;

constexpr std::string_view PRIMARY_SITE = "https://www.gutenberg.org/";
constexpr std::string_view CONFIG_DIR_NAME = ".folio";

} // namespace folio::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace folio::core {

using BookId = std::int64_t;

enum class RecordStatus : std::uint8_t {
    pending,
    downloading,
    completed,
    failed
};

[[nodiscard]] std::string_view to_string(RecordStatus status) noexcept;
[[nodiscard]] std::optional<RecordStatus> parse_record_status(std::string_view text) noexcept;

// Durable per-book transfer record
struct DownloadRecord {
    BookId book_id{0};
    RecordStatus status{RecordStatus::pending};
    std::uint64_t bytes_downloaded{0};
    std::uint64_t total_bytes{0};
    std::string download_path;
    std::string source_url;
    std::string error_message;
    std::uint32_t retry_count{0};
};

} // namespace folio::core

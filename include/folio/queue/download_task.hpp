// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/download_record.hpp>
#include <folio/core/timestamp.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace folio::queue {

// Lower value is served first
enum class Priority : std::uint8_t {
    high = 1,
    normal = 5,
    low = 10
};

enum class TaskStatus : std::uint8_t {
    pending,
    downloading,
    completed,
    failed,
    cancelled
};

[[nodiscard]] std::string_view to_string(Priority priority) noexcept;
[[nodiscard]] std::string_view to_string(TaskStatus status) noexcept;

// Accepts names ("high") and numeric values ("1")
[[nodiscard]] std::optional<Priority> parse_priority(std::string_view text) noexcept;
[[nodiscard]] std::optional<Priority> priority_from_value(int value) noexcept;

struct DownloadTask {
    Priority priority{Priority::normal};
    core::BookId book_id{0};
    std::string source_url;
    std::filesystem::path output_path;
    std::uint32_t retry_count{0};
    std::uint64_t sequence{0};  // arrival order, assigned by TaskQueue::push
    TaskStatus status{TaskStatus::pending};
    core::Timestamp created_at{core::Clock::now()};
    std::optional<core::Timestamp> started_at;
    std::optional<core::Timestamp> completed_at;
    std::string error_message;
};

// Filesystem-safe "<title>.epub"; book_<id> when the title has no usable characters
[[nodiscard]] std::string output_filename(std::string_view title, core::BookId book);

} // namespace folio::queue

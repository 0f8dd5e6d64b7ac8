// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/queue/download_task.hpp>
#include <folio/core/config.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace folio::queue {

std::string_view to_string(Priority priority) noexcept {
    switch (priority) {
        case Priority::high:   return "high";
        case Priority::normal: return "normal";
        case Priority::low:    return "low";
    }
    return "normal";
}

std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::pending:     return "pending";
        case TaskStatus::downloading: return "downloading";
        case TaskStatus::completed:   return "completed";
        case TaskStatus::failed:      return "failed";
        case TaskStatus::cancelled:   return "cancelled";
    }
    return "pending";
}

std::optional<Priority> priority_from_value(int value) noexcept {
    switch (value) {
        case 1:  return Priority::high;
        case 5:  return Priority::normal;
        case 10: return Priority::low;
        default: return std::nullopt;
    }
}

std::optional<Priority> parse_priority(std::string_view text) noexcept {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "high") return Priority::high;
    if (lower == "normal") return Priority::normal;
    if (lower == "low") return Priority::low;

    int value = 0;
    auto [ptr, ec] = std::from_chars(lower.data(), lower.data() + lower.size(), value);
    if (ec == std::errc{} && ptr == lower.data() + lower.size()) {
        return priority_from_value(value);
    }
    return std::nullopt;
}

std::string output_filename(std::string_view title, core::BookId book) {
    std::string clean;
    clean.reserve(title.size());
    for (char c : title) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == ' ' || c == '-' || c == '_') {
            clean += c;
        }
    }

    auto first = clean.find_first_not_of(' ');
    auto last = clean.find_last_not_of(' ');
    clean = first == std::string::npos ? std::string{} : clean.substr(first, last - first + 1);

    std::replace(clean.begin(), clean.end(), ' ', '_');
    if (clean.size() > core::MAX_FILENAME_LENGTH) {
        clean.resize(core::MAX_FILENAME_LENGTH);
    }
    if (clean.empty()) {
        clean = fmt::format("book_{}", book);
    }
    return clean + ".epub";
}

} // namespace folio::queue

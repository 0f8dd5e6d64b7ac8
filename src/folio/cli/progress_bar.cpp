// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/cli/progress_bar.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace folio::cli {

namespace {

constexpr int BAR_WIDTH = 30;

} // namespace

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label, Unit unit)
    : total_(total)
    , label_(label)
    , unit_(unit)
    , started_(std::chrono::steady_clock::now()) {}

void ProgressBar::update(std::uint64_t current) noexcept {
    current_ = current;
    if (total_ == 0 || finished_) return;

    double percent = std::clamp(static_cast<double>(current) * 100.0 / static_cast<double>(total_), 0.0, 100.0);
    int whole = static_cast<int>(percent);
    if (whole <= last_percent_) return;
    last_percent_ = whole;

    try {
        std::cout << '\r' << render(current) << std::flush;
    } catch (const std::exception&) {
        // Progress output is best effort
    }
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    if (total_ == 0) total_ = current_;
    last_percent_ = -1;
    update(total_);
    finished_ = true;
    std::cout << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cout << '\r' << std::string(80, ' ') << '\r' << std::flush;
}

std::string ProgressBar::render(std::uint64_t current) const {
    const double percent = std::clamp(static_cast<double>(current) * 100.0 / static_cast<double>(total_), 0.0, 100.0);
    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));

    std::string line;
    if (!label_.empty()) {
        line = fmt::format("{}: ", label_);
    }
    line += fmt::format("[{}>{}] {:3d}% ({}/{})",
                        std::string(static_cast<std::size_t>(filled), '='),
                        std::string(static_cast<std::size_t>(BAR_WIDTH - filled), ' '),
                        static_cast<int>(percent),
                        format_amount(current),
                        format_amount(total_));

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_).count();
    if (elapsed > 0 && current > 0 && current < total_) {
        auto rate = current / static_cast<std::uint64_t>(elapsed);
        if (unit_ == Unit::bytes) {
            line += fmt::format(" @ {}/s", format_bytes(rate));
        }
        if (rate > 0) {
            line += fmt::format(" ETA: {}", format_time((total_ - current) / rate));
        }
    }

    line += std::string(10, ' ');
    return line;
}

std::string ProgressBar::format_amount(std::uint64_t value) const {
    return unit_ == Unit::bytes ? format_bytes(value) : fmt::format("{}", value);
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    const auto value = static_cast<double>(bytes);
    if (bytes >= GB) return fmt::format("{:.2f} GB", value / GB);
    if (bytes >= MB) return fmt::format("{:.1f} MB", value / MB);
    if (bytes >= KB) return fmt::format("{:.0f} KB", value / KB);
    return fmt::format("{} B", bytes);
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    const auto hours = seconds / 3600;
    const auto minutes = (seconds % 3600) / 60;
    const auto secs = seconds % 60;

    if (hours > 0) return fmt::format("{}h {:02}m {}s", hours, minutes, secs);
    if (minutes > 0) return fmt::format("{}m {}s", minutes, secs);
    return fmt::format("{}s", secs);
}

} // namespace folio::cli

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace folio::cli {

// Single-line terminal progress bar
class ProgressBar {
public:
    enum class Unit { bytes, books };

    ProgressBar(std::uint64_t total, std::string_view label = {}, Unit unit = Unit::bytes);

    // Redraws at most once per percent; speed is derived from elapsed time
    void update(std::uint64_t current) noexcept;

    void finish() noexcept;

    void clear() noexcept;

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) { label_ = l; }

    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    [[nodiscard]] std::string render(std::uint64_t current) const;
    [[nodiscard]] std::string format_amount(std::uint64_t value) const;

    std::uint64_t total_{0};
    std::uint64_t current_{0};
    int last_percent_{-1};
    std::string label_;
    Unit unit_;
    std::chrono::steady_clock::time_point started_;
    bool finished_{false};
};

} // namespace folio::cli

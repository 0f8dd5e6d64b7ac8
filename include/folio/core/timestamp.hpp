// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace folio::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// UTC, second precision: 2026-01-31T12:00:00Z
[[nodiscard]] std::string to_iso8601(Timestamp tp);

[[nodiscard]] std::optional<Timestamp> from_iso8601(std::string_view text) noexcept;

} // namespace folio::core

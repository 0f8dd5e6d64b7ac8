// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/core/timestamp.hpp>
#include <fmt/chrono.h>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace folio::core {

std::string to_iso8601(Timestamp tp) {
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(Clock::to_time_t(tp)));
}

std::optional<Timestamp> from_iso8601(std::string_view text) noexcept {
    try {
        std::tm tm{};
        std::istringstream in{std::string(text)};
        in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (in.fail()) return std::nullopt;

        std::time_t t = timegm(&tm);
        if (t == static_cast<std::time_t>(-1)) return std::nullopt;
        return Clock::from_time_t(t);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace folio::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/config.hpp>
#include <folio/core/timestamp.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio::mirror {

// A host serving a copy of the archive
struct MirrorSite {
    std::string name;
    std::string base_url;               // normalized, trailing slash
    std::uint32_t priority{1};          // higher is preferred
    std::string country;
    bool active{true};
    double health_score{core::HEALTH_MAX};
    std::optional<core::Timestamp> last_checked;
    std::optional<core::Timestamp> last_success;
};

// Adds a trailing slash and upgrades http to https, except for hosts without TLS
[[nodiscard]] std::string normalize_base_url(std::string_view url);

// Built-in list used when no mirror file exists
[[nodiscard]] std::vector<MirrorSite> default_mirrors();

} // namespace folio::mirror

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string_view>

// Set from the CMake project version
#ifndef FOLIO_VERSION
#define FOLIO_VERSION "0.0.0"
#endif

namespace folio {

inline constexpr std::string_view version = FOLIO_VERSION;

// Product token sent in the User-Agent header
inline constexpr std::string_view user_agent_product = "folio/" FOLIO_VERSION;

} // namespace folio

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

namespace folio::core {

// Runtime configuration, persisted as JSON
struct Settings {
    std::string download_dir{"downloads"};
    std::string mirrors_file;
    std::string catalog_file;
    std::string queue_state_file{"queue_state.json"};
    std::uint32_t max_workers{0};
    std::uint32_t max_retries{0};
    std::uint32_t metadata_concurrency{0};
    std::uint32_t timeout_sec{0};
    std::string user_agent;
    bool use_mirrors{true};
    bool resumable{true};
    bool verify_size{true};
    std::uint64_t incomplete_threshold{0};
    std::string primary_site;
    std::string log_level{"info"};
    std::string log_file;

    // Built-in defaults, with per-user paths resolved
    [[nodiscard]] static Settings defaults();

    // $HOME/.folio, or ./.folio when HOME is unset
    [[nodiscard]] static std::filesystem::path config_dir();

    [[nodiscard]] static std::filesystem::path default_path();

    // Missing file gives defaults; malformed file gives parse_error
    [[nodiscard]] static std::expected<Settings, std::error_code>
    load(const std::filesystem::path& path) noexcept;

    [[nodiscard]] std::error_code save(const std::filesystem::path& path) const noexcept;
};

} // namespace folio::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/core/settings.hpp>
#include <folio/core/config.hpp>
#include <folio/core/logger.hpp>
#include <folio/disk/error.hpp>
#include <folio/version.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace folio::core {

namespace fs = std::filesystem;

Settings Settings::defaults() {
    Settings s;
    s.mirrors_file = (config_dir() / "mirrors.json").string();
    s.catalog_file = (config_dir() / "catalog.json").string();
    s.max_workers = DEFAULT_WORKERS;
    s.max_retries = MAX_RETRIES;
    s.metadata_concurrency = METADATA_CONCURRENCY;
    s.timeout_sec = CONNECTION_TIMEOUT_SEC;
    s.user_agent = fmt::format("{} (+bulk EPUB downloader)", folio::user_agent_product);
    s.incomplete_threshold = INCOMPLETE_THRESHOLD;
    s.primary_site = std::string(PRIMARY_SITE);
    return s;
}

fs::path Settings::config_dir() {
    const char* home = std::getenv("HOME");
    fs::path base = (home && *home) ? fs::path(home) : fs::current_path();
    return base / CONFIG_DIR_NAME;
}

fs::path Settings::default_path() {
    return config_dir() / "config.json";
}

std::expected<Settings, std::error_code> Settings::load(const fs::path& path) noexcept {
    Settings s = defaults();

    std::error_code fs_ec;
    if (!fs::exists(path, fs_ec)) {
        return s;
    }

    try {
        std::ifstream file(path);
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::read_error));
        }

        auto j = nlohmann::json::parse(file);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(DownloadErrc::parse_error));
        }

        s.download_dir = j.value("download_dir", s.download_dir);
        s.mirrors_file = j.value("mirrors_file", s.mirrors_file);
        s.catalog_file = j.value("catalog_file", s.catalog_file);
        s.queue_state_file = j.value("queue_state_file", s.queue_state_file);
        s.max_workers = std::max<std::uint32_t>(1, j.value("max_workers", s.max_workers));
        s.max_retries = std::max<std::uint32_t>(1, j.value("max_retries", s.max_retries));
        s.metadata_concurrency = std::max<std::uint32_t>(1, j.value("metadata_concurrency", s.metadata_concurrency));
        s.timeout_sec = j.value("timeout_sec", s.timeout_sec);
        s.user_agent = j.value("user_agent", s.user_agent);
        s.use_mirrors = j.value("use_mirrors", s.use_mirrors);
        s.resumable = j.value("resumable", s.resumable);
        s.verify_size = j.value("verify_size", s.verify_size);
        s.incomplete_threshold = j.value("incomplete_threshold", s.incomplete_threshold);
        s.primary_site = j.value("primary_site", s.primary_site);
        s.log_level = j.value("log_level", s.log_level);
        s.log_file = j.value("log_file", s.log_file);
    } catch (const nlohmann::json::exception& e) {
        FOLIO_LOG_ERROR("Invalid settings file {}: {}", path.string(), e.what());
        return std::unexpected(make_error_code(DownloadErrc::parse_error));
    } catch (const std::exception& e) {
        FOLIO_LOG_ERROR("Cannot read settings file {}: {}", path.string(), e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }

    if (!parse_log_level(s.log_level)) {
        FOLIO_LOG_WARN("Unknown log level '{}', using info", s.log_level);
        s.log_level = "info";
    }

    return s;
}

std::error_code Settings::save(const fs::path& path) const noexcept {
    try {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }

        nlohmann::json j = {
            {"download_dir", download_dir},
            {"mirrors_file", mirrors_file},
            {"catalog_file", catalog_file},
            {"queue_state_file", queue_state_file},
            {"max_workers", max_workers},
            {"max_retries", max_retries},
            {"metadata_concurrency", metadata_concurrency},
            {"timeout_sec", timeout_sec},
            {"user_agent", user_agent},
            {"use_mirrors", use_mirrors},
            {"resumable", resumable},
            {"verify_size", verify_size},
            {"incomplete_threshold", incomplete_threshold},
            {"primary_site", primary_site},
            {"log_level", log_level},
            {"log_file", log_file},
        };

        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            return make_error_code(disk::DiskErrc::write_error);
        }
        file << j.dump(2) << '\n';
        return file ? std::error_code{} : make_error_code(disk::DiskErrc::write_error);
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
}

} // namespace folio::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <folio/core/config.hpp>
#include <folio/core/logger.hpp>
#include <folio/core/settings.hpp>
#include <folio/core/timestamp.hpp>
#include <folio/version.hpp>
#include "temp_dir.hpp"

using namespace folio::core;
using folio::testing::TempDir;

TEST_CASE("Settings::load", "[settings]") {
    TempDir dir;

    SECTION("Missing file gives defaults") {
        auto settings = Settings::load(dir / "config.json");
        REQUIRE(settings);
        CHECK(settings->max_workers == DEFAULT_WORKERS);
        CHECK(settings->max_retries == MAX_RETRIES);
        CHECK(settings->metadata_concurrency == METADATA_CONCURRENCY);
        CHECK(settings->primary_site == PRIMARY_SITE);
        CHECK(settings->incomplete_threshold == INCOMPLETE_THRESHOLD);
        CHECK(settings->mirrors_file.ends_with("mirrors.json"));
        CHECK(settings->user_agent.starts_with(folio::user_agent_product));
        CHECK(settings->use_mirrors);
    }

    SECTION("Present keys override defaults") {
        dir.write("config.json", R"({
            "download_dir": "/srv/books",
            "max_workers": 8,
            "use_mirrors": false,
            "log_level": "debug"
        })");
        auto settings = Settings::load(dir / "config.json");
        REQUIRE(settings);
        CHECK(settings->download_dir == "/srv/books");
        CHECK(settings->max_workers == 8);
        CHECK(!settings->use_mirrors);
        CHECK(settings->log_level == "debug");
        CHECK(settings->max_retries == MAX_RETRIES);
    }

    SECTION("Zero counts are raised to one") {
        dir.write("config.json", R"({"max_workers": 0, "max_retries": 0, "metadata_concurrency": 0})");
        auto settings = Settings::load(dir / "config.json");
        REQUIRE(settings);
        CHECK(settings->max_workers == 1);
        CHECK(settings->max_retries == 1);
        CHECK(settings->metadata_concurrency == 1);
    }

    SECTION("Unknown log level falls back to info") {
        dir.write("config.json", R"({"log_level": "chatty"})");
        CHECK(Settings::load(dir / "config.json")->log_level == "info");
    }

    SECTION("Malformed files are rejected") {
        dir.write("config.json", "{\"max_workers\": ");
        auto settings = Settings::load(dir / "config.json");
        REQUIRE(!settings);
        CHECK(settings.error() == DownloadErrc::parse_error);

        dir.write("config.json", R"({"max_workers": "many"})");
        CHECK(!Settings::load(dir / "config.json"));

        dir.write("config.json", "[1, 2]");
        CHECK(!Settings::load(dir / "config.json"));
    }

    SECTION("Saved settings load back") {
        auto settings = Settings::defaults();
        settings.download_dir = "library";
        settings.max_workers = 6;
        settings.resumable = false;
        REQUIRE(!settings.save(dir / "sub" / "config.json"));

        auto loaded = Settings::load(dir / "sub" / "config.json");
        REQUIRE(loaded);
        CHECK(loaded->download_dir == "library");
        CHECK(loaded->max_workers == 6);
        CHECK(!loaded->resumable);
    }
}

TEST_CASE("parse_log_level", "[settings]") {
    CHECK(parse_log_level("debug") == LogLevel::debug);
    CHECK(parse_log_level("warn") == LogLevel::warn);
    CHECK(parse_log_level("error") == LogLevel::error);
    CHECK(!parse_log_level("loud"));
}

TEST_CASE("ISO 8601 timestamps", "[settings]") {
    auto tp = from_iso8601("2024-02-29T12:34:56Z");
    REQUIRE(tp);
    CHECK(std::chrono::duration_cast<std::chrono::seconds>(tp->time_since_epoch()).count() == 1709210096);
    CHECK(to_iso8601(*tp) == "2024-02-29T12:34:56Z");

    CHECK(!from_iso8601("yesterday"));
    CHECK(!from_iso8601(""));
}

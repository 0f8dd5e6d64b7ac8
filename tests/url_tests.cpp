// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <folio/core/url.hpp>

using namespace folio::core;

TEST_CASE("Url::parse - valid URLs", "[url]") {
    SECTION("HTTPS URL") {
        auto result = Url::parse("https://www.gutenberg.org/ebooks/1342.epub");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.scheme() == "https");
        CHECK(url.host() == "www.gutenberg.org");
        CHECK(url.path() == "/ebooks/1342.epub");
        CHECK(url.is_secure());
    }

    SECTION("HTTP URL with port") {
        auto result = Url::parse("http://mirror.example.org:8080/gutenberg/");
        REQUIRE(result.has_value());
        CHECK(result->scheme() == "http");
        CHECK(result->port() == "8080");
        CHECK(!result->is_secure());
        CHECK(result->base() == "http://mirror.example.org:8080");
    }

    SECTION("Scheme and host are lowercased") {
        auto result = Url::parse("HTTPS://Gutenberg.PGLAF.org/cache/");
        REQUIRE(result.has_value());
        CHECK(result->scheme() == "https");
        CHECK(result->host() == "gutenberg.pglaf.org");
        CHECK(result->path() == "/cache/");
    }

    SECTION("URL with query and fragment") {
        auto result = Url::parse("https://example.com/file.epub?v=1#section");
        REQUIRE(result.has_value());
        CHECK(result->query() == "v=1");
        CHECK(result->fragment() == "section");
        CHECK(result->full() == "https://example.com/file.epub?v=1#section");
    }

    SECTION("Host only gets root path") {
        auto result = Url::parse("https://example.com");
        REQUIRE(result.has_value());
        CHECK(result->path() == "/");
        CHECK(result->full() == "https://example.com/");
    }
}

TEST_CASE("Url::parse - invalid URLs", "[url]") {
    CHECK(!Url::parse("example.com/file.epub").has_value());
    CHECK(!Url::parse("").has_value());
    CHECK(!Url::parse("https:///path").has_value());
    CHECK(!Url::parse("https://example.com:80a/").has_value());

    auto result = Url::parse("://example.com");
    REQUIRE(!result.has_value());
    CHECK(result.error() == DownloadErrc::invalid_url);
}

TEST_CASE("Url::filename extraction", "[url]") {
    CHECK(Url::parse("https://example.com/cache/epub/84/pg84.epub")->filename() == "pg84.epub");
    CHECK(Url::parse("https://example.com/download.php?id=123")->filename() == "download.php");
    CHECK(Url::parse("https://example.com/folder/")->filename().empty());
}

TEST_CASE("Url::default_port", "[url]") {
    CHECK(Url::parse("https://example.com")->default_port() == 443);
    CHECK(Url::parse("http://example.com")->default_port() == 80);
    CHECK(Url::parse("ftp://example.com")->default_port() == 21);
}

TEST_CASE("in_domain matches hosts and subdomains", "[url]") {
    CHECK(in_domain("gutenberg.org", "gutenberg.org"));
    CHECK(in_domain("www.gutenberg.org", "gutenberg.org"));
    CHECK(!in_domain("notgutenberg.org", "gutenberg.org"));
    CHECK(!in_domain("gutenberg.org.evil.com", "gutenberg.org"));
    CHECK(!in_domain("gutenberg.org", ""));
}

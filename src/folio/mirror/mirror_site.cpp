// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/mirror/mirror_site.hpp>
#include <folio/core/url.hpp>
#include <algorithm>
#include <array>
#include <cctype>

namespace folio::mirror {

namespace {

// Mirrors that only serve plain http
constexpr std::array<std::string_view, 2> PLAIN_HTTP_HOSTS = {
    "di.uminho.pt",
    "csclub.uwaterloo.ca",
};

} // namespace

std::string normalize_base_url(std::string_view url) {
    while (!url.empty() && std::isspace(static_cast<unsigned char>(url.front()))) url.remove_prefix(1);
    while (!url.empty() && std::isspace(static_cast<unsigned char>(url.back()))) url.remove_suffix(1);

    std::string result(url);

    if (auto parsed = core::Url::parse(url); parsed && parsed->scheme() == "http") {
        bool plain_only = std::any_of(PLAIN_HTTP_HOSTS.begin(), PLAIN_HTTP_HOSTS.end(),
            [&](std::string_view domain) { return core::in_domain(parsed->host(), domain); });
        if (!plain_only) {
            result = "https://" + result.substr(result.find("://") + 3);
        }
    }

    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    result += '/';
    return result;
}

std::vector<MirrorSite> default_mirrors() {
    auto site = [](std::string name, std::string_view url, std::uint32_t priority, std::string country) {
        MirrorSite s;
        s.name = std::move(name);
        s.base_url = normalize_base_url(url);
        s.priority = priority;
        s.country = std::move(country);
        return s;
    };

    return {
        site("Project Gutenberg Main", core::PRIMARY_SITE, 5, "US"),
        site("Project Gutenberg PGLAF", "https://gutenberg.pglaf.org/", 4, "US"),
        site("Aleph PGLAF", "https://aleph.pglaf.org/", 4, "US"),
        site("Nabasny", "https://gutenberg.nabasny.com/", 3, "US"),
        site("UK Mirror Service", "http://www.mirrorservice.org/sites/ftp.ibiblio.org/pub/docs/books/gutenberg/", 2, "UK"),
        site("Xmission", "http://mirrors.xmission.com/gutenberg/", 2, "US"),
        site("University of Minho", "http://eremita.di.uminho.pt/gutenberg/", 1, "PT"),
        site("University of Waterloo", "http://mirror.csclub.uwaterloo.ca/gutenberg/", 1, "CA"),
    };
}

} // namespace folio::mirror

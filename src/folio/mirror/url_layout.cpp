// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/mirror/url_layout.hpp>
#include <folio/core/url.hpp>
#include <fmt/format.h>

namespace folio::mirror {

namespace {

constexpr std::string_view CACHE_LAYOUT = "{base}/cache/epub/{id}/pg{id}.epub";

std::string render(const std::string& path_template, std::string_view base, core::BookId id) {
    return fmt::format(fmt::runtime(path_template), fmt::arg("base", base), fmt::arg("id", id));
}

} // namespace

UrlLayoutTable::UrlLayoutTable()
    : fallback_(CACHE_LAYOUT) {}

UrlLayoutTable UrlLayoutTable::defaults() {
    UrlLayoutTable table;
    table.layouts_ = {
        {"gutenberg.org", "{base}/ebooks/{id}.epub"},
        {"pglaf.org", std::string(CACHE_LAYOUT)},
        {"nabasny.com", "{base}/{id}.epub"},
        {"xmission.com", std::string(CACHE_LAYOUT)},
    };
    return table;
}

bool UrlLayoutTable::valid_template(const std::string& path_template) noexcept {
    try {
        (void)render(path_template, "https://example.org", 1);
        return true;
    } catch (const fmt::format_error&) {
        return false;
    }
}

std::error_code UrlLayoutTable::add(std::string domain, std::string path_template) {
    if (domain.empty() || !valid_template(path_template)) {
        return make_error_code(core::DownloadErrc::invalid_url);
    }
    layouts_.insert(layouts_.begin(), UrlLayout{std::move(domain), std::move(path_template)});
    return {};
}

std::error_code UrlLayoutTable::fallback(std::string path_template) {
    if (!valid_template(path_template)) {
        return make_error_code(core::DownloadErrc::invalid_url);
    }
    fallback_ = std::move(path_template);
    return {};
}

const std::string& UrlLayoutTable::match(std::string_view base_url) const noexcept {
    auto parsed = core::Url::parse(base_url);
    if (!parsed) return fallback_;

    for (const auto& layout : layouts_) {
        if (core::in_domain(parsed->host(), layout.domain)) {
            return layout.path_template;
        }
    }
    return fallback_;
}

std::string UrlLayoutTable::build(core::BookId id, std::string_view base_url) const {
    auto base = base_url;
    while (!base.empty() && base.back() == '/') {
        base.remove_suffix(1);
    }
    return render(match(base_url), base, id);
}

} // namespace folio::mirror

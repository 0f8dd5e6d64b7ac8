// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/download_record.hpp>
#include <folio/core/error.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace folio::mirror {

// Path template for hosts under a domain.
// Templates use {base} (base URL without trailing slash) and {id}.
struct UrlLayout {
    std::string domain;
    std::string path_template;
};

// Maps a mirror host to the location of a book's EPUB on it
class UrlLayoutTable {
public:
    UrlLayoutTable();

    // Layouts for the known archive mirrors
    [[nodiscard]] static UrlLayoutTable defaults();

    // Newer layouts take precedence over older ones for the same host
    [[nodiscard]] std::error_code add(std::string domain, std::string path_template);

    [[nodiscard]] std::error_code fallback(std::string path_template);

    [[nodiscard]] std::string build(core::BookId id, std::string_view base_url) const;

    // Template that build() would use for this base URL
    [[nodiscard]] const std::string& match(std::string_view base_url) const noexcept;

    [[nodiscard]] const std::vector<UrlLayout>& layouts() const noexcept { return layouts_; }

private:
    [[nodiscard]] static bool valid_template(const std::string& path_template) noexcept;

    std::vector<UrlLayout> layouts_;
    std::string fallback_;
};

} // namespace folio::mirror

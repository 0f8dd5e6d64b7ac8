// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>

namespace folio::disk {

// Local file failures. These are never retried and never count against a mirror.
enum class DiskErrc {
    file_not_found = 1,
    access_denied,      // EACCES, EPERM, EROFS
    disk_full,          // ENOSPC, EDQUOT
    invalid_path,       // ENOENT, ENOTDIR, ENAMETOOLONG
    write_error,
    read_error,
    handle_invalid,     // writer used before open() or opened twice
};

[[nodiscard]] const std::error_category& disk_category() noexcept;

[[nodiscard]] inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_category()};
}

[[nodiscard]] inline bool is_disk_error(const std::error_code& ec) noexcept {
    return ec && ec.category() == disk_category();
}

// errno from a failed open/write/create_directories
[[nodiscard]] std::error_code from_errno(int err) noexcept;

} // namespace folio::disk

namespace std {

template<>
struct is_error_code_enum<folio::disk::DiskErrc> : true_type {};

} // namespace std

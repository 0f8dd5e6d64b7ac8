// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/disk/error.hpp>
#include <cerrno>
#include <string>

namespace folio::disk {

namespace {

class DiskCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "folio::disk"; }

    std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::file_not_found: return "File not found";
            case DiskErrc::access_denied:  return "Access denied";
            case DiskErrc::disk_full:      return "Disk full";
            case DiskErrc::invalid_path:   return "Invalid path";
            case DiskErrc::write_error:    return "Write error";
            case DiskErrc::read_error:     return "Read error";
            case DiskErrc::handle_invalid: return "File not open";
        }
        return "Unknown disk error";
    }
};

} // namespace

const std::error_category& disk_category() noexcept {
    static const DiskCategory category;
    return category;
}

std::error_code from_errno(int err) noexcept {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
        case ENAMETOOLONG:
            return make_error_code(DiskErrc::invalid_path);
        case EACCES:
        case EPERM:
        case EROFS:
            return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:
            return make_error_code(DiskErrc::disk_full);
        default:
            return make_error_code(DiskErrc::write_error);
    }
}

} // namespace folio::disk

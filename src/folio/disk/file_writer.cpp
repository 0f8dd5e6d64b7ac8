// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/disk/file_writer.hpp>
#include <cerrno>

namespace folio::disk {

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    if (file_) {
        (void)close();
    }
}

std::error_code FileWriter::open(const std::filesystem::path& path, OpenMode mode) noexcept {
    if (file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    errno = 0;
    std::FILE* f = std::fopen(path.c_str(), mode == OpenMode::append ? "ab" : "wb");
    if (!f) {
        return from_errno(errno);
    }

    file_.reset(f);
    path_ = path;
    bytes_written_ = 0;
    return {};
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (size == 0) {
        return {};
    }

    errno = 0;
    std::size_t written = std::fwrite(data, 1, size, file_.get());
    bytes_written_ += written;
    if (written != size) {
        return from_errno(errno);
    }
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    errno = 0;
    if (std::fflush(file_.get()) != 0) {
        return from_errno(errno);
    }
    return {};
}

std::error_code FileWriter::close() noexcept {
    if (!file_) {
        return {};
    }

    auto ec = flush();
    std::FILE* f = file_.release();
    if (std::fclose(f) != 0 && !ec) {
        ec = make_error_code(DiskErrc::write_error);
    }
    return ec;
}

} // namespace folio::disk

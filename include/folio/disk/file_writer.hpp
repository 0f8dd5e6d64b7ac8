// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/disk/error.hpp>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace folio::disk {

enum class OpenMode : std::uint8_t {
    truncate,  // Start from an empty file
    append     // Keep existing bytes, write after them
};

// Sequential writer for a single transfer
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&&) noexcept = default;
    FileWriter& operator=(FileWriter&&) noexcept = default;

    // Open file, creating it if missing
    [[nodiscard]] std::error_code open(const std::filesystem::path& path, OpenMode mode) noexcept;

    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    [[nodiscard]] std::error_code write(std::span<const std::byte> data) noexcept {
        return write(data.data(), data.size());
    }

    [[nodiscard]] std::error_code flush() noexcept;

    // Flushes before closing
    [[nodiscard]] std::error_code close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    // Bytes written since open()
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return bytes_written_; }

private:
    struct FileCloser {
        void operator()(std::FILE* f) const noexcept { if (f) std::fclose(f); }
    };

    std::unique_ptr<std::FILE, FileCloser> file_;
    std::filesystem::path path_;
    std::uint64_t bytes_written_{0};
};

} // namespace folio::disk

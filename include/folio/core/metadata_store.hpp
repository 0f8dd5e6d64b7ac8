// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/download_record.hpp>
#include <folio/core/error.hpp>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace folio::core {

// Book metadata and download bookkeeping consumed by the engine and queue
class MetadataStore {
public:
    virtual ~MetadataStore() = default;

    // Known EPUB download URLs for a book, preferred first
    [[nodiscard]] virtual std::vector<std::string> download_urls(BookId id) const = 0;

    [[nodiscard]] virtual std::optional<std::string> title(BookId id) const = 0;

    [[nodiscard]] virtual std::optional<DownloadRecord> record(BookId id) const = 0;

    [[nodiscard]] virtual std::vector<DownloadRecord> records() const = 0;

    virtual void update_record(const DownloadRecord& record) = 0;

    // Writes pending changes to durable storage
    [[nodiscard]] virtual std::error_code flush() noexcept { return {}; }

    [[nodiscard]] bool is_completed(BookId id) const {
        auto r = record(id);
        return r && r->status == RecordStatus::completed;
    }
};

struct BookEntry {
    BookId id{0};
    std::string title;
    std::vector<std::string> urls;
};

// JSON-file catalog; an empty path keeps everything in memory
class JsonCatalog final : public MetadataStore {
public:
    JsonCatalog() = default;
    explicit JsonCatalog(std::filesystem::path path) : path_(std::move(path)) {}

    JsonCatalog(const JsonCatalog&) = delete;
    JsonCatalog& operator=(const JsonCatalog&) = delete;

    // Missing file is not an error
    [[nodiscard]] std::error_code load() noexcept;

    // Replaces the file atomically; safe to call from several threads
    [[nodiscard]] std::error_code save() const noexcept;

    void add_book(BookEntry book);
    [[nodiscard]] bool contains(BookId id) const;

    [[nodiscard]] std::vector<std::string> download_urls(BookId id) const override;
    [[nodiscard]] std::optional<std::string> title(BookId id) const override;
    [[nodiscard]] std::optional<DownloadRecord> record(BookId id) const override;
    [[nodiscard]] std::vector<DownloadRecord> records() const override;
    void update_record(const DownloadRecord& record) override;
    [[nodiscard]] std::error_code flush() noexcept override { return save(); }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::map<BookId, BookEntry> books_;
    std::map<BookId, DownloadRecord> records_;
    mutable std::mutex mutex_;
    mutable std::mutex save_mutex_;  // one writer of the file at a time
};

} // namespace folio::core

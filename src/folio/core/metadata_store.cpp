// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/core/metadata_store.hpp>
#include <folio/core/logger.hpp>
#include <folio/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>

namespace folio::core {

namespace fs = std::filesystem;

std::string_view to_string(RecordStatus status) noexcept {
    switch (status) {
        case RecordStatus::pending:     return "pending";
        case RecordStatus::downloading: return "downloading";
        case RecordStatus::completed:   return "completed";
        case RecordStatus::failed:      return "failed";
    }
    return "pending";
}

std::optional<RecordStatus> parse_record_status(std::string_view text) noexcept {
    if (text == "pending") return RecordStatus::pending;
    if (text == "downloading") return RecordStatus::downloading;
    if (text == "completed") return RecordStatus::completed;
    if (text == "failed") return RecordStatus::failed;
    return std::nullopt;
}

namespace {

bool is_epub_url(const std::string& url) {
    auto lower = url;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("epub") != std::string::npos;
}

nlohmann::json record_to_json(const DownloadRecord& r) {
    return {
        {"book_id", r.book_id},
        {"status", to_string(r.status)},
        {"bytes_downloaded", r.bytes_downloaded},
        {"total_bytes", r.total_bytes},
        {"download_path", r.download_path},
        {"source_url", r.source_url},
        {"error_message", r.error_message},
        {"retry_count", r.retry_count},
    };
}

DownloadRecord record_from_json(const nlohmann::json& j) {
    DownloadRecord r;
    r.book_id = j.at("book_id").get<BookId>();
    r.status = parse_record_status(j.value("status", "pending")).value_or(RecordStatus::pending);
    r.bytes_downloaded = j.value("bytes_downloaded", std::uint64_t{0});
    r.total_bytes = j.value("total_bytes", std::uint64_t{0});
    r.download_path = j.value("download_path", "");
    r.source_url = j.value("source_url", "");
    r.error_message = j.value("error_message", "");
    r.retry_count = j.value("retry_count", std::uint32_t{0});
    return r;
}

} // namespace

//=============================================================================
// JsonCatalog
//=============================================================================

std::error_code JsonCatalog::load() noexcept {
    if (path_.empty()) return {};

    std::error_code fs_ec;
    if (!fs::exists(path_, fs_ec)) return {};

    try {
        std::ifstream file(path_);
        if (!file) {
            return make_error_code(disk::DiskErrc::read_error);
        }
        auto j = nlohmann::json::parse(file);

        std::map<BookId, BookEntry> books;
        for (const auto& b : j.value("books", nlohmann::json::array())) {
            BookEntry entry;
            entry.id = b.at("id").get<BookId>();
            entry.title = b.value("title", "");
            entry.urls = b.value("urls", std::vector<std::string>{});
            books[entry.id] = std::move(entry);
        }

        std::map<BookId, DownloadRecord> records;
        for (const auto& r : j.value("records", nlohmann::json::array())) {
            auto rec = record_from_json(r);
            records[rec.book_id] = std::move(rec);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        books_ = std::move(books);
        records_ = std::move(records);
        return {};
    } catch (const std::exception& e) {
        FOLIO_LOG_ERROR("Cannot load catalog {}: {}", path_.string(), e.what());
        return make_error_code(DownloadErrc::parse_error);
    }
}

std::error_code JsonCatalog::save() const noexcept {
    if (path_.empty()) return {};

    try {
        std::lock_guard<std::mutex> writer(save_mutex_);
        nlohmann::json j;
        j["books"] = nlohmann::json::array();
        j["records"] = nlohmann::json::array();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [id, b] : books_) {
                j["books"].push_back({{"id", b.id}, {"title", b.title}, {"urls", b.urls}});
            }
            for (const auto& [id, r] : records_) {
                j["records"].push_back(record_to_json(r));
            }
        }

        if (path_.has_parent_path()) {
            fs::create_directories(path_.parent_path());
        }
        auto tmp = path_;
        tmp += ".tmp";
        {
            std::ofstream file(tmp, std::ios::trunc);
            if (!file) {
                return make_error_code(disk::DiskErrc::write_error);
            }
            file << j.dump(2) << '\n';
            file.close();
            if (!file) {
                return make_error_code(disk::DiskErrc::write_error);
            }
        }

        std::error_code ec;
        fs::rename(tmp, path_, ec);
        if (ec) {
            FOLIO_LOG_ERROR("Cannot replace catalog {}: {}", path_.string(), ec.message());
            return make_error_code(disk::DiskErrc::write_error);
        }
        return {};
    } catch (const std::exception& e) {
        FOLIO_LOG_ERROR("Cannot save catalog {}: {}", path_.string(), e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

void JsonCatalog::add_book(BookEntry book) {
    std::lock_guard<std::mutex> lock(mutex_);
    books_[book.id] = std::move(book);
}

bool JsonCatalog::contains(BookId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return books_.contains(id);
}

std::vector<std::string> JsonCatalog::download_urls(BookId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = books_.find(id);
    if (it == books_.end()) return {};

    std::vector<std::string> urls;
    std::copy_if(it->second.urls.begin(), it->second.urls.end(), std::back_inserter(urls), is_epub_url);
    return urls;
}

std::optional<std::string> JsonCatalog::title(BookId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = books_.find(id);
    if (it == books_.end()) return std::nullopt;
    return it->second.title;
}

std::optional<DownloadRecord> JsonCatalog::record(BookId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

std::vector<DownloadRecord> JsonCatalog::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DownloadRecord> out;
    out.reserve(records_.size());
    for (const auto& [id, r] : records_) {
        out.push_back(r);
    }
    return out;
}

void JsonCatalog::update_record(const DownloadRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.book_id] = record;
}

} // namespace folio::core

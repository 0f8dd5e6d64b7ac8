// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/core/download_engine.hpp>
#include <folio/core/logger.hpp>
#include <folio/disk/error.hpp>
#include <folio/disk/file_writer.hpp>
#include <folio/mirror/mirror_manager.hpp>
#include <algorithm>
#include <memory>
#include <thread>
#include <tuple>

namespace folio::core {

namespace fs = std::filesystem;

//=============================================================================
// DownloadEngine
//=============================================================================

namespace {

// Non-owning handle for borrowed components
template<typename T>
std::shared_ptr<T> unowned(T* ptr) {
    return std::shared_ptr<T>(std::shared_ptr<T>{}, ptr);
}

} // namespace

DownloadEngine::DownloadEngine(std::shared_ptr<HttpClient> http,
                               mirror::MirrorManager* mirrors,
                               MetadataStore* store,
                               const ShutdownContext* shutdown)
    : DownloadEngine(std::move(http), unowned(mirrors), unowned(store), shutdown) {}

DownloadEngine::DownloadEngine(std::shared_ptr<HttpClient> http,
                               std::shared_ptr<mirror::MirrorManager> mirrors,
                               std::shared_ptr<MetadataStore> store,
                               const ShutdownContext* shutdown)
    : http_(std::move(http))
    , mirrors_(std::move(mirrors))
    , store_(std::move(store))
    , shutdown_(shutdown)
    , sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

void DownloadEngine::save_record(const DownloadRecord& record, bool durable) noexcept {
    if (!store_) return;
    try {
        store_->update_record(record);
    } catch (const std::exception& e) {
        FOLIO_LOG_WARN("Failed to update record for book {}: {}", record.book_id, e.what());
        return;
    }
    if (durable) {
        if (auto ec = store_->flush()) {
            FOLIO_LOG_WARN("Failed to persist record for book {}: {}", record.book_id, ec.message());
        }
    }
}

std::error_code DownloadEngine::download(BookId book,
                                         const std::string& source_url,
                                         const fs::path& output,
                                         const DownloadOptions& options,
                                         const ProgressCallback& progress) {
    std::error_code fs_ec;

    if (store_ && options.skip_completed && store_->is_completed(book) && fs::exists(output, fs_ec)) {
        FOLIO_LOG_INFO("Book {} already downloaded to {}", book, output.string());
        return {};
    }

    if (output.has_parent_path()) {
        fs::create_directories(output.parent_path(), fs_ec);
        if (fs_ec) {
            FOLIO_LOG_ERROR("Cannot create directory {}: {}", output.parent_path().string(), fs_ec.message());
            return disk::from_errno(fs_ec.value());
        }
    }

    const bool mirrored = options.use_mirrors && mirrors_ != nullptr;
    std::string base;
    std::string url = source_url;
    if (mirrored) {
        std::tie(base, url) = mirrors_->url_for(book);
    }
    if (url.empty()) {
        return make_error_code(DownloadErrc::no_source_url);
    }

    DownloadRecord record;
    if (store_) {
        record = store_->record(book).value_or(DownloadRecord{});
    }
    record.book_id = book;
    record.download_path = output.string();
    record.error_message.clear();

    const std::uint32_t attempts = std::max<std::uint32_t>(1, options.max_attempts);
    std::error_code last;

    for (std::uint32_t attempt = 0; attempt < attempts; ++attempt) {
        record.source_url = url;
        record.retry_count = attempt;
        record.status = RecordStatus::downloading;
        save_record(record, true);

        FOLIO_LOG_INFO("Downloading book {} from {} (attempt {}/{})", book, url, attempt + 1, attempts);
        last = transfer(url, output, options, progress, record);

        if (!last) {
            if (mirrored) {
                mirrors_->report_success(base);
                mirrors_->record_availability(book, base);
            }
            record.status = RecordStatus::completed;
            save_record(record, true);
            FOLIO_LOG_INFO("Book {} saved to {} ({} bytes)", book, output.string(), record.bytes_downloaded);
            return {};
        }

        FOLIO_LOG_WARN("Book {} attempt {} failed: {}", book, attempt + 1, last.message());

        // Local problems are not the host's fault and will not go away by retrying
        if (disk::is_disk_error(last)) {
            break;
        }

        if (mirrored) {
            mirrors_->report_failure(base);
        }

        if (attempt + 1 >= attempts) {
            break;
        }
        if (shutdown_ && shutdown_->requested()) {
            FOLIO_LOG_INFO("Shutdown requested, not retrying book {}", book);
            break;
        }

        if (mirrored) {
            if (last == DownloadErrc::not_found) {
                // This host lacks the book: rotate immediately
                mirrors_->exclude_next(base);
                auto [next_base, next_url] = mirrors_->url_for(book);
                if (next_url == url) {
                    FOLIO_LOG_WARN("No alternate mirror has book {}", book);
                    break;
                }
                base = std::move(next_base);
                url = std::move(next_url);
                continue;
            }
            std::tie(base, url) = mirrors_->url_for(book);
        }

        auto delay = BACKOFF_BASE * (1u << attempt);
        FOLIO_LOG_INFO("Retrying book {} in {}s", book, delay.count());
        sleeper_(std::chrono::duration_cast<std::chrono::milliseconds>(delay));
    }

    record.status = RecordStatus::failed;
    record.error_message = last.message();
    save_record(record, true);
    return last;
}

std::error_code DownloadEngine::transfer(const std::string& url,
                                         const fs::path& output,
                                         const DownloadOptions& options,
                                         const ProgressCallback& progress,
                                         DownloadRecord& record) {
    std::error_code fs_ec;

    std::uint64_t existing = 0;
    if (options.resumable && fs::exists(output, fs_ec)) {
        auto size = fs::file_size(output, fs_ec);
        if (!fs_ec) existing = size;
    }
    const std::uint64_t requested_offset = existing;

    disk::FileWriter writer;
    std::error_code write_ec;
    std::uint64_t total = 0;
    std::uint64_t downloaded = 0;
    std::uint64_t last_saved = 0;

    auto on_response = [&](const HttpResponse& response) {
        auto mode = disk::OpenMode::truncate;
        if (existing > 0) {
            if (response.is_partial()) {
                mode = disk::OpenMode::append;
                FOLIO_LOG_DEBUG("Resuming {} at byte {}", output.string(), existing);
            } else {
                FOLIO_LOG_INFO("Server ignored range request for {}, restarting from zero", url);
                existing = 0;
            }
        }

        total = response.content_length > 0 ? response.content_length + existing : 0;
        downloaded = existing;
        last_saved = existing;

        write_ec = writer.open(output, mode);
        record.total_bytes = total;
        record.bytes_downloaded = downloaded;
        return !write_ec;
    };

    auto on_chunk = [&](std::span<const std::byte> data) {
        write_ec = writer.write(data);
        if (write_ec) return false;

        downloaded += data.size();
        if (progress) progress(downloaded, total);

        if (downloaded - last_saved >= RECORD_UPDATE_INTERVAL) {
            record.bytes_downloaded = downloaded;
            save_record(record);
            last_saved = downloaded;
        }
        return true;
    };

    auto result = http_->get(url, requested_offset, on_response, on_chunk);
    auto close_ec = writer.close();
    record.bytes_downloaded = downloaded;

    if (write_ec) {
        return write_ec;
    }
    if (!result) {
        if (result.error() == DownloadErrc::invalid_range && requested_offset > 0) {
            // Partial file is stale or already larger than the resource
            FOLIO_LOG_WARN("Range rejected for {}, discarding partial file", output.string());
            fs::remove(output, fs_ec);
        }
        return result.error();
    }
    if (close_ec) {
        return close_ec;
    }

    auto final_size = fs::file_size(output, fs_ec);
    if (fs_ec) {
        return make_error_code(disk::DiskErrc::file_not_found);
    }
    record.bytes_downloaded = final_size;

    if (options.verify_size && total > 0 && final_size != total) {
        FOLIO_LOG_WARN("Size mismatch for {}: expected {} bytes, got {}", output.string(), total, final_size);
        if (!options.resumable) {
            fs::remove(output, fs_ec);
        }
        return make_error_code(DownloadErrc::size_mismatch);
    }

    if (total == 0) {
        record.total_bytes = final_size;
    }
    return {};
}

std::vector<fs::path> DownloadEngine::find_incomplete_downloads(const fs::path& dir,
                                                                std::uint64_t threshold) const {
    std::vector<fs::path> found;
    std::error_code ec;

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || entry.path().extension() != ".epub") continue;

        auto size = entry.file_size(entry_ec);
        if (!entry_ec && size < threshold) {
            found.push_back(entry.path());
        }
    }
    if (ec) {
        FOLIO_LOG_WARN("Cannot scan {}: {}", dir.string(), ec.message());
    }

    std::sort(found.begin(), found.end());
    FOLIO_LOG_INFO("Found {} incomplete downloads in {}", found.size(), dir.string());
    return found;
}

std::map<fs::path, bool>
DownloadEngine::resume_incomplete_downloads(const std::vector<fs::path>& paths,
                                            const std::map<fs::path, std::string>& urls,
                                            const ProgressCallback& progress) {
    std::map<fs::path, bool> results;

    std::map<std::string, BookId> books;
    if (store_) {
        for (const auto& r : store_->records()) {
            books[r.download_path] = r.book_id;
        }
    }

    DownloadOptions options;
    options.resumable = true;
    options.use_mirrors = false;
    options.skip_completed = false;

    for (const auto& path : paths) {
        auto url = urls.find(path);
        if (url == urls.end() || url->second.empty()) {
            FOLIO_LOG_WARN("No source URL recorded for {}", path.string());
            results[path] = false;
            continue;
        }

        auto book = books.find(path.string());
        auto ec = download(book != books.end() ? book->second : 0, url->second, path, options, progress);
        results[path] = !ec;
    }
    return results;
}

std::map<fs::path, std::string> DownloadEngine::known_sources() const {
    std::map<fs::path, std::string> sources;
    if (!store_) return sources;

    for (const auto& r : store_->records()) {
        if (!r.download_path.empty() && !r.source_url.empty()) {
            sources[r.download_path] = r.source_url;
        }
    }
    return sources;
}

VerifyReport DownloadEngine::verify_downloads() const {
    VerifyReport report;
    if (!store_) return report;

    for (const auto& r : store_->records()) {
        if (r.status != RecordStatus::completed) continue;

        std::error_code ec;
        if (r.download_path.empty() || !fs::exists(r.download_path, ec)) {
            report.missing.push_back(r.book_id);
            continue;
        }

        auto size = fs::file_size(r.download_path, ec);
        if (ec || (r.total_bytes > 0 && size != r.total_bytes)) {
            report.corrupted.push_back(r.book_id);
        } else {
            report.verified.push_back(r.book_id);
        }
    }

    FOLIO_LOG_INFO("Verified {} downloads: {} ok, {} missing, {} corrupted",
                   report.verified.size() + report.missing.size() + report.corrupted.size(),
                   report.verified.size(), report.missing.size(), report.corrupted.size());
    return report;
}

} // namespace folio::core

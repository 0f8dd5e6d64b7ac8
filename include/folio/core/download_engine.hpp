// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/config.hpp>
#include <folio/core/download_record.hpp>
#include <folio/core/error.hpp>
#include <folio/core/http_client.hpp>
#include <folio/core/metadata_store.hpp>
#include <folio/core/shutdown.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace folio::mirror {
class MirrorManager;
}

namespace folio::core {

struct DownloadOptions {
    bool resumable{true};          // append to an existing partial file
    bool verify_size{true};        // compare final size with the announced size
    bool use_mirrors{true};        // pick the host through the mirror manager
    bool skip_completed{true};     // trust a completed record whose file exists
    std::uint32_t max_attempts{DOWNLOAD_ATTEMPTS};
};

// (bytes downloaded so far, total bytes or 0 when unknown)
using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;

using Sleeper = std::function<void(std::chrono::milliseconds)>;

struct VerifyReport {
    std::vector<BookId> verified;
    std::vector<BookId> missing;
    std::vector<BookId> corrupted;
};

// Transfers one book to one path with resume, retry and mirror failover.
// Holds no per-transfer state, so a single engine may serve many threads.
class DownloadEngine {
public:
    // Borrows mirrors and store; both must outlive every transfer
    explicit DownloadEngine(std::shared_ptr<HttpClient> http,
                            mirror::MirrorManager* mirrors = nullptr,
                            MetadataStore* store = nullptr,
                            const ShutdownContext* shutdown = nullptr);

    // Shares ownership, for engines that may outlive their creator in a detached worker
    DownloadEngine(std::shared_ptr<HttpClient> http,
                   std::shared_ptr<mirror::MirrorManager> mirrors,
                   std::shared_ptr<MetadataStore> store,
                   const ShutdownContext* shutdown = nullptr);

    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;

    // Empty error code on success
    [[nodiscard]] std::error_code download(BookId book,
                                           const std::string& source_url,
                                           const std::filesystem::path& output,
                                           const DownloadOptions& options = {},
                                           const ProgressCallback& progress = {});

    // EPUB files in dir smaller than threshold
    [[nodiscard]] std::vector<std::filesystem::path>
    find_incomplete_downloads(const std::filesystem::path& dir,
                              std::uint64_t threshold = INCOMPLETE_THRESHOLD) const;

    // Resumes each path from its recorded URL; paths without one fail
    [[nodiscard]] std::map<std::filesystem::path, bool>
    resume_incomplete_downloads(const std::vector<std::filesystem::path>& paths,
                                const std::map<std::filesystem::path, std::string>& urls,
                                const ProgressCallback& progress = {});

    // Download path to source URL for every record that has both
    [[nodiscard]] std::map<std::filesystem::path, std::string> known_sources() const;

    // Checks completed records against the files on disk
    [[nodiscard]] VerifyReport verify_downloads() const;

    // Replaces the backoff wait
    void sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

private:
    [[nodiscard]] std::error_code transfer(const std::string& url,
                                           const std::filesystem::path& output,
                                           const DownloadOptions& options,
                                           const ProgressCallback& progress,
                                           DownloadRecord& record);

    // durable also flushes the store, for state changes a restart must see
    void save_record(const DownloadRecord& record, bool durable = false) noexcept;

    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<mirror::MirrorManager> mirrors_;
    std::shared_ptr<MetadataStore> store_;
    const ShutdownContext* shutdown_;
    Sleeper sleeper_;
};

} // namespace folio::core

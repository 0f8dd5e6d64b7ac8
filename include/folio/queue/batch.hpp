// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/config.hpp>
#include <folio/core/download_engine.hpp>
#include <folio/core/shutdown.hpp>
#include <folio/queue/download_queue.hpp>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace folio::queue {

struct BatchSummary {
    std::size_t succeeded{0};
    std::size_t failed{0};
};

struct BatchItem {
    core::BookId book_id{0};
    std::string source_url;
    std::filesystem::path output_path;
};

// Resolves and enqueues books with at most `concurrency` lookups in flight
BatchSummary enqueue_many(DownloadQueue& queue,
                          const std::vector<core::BookId>& books,
                          Priority priority = Priority::normal,
                          const std::filesystem::path& output_dir = "downloads",
                          std::size_t concurrency = core::METADATA_CONCURRENCY);

// Runs transfers directly on the engine, at most `concurrency` at once.
// Items not yet started when shutdown is requested count as failed.
BatchSummary download_many(core::DownloadEngine& engine,
                           const std::vector<BatchItem>& items,
                           const core::DownloadOptions& options = {},
                           std::size_t concurrency = core::DEFAULT_WORKERS,
                           const core::ShutdownContext* shutdown = nullptr);

} // namespace folio::queue

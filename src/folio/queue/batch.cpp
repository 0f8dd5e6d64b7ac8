// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/queue/batch.hpp>
#include <folio/core/logger.hpp>
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

namespace folio::queue {

namespace {

// Calls fn(i) for every index from a fixed pool of at most `concurrency` threads
template<typename Fn>
BatchSummary run_bounded(std::size_t count, std::size_t concurrency, Fn&& fn) {
    std::atomic<std::size_t> next{0};
    std::atomic<std::size_t> succeeded{0};
    std::atomic<std::size_t> failed{0};

    auto work = [&] {
        for (auto i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
            bool ok = false;
            try {
                ok = fn(i);
            } catch (const std::exception& e) {
                FOLIO_LOG_ERROR("Batch item {} failed: {}", i, e.what());
            }
            (ok ? succeeded : failed).fetch_add(1, std::memory_order_relaxed);
        }
    };

    {
        const auto pool = std::min(std::max<std::size_t>(1, concurrency), count);
        std::vector<std::jthread> threads;
        threads.reserve(pool);
        for (std::size_t t = 0; t < pool; ++t) {
            threads.emplace_back(work);
        }
    }

    return {succeeded.load(), failed.load()};
}

} // namespace

BatchSummary enqueue_many(DownloadQueue& queue,
                          const std::vector<core::BookId>& books,
                          Priority priority,
                          const std::filesystem::path& output_dir,
                          std::size_t concurrency) {
    auto summary = run_bounded(books.size(), concurrency, [&](std::size_t i) {
        return !queue.add_task(books[i], priority, output_dir);
    });

    FOLIO_LOG_INFO("Queued {} of {} books", summary.succeeded, books.size());
    return summary;
}

BatchSummary download_many(core::DownloadEngine& engine,
                           const std::vector<BatchItem>& items,
                           const core::DownloadOptions& options,
                           std::size_t concurrency,
                           const core::ShutdownContext* shutdown) {
    auto summary = run_bounded(items.size(), concurrency, [&](std::size_t i) {
        if (shutdown && shutdown->requested()) {
            return false;
        }
        const auto& item = items[i];
        auto ec = engine.download(item.book_id, item.source_url, item.output_path, options);
        if (ec) {
            FOLIO_LOG_WARN("Book {} failed: {}", item.book_id, ec.message());
        }
        return !ec;
    });

    FOLIO_LOG_INFO("Downloaded {} of {} books", summary.succeeded, items.size());
    return summary;
}

} // namespace folio::queue

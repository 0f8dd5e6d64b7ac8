// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/config.hpp>
#include <folio/core/download_engine.hpp>
#include <folio/core/error.hpp>
#include <folio/core/metadata_store.hpp>
#include <folio/core/shutdown.hpp>
#include <folio/queue/download_task.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace folio::queue {

struct QueueOptions {
    std::uint32_t max_workers{core::DEFAULT_WORKERS};
    std::uint32_t max_retries{core::MAX_RETRIES};
    std::filesystem::path state_file{"queue_state.json"};   // empty disables saving on stop
    std::chrono::milliseconds poll_interval{core::QUEUE_POLL_INTERVAL};
    std::chrono::milliseconds shutdown_timeout{core::SHUTDOWN_TIMEOUT};
};

struct QueueStats {
    std::uint64_t queued{0};
    std::uint64_t downloading{0};
    std::uint64_t completed{0};
    std::uint64_t failed{0};
    std::uint64_t cancelled{0};
};

struct ActiveTask {
    core::BookId book_id{0};
    TaskStatus status{TaskStatus::downloading};
    std::optional<core::Timestamp> started_at;
};

struct QueueStatus {
    QueueStats stats;
    std::vector<ActiveTask> active_tasks;
    std::size_t queue_size{0};
    std::uint32_t workers{0};
    bool running{false};
};

// Performs one task; empty error code on success
using TaskRunner = std::function<std::error_code(const DownloadTask&)>;

// (book, bytes downloaded, total bytes)
using TaskProgress = std::function<void(core::BookId, std::uint64_t, std::uint64_t)>;

// Borrows the engine; it must outlive every worker
[[nodiscard]] TaskRunner engine_runner(core::DownloadEngine& engine,
                                       core::DownloadOptions options = {},
                                       TaskProgress progress = {});

// Keeps the engine alive for as long as the runner exists
[[nodiscard]] TaskRunner engine_runner(std::shared_ptr<core::DownloadEngine> engine,
                                       core::DownloadOptions options = {},
                                       TaskProgress progress = {});

// Priority worker pool over a shared task queue with persistent state.
// Workers abandoned by stop() keep running detached and hold the runner
// and store until they return. A borrowed store must outlive them; the
// shutdown context always must.
class DownloadQueue {
public:
    DownloadQueue(core::MetadataStore& store,
                  TaskRunner runner,
                  QueueOptions options = {},
                  core::ShutdownContext* shutdown = nullptr);
    DownloadQueue(std::shared_ptr<core::MetadataStore> store,
                  TaskRunner runner,
                  QueueOptions options = {},
                  core::ShutdownContext* shutdown = nullptr);
    ~DownloadQueue();

    DownloadQueue(const DownloadQueue&) = delete;
    DownloadQueue& operator=(const DownloadQueue&) = delete;

    // Resolves the source URL from the store and enqueues the book
    [[nodiscard]] std::error_code add_task(core::BookId book,
                                           Priority priority = Priority::normal,
                                           const std::filesystem::path& output_dir = "downloads");

    // Enqueues a prepared task; false if the book is already outstanding
    bool enqueue(DownloadTask task);

    // workers == 0 uses QueueOptions::max_workers
    [[nodiscard]] std::error_code start(std::uint32_t workers = 0);

    // Returns false if some worker had to be abandoned
    bool stop(bool save_state = true,
              std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    [[nodiscard]] QueueStatus status() const;

    [[nodiscard]] std::error_code save_state() const;
    [[nodiscard]] std::error_code save_state(const std::filesystem::path& path) const;

    // Outstanding tasks come back as pending; returns how many were restored
    [[nodiscard]] std::expected<std::size_t, std::error_code> load_state();
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    load_state(const std::filesystem::path& path);

    // True once nothing is queued or running
    [[nodiscard]] bool wait_idle(std::chrono::milliseconds timeout) const;

    [[nodiscard]] std::vector<DownloadTask> completed() const;
    [[nodiscard]] std::vector<DownloadTask> failed() const;
    [[nodiscard]] std::vector<DownloadTask> cancelled() const;

    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }

private:
    struct Shared;

    struct Worker {
        std::thread thread;
        std::future<void> done;
    };

    static void worker_loop(const std::shared_ptr<Shared>& shared, std::uint32_t id);
    static void finish_task(Shared& shared, DownloadTask task, std::error_code ec);

    void on_shutdown();

    std::shared_ptr<Shared> shared_;
    std::vector<Worker> workers_;
    core::ShutdownContext* shutdown_;
    core::ShutdownContext::CallbackId shutdown_callback_{0};
    std::atomic<bool> shutdown_handled_{false};
    std::atomic<bool> running_{false};
    std::mutex control_mutex_;  // serializes start/stop
};

} // namespace folio::queue

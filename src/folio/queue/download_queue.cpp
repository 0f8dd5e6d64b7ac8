// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/queue/download_queue.hpp>
#include <folio/core/logger.hpp>
#include <folio/disk/error.hpp>
#include <folio/queue/task_queue.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <condition_variable>
#include <fstream>
#include <limits>
#include <map>
#include <set>

namespace folio::queue {

namespace fs = std::filesystem;

//=============================================================================
// Shared worker state
//=============================================================================

struct DownloadQueue::Shared {
    Shared(std::shared_ptr<core::MetadataStore> s, TaskRunner r, QueueOptions o, core::ShutdownContext* sc)
        : store_owner(std::move(s)), store(*store_owner), runner(std::move(r)), options(std::move(o)), shutdown(sc) {}

    [[nodiscard]] bool should_stop() const noexcept {
        return stopping.load(std::memory_order_acquire) ||
               (shutdown != nullptr && shutdown->requested());
    }

    std::shared_ptr<core::MetadataStore> store_owner;  // owns nothing when borrowed
    core::MetadataStore& store;
    TaskRunner runner;
    QueueOptions options;
    core::ShutdownContext* shutdown;

    TaskQueue queue;

    // Guards everything below; taken before the TaskQueue lock
    mutable std::mutex mutex;
    mutable std::condition_variable idle_cv;
    std::map<core::BookId, DownloadTask> active;
    std::set<core::BookId> outstanding;
    std::vector<DownloadTask> completed;
    std::vector<DownloadTask> failed;
    std::vector<DownloadTask> cancelled;
    QueueStats stats;
    std::uint32_t worker_count{0};
    bool save_on_stop{true};

    std::atomic<bool> stopping{false};
};

TaskRunner engine_runner(core::DownloadEngine& engine, core::DownloadOptions options, TaskProgress progress) {
    return [&engine, options, progress = std::move(progress)](const DownloadTask& task) {
        core::ProgressCallback cb;
        if (progress) {
            cb = [&progress, book = task.book_id](std::uint64_t done, std::uint64_t total) {
                progress(book, done, total);
            };
        }
        return engine.download(task.book_id, task.source_url, task.output_path, options, cb);
    };
}

TaskRunner engine_runner(std::shared_ptr<core::DownloadEngine> engine, core::DownloadOptions options,
                         TaskProgress progress) {
    auto run = engine_runner(*engine, std::move(options), std::move(progress));
    return [engine = std::move(engine), run = std::move(run)](const DownloadTask& task) {
        return run(task);
    };
}

//=============================================================================
// DownloadQueue
//=============================================================================

DownloadQueue::DownloadQueue(core::MetadataStore& store,
                             TaskRunner runner,
                             QueueOptions options,
                             core::ShutdownContext* shutdown)
    : DownloadQueue(std::shared_ptr<core::MetadataStore>(std::shared_ptr<core::MetadataStore>{}, &store),
                    std::move(runner), std::move(options), shutdown) {}

DownloadQueue::DownloadQueue(std::shared_ptr<core::MetadataStore> store,
                             TaskRunner runner,
                             QueueOptions options,
                             core::ShutdownContext* shutdown)
    : shared_(std::make_shared<Shared>(std::move(store), std::move(runner), std::move(options), shutdown))
    , shutdown_(shutdown) {
    if (shared_->options.max_workers == 0) shared_->options.max_workers = 1;
    if (shared_->options.max_retries == 0) shared_->options.max_retries = 1;
    shared_->worker_count = shared_->options.max_workers;

    if (shutdown_) {
        shutdown_callback_ = shutdown_->register_callback([this] { on_shutdown(); });
    }
}

DownloadQueue::~DownloadQueue() {
    if (shutdown_) {
        shutdown_->unregister_callback(shutdown_callback_);
        if (shutdown_->requested()) {
            // The callback may still be running stop() on this object
            (void)shutdown_->wait_completed(shared_->options.shutdown_timeout * 2);
        }
    }
    if (running()) {
        stop(false);
    }
}

void DownloadQueue::on_shutdown() {
    if (shutdown_handled_.exchange(true)) return;
    FOLIO_LOG_INFO("Shutdown requested, stopping download queue");
    stop(true, shared_->options.shutdown_timeout);
}

bool DownloadQueue::enqueue(DownloadTask task) {
    auto& s = *shared_;
    std::lock_guard lock(s.mutex);
    if (!s.outstanding.insert(task.book_id).second) {
        return false;
    }
    task.status = TaskStatus::pending;
    s.queue.push(std::move(task));
    ++s.stats.queued;
    s.idle_cv.notify_all();
    return true;
}

std::error_code DownloadQueue::add_task(core::BookId book, Priority priority, const fs::path& output_dir) {
    auto& store = shared_->store;

    auto title = store.title(book);
    auto urls = store.download_urls(book);
    if (urls.empty()) {
        if (!title) {
            FOLIO_LOG_ERROR("Book {} not found in catalog", book);
            return make_error_code(core::DownloadErrc::book_not_found);
        }
        FOLIO_LOG_ERROR("No EPUB download URL for book {}", book);
        return make_error_code(core::DownloadErrc::no_source_url);
    }

    std::error_code fs_ec;
    fs::create_directories(output_dir, fs_ec);
    if (fs_ec) {
        FOLIO_LOG_ERROR("Cannot create directory {}: {}", output_dir.string(), fs_ec.message());
        return disk::from_errno(fs_ec.value());
    }

    DownloadTask task;
    task.priority = priority;
    task.book_id = book;
    task.source_url = urls.front();
    task.output_path = output_dir / output_filename(title.value_or(""), book);

    fs::path output = task.output_path;
    if (!enqueue(std::move(task))) {
        FOLIO_LOG_WARN("Book {} is already queued", book);
        return make_error_code(core::DownloadErrc::invalid_state);
    }

    FOLIO_LOG_INFO("Queued book {} ({} priority) -> {}", book, to_string(priority), output.string());
    return {};
}

std::error_code DownloadQueue::start(std::uint32_t workers) {
    std::lock_guard control(control_mutex_);

    if (running()) {
        return make_error_code(core::DownloadErrc::invalid_state);
    }
    if (shutdown_ && shutdown_->requested()) {
        return make_error_code(core::DownloadErrc::shutdown_in_progress);
    }

    auto& s = *shared_;
    const std::uint32_t count = workers ? workers : s.options.max_workers;
    {
        std::lock_guard lock(s.mutex);
        s.worker_count = count;
        s.save_on_stop = true;
    }
    s.stopping.store(false, std::memory_order_release);

    workers_.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        std::promise<void> done;
        Worker w;
        w.done = done.get_future();
        w.thread = std::thread([shared = shared_, i, done = std::move(done)]() mutable {
            worker_loop(shared, i);
            done.set_value();
        });
        workers_.push_back(std::move(w));
    }

    running_.store(true, std::memory_order_release);
    FOLIO_LOG_INFO("Download queue started with {} workers", count);
    return {};
}

bool DownloadQueue::stop(bool save_state, std::optional<std::chrono::milliseconds> timeout) {
    std::lock_guard control(control_mutex_);

    auto& s = *shared_;
    {
        std::lock_guard lock(s.mutex);
        s.save_on_stop = save_state;
    }
    s.stopping.store(true, std::memory_order_release);

    bool all_joined = true;
    const auto deadline = std::chrono::steady_clock::now() + timeout.value_or(s.options.shutdown_timeout);
    for (auto& w : workers_) {
        if (w.done.wait_until(deadline) == std::future_status::ready) {
            w.thread.join();
        } else {
            // Its task stays active and is saved as outstanding
            FOLIO_LOG_WARN("Worker did not finish in time, abandoning it");
            w.thread.detach();
            all_joined = false;
        }
    }
    workers_.clear();
    running_.store(false, std::memory_order_release);

    if (save_state) {
        if (!s.options.state_file.empty()) {
            if (auto ec = this->save_state()) {
                FOLIO_LOG_ERROR("Failed to save queue state: {}", ec.message());
            }
        }
    } else {
        std::lock_guard lock(s.mutex);
        for (auto& task : s.queue.drain()) {
            task.status = TaskStatus::cancelled;
            task.completed_at = core::Clock::now();
            s.outstanding.erase(task.book_id);
            if (s.stats.queued > 0) --s.stats.queued;
            ++s.stats.cancelled;
            s.cancelled.push_back(std::move(task));
        }
        s.idle_cv.notify_all();
    }

    FOLIO_LOG_INFO("Download queue stopped");
    return all_joined;
}

void DownloadQueue::worker_loop(const std::shared_ptr<Shared>& shared, std::uint32_t id) {
    auto& s = *shared;
    FOLIO_LOG_DEBUG("Worker {} started", id);

    while (!s.should_stop()) {
        auto task = s.queue.pop_for(s.options.poll_interval);
        if (!task) continue;

        if (s.should_stop()) {
            s.queue.requeue(std::move(*task));
            break;
        }

        // Restored tasks may carry no URL
        if (task->source_url.empty()) {
            auto urls = s.store.download_urls(task->book_id);
            if (!urls.empty()) task->source_url = urls.front();
        }

        {
            std::lock_guard lock(s.mutex);
            task->status = TaskStatus::downloading;
            task->started_at = core::Clock::now();
            s.active[task->book_id] = *task;
            if (s.stats.queued > 0) --s.stats.queued;
            ++s.stats.downloading;
        }

        FOLIO_LOG_INFO("Worker {} downloading book {}", id, task->book_id);

        std::error_code ec;
        try {
            ec = s.runner(*task);
        } catch (const std::exception& e) {
            FOLIO_LOG_ERROR("Worker {} failed on book {}: {}", id, task->book_id, e.what());
            ec = make_error_code(core::DownloadErrc::network_error);
        }

        finish_task(s, std::move(*task), ec);
    }

    FOLIO_LOG_DEBUG("Worker {} stopped", id);
}

void DownloadQueue::finish_task(Shared& s, DownloadTask task, std::error_code ec) {
    std::lock_guard lock(s.mutex);

    s.active.erase(task.book_id);
    if (s.stats.downloading > 0) --s.stats.downloading;

    if (!ec) {
        task.status = TaskStatus::completed;
        task.completed_at = core::Clock::now();
        task.error_message.clear();
        s.outstanding.erase(task.book_id);
        ++s.stats.completed;
        FOLIO_LOG_INFO("Completed book {}", task.book_id);
        s.completed.push_back(std::move(task));
    } else if (s.should_stop()) {
        task.error_message = ec.message();
        if (s.save_on_stop) {
            task.status = TaskStatus::pending;
            task.started_at.reset();
            ++s.stats.queued;
            FOLIO_LOG_INFO("Book {} interrupted, kept for the next run", task.book_id);
            s.queue.requeue(std::move(task));
        } else {
            task.status = TaskStatus::cancelled;
            task.completed_at = core::Clock::now();
            s.outstanding.erase(task.book_id);
            ++s.stats.cancelled;
            s.cancelled.push_back(std::move(task));
        }
    } else {
        ++task.retry_count;
        task.error_message = ec.message();
        if (task.retry_count < s.options.max_retries) {
            task.status = TaskStatus::pending;
            task.started_at.reset();
            ++s.stats.queued;
            FOLIO_LOG_WARN("Book {} failed ({}), retry {}/{}",
                           task.book_id, task.error_message, task.retry_count, s.options.max_retries);
            s.queue.push(std::move(task));
        } else {
            task.status = TaskStatus::failed;
            task.completed_at = core::Clock::now();
            s.outstanding.erase(task.book_id);
            ++s.stats.failed;
            FOLIO_LOG_ERROR("Book {} failed after {} attempts: {}",
                            task.book_id, task.retry_count, task.error_message);
            s.failed.push_back(std::move(task));
        }
    }

    s.idle_cv.notify_all();
}

QueueStatus DownloadQueue::status() const {
    auto& s = *shared_;
    QueueStatus st;
    {
        std::lock_guard lock(s.mutex);
        st.stats = s.stats;
        st.workers = s.worker_count;
        st.active_tasks.reserve(s.active.size());
        for (const auto& [id, task] : s.active) {
            st.active_tasks.push_back({id, task.status, task.started_at});
        }
        st.queue_size = s.queue.size();
    }
    st.running = running();
    return st;
}

bool DownloadQueue::wait_idle(std::chrono::milliseconds timeout) const {
    auto& s = *shared_;
    std::unique_lock lock(s.mutex);
    return s.idle_cv.wait_for(lock, timeout, [&s] {
        return s.stats.queued == 0 && s.active.empty();
    });
}

std::vector<DownloadTask> DownloadQueue::completed() const {
    std::lock_guard lock(shared_->mutex);
    return shared_->completed;
}

std::vector<DownloadTask> DownloadQueue::failed() const {
    std::lock_guard lock(shared_->mutex);
    return shared_->failed;
}

std::vector<DownloadTask> DownloadQueue::cancelled() const {
    std::lock_guard lock(shared_->mutex);
    return shared_->cancelled;
}

//=============================================================================
// State persistence
//=============================================================================

namespace {

nlohmann::json task_to_json(const DownloadTask& task) {
    return {
        {"book_id", task.book_id},
        {"priority", static_cast<int>(task.priority)},
        {"output_path", task.output_path.string()},
        {"retry_count", task.retry_count},
        {"source_url", task.source_url},
        {"sequence", task.sequence},
    };
}

DownloadTask task_from_json(const nlohmann::json& j) {
    DownloadTask task;
    task.book_id = j.at("book_id").get<core::BookId>();
    task.priority = priority_from_value(j.value("priority", 5)).value_or(Priority::normal);
    task.output_path = j.value("output_path", "");
    task.retry_count = j.value("retry_count", std::uint32_t{0});
    task.source_url = j.value("source_url", "");
    task.sequence = j.value("sequence", std::uint64_t{0});
    return task;
}

} // namespace

std::error_code DownloadQueue::save_state() const {
    return save_state(shared_->options.state_file);
}

std::error_code DownloadQueue::save_state(const fs::path& path) const {
    auto& s = *shared_;

    nlohmann::json queued = nlohmann::json::array();
    nlohmann::json active = nlohmann::json::array();
    nlohmann::json completed = nlohmann::json::array();
    nlohmann::json failed = nlohmann::json::array();
    {
        std::lock_guard lock(s.mutex);
        for (const auto& task : s.queue.snapshot()) {
            queued.push_back(task_to_json(task));
        }
        for (const auto& [id, task] : s.active) {
            active.push_back(task_to_json(task));
        }
        for (const auto& task : s.completed) {
            completed.push_back(task.book_id);
        }
        for (const auto& task : s.failed) {
            failed.push_back({
                {"book_id", task.book_id},
                {"error", task.error_message},
                {"retry_count", task.retry_count},
            });
        }
    }

    nlohmann::json j = {
        {"queued", std::move(queued)},
        {"active", std::move(active)},
        {"completed", std::move(completed)},
        {"failed", std::move(failed)},
    };

    try {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }
        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            return make_error_code(disk::DiskErrc::write_error);
        }
        file << j.dump(2) << '\n';
        if (!file) {
            return make_error_code(disk::DiskErrc::write_error);
        }
    } catch (const std::exception& e) {
        FOLIO_LOG_ERROR("Cannot write queue state {}: {}", path.string(), e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }

    FOLIO_LOG_DEBUG("Saved queue state to {}", path.string());
    return {};
}

std::expected<std::size_t, std::error_code> DownloadQueue::load_state() {
    return load_state(shared_->options.state_file);
}

std::expected<std::size_t, std::error_code> DownloadQueue::load_state(const fs::path& path) {
    std::error_code fs_ec;
    if (!fs::exists(path, fs_ec)) {
        return std::size_t{0};
    }

    std::vector<DownloadTask> tasks;
    try {
        std::ifstream file(path);
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::read_error));
        }
        auto j = nlohmann::json::parse(file);
        for (const char* key : {"queued", "active"}) {
            if (!j.contains(key)) continue;
            for (const auto& item : j.at(key)) {
                tasks.push_back(task_from_json(item));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        FOLIO_LOG_ERROR("Invalid queue state {}: {}", path.string(), e.what());
        return std::unexpected(make_error_code(core::DownloadErrc::parse_error));
    }

    // Replay in arrival order so equal priorities keep their FIFO place;
    // entries without a sequence go last, in file order
    std::stable_sort(tasks.begin(), tasks.end(), [](const DownloadTask& a, const DownloadTask& b) {
        auto key = [](const DownloadTask& t) {
            return t.sequence ? t.sequence : std::numeric_limits<std::uint64_t>::max();
        };
        return key(a) < key(b);
    });

    std::size_t restored = 0;
    for (auto& task : tasks) {
        if (enqueue(std::move(task))) {
            ++restored;
        }
    }

    FOLIO_LOG_INFO("Restored {} tasks from {}", restored, path.string());
    return restored;
}

} // namespace folio::queue

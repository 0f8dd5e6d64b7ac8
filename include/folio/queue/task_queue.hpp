// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/queue/download_task.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

namespace folio::queue {

// Thread-safe priority queue, FIFO among equal priorities
class TaskQueue {
public:
    TaskQueue() = default;

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    // Appends behind every queued task of the same priority
    void push(DownloadTask task);

    // Returns a popped task to the place its sequence gives it
    void requeue(DownloadTask task);

    // Waits up to timeout for a task
    [[nodiscard]] std::optional<DownloadTask> pop_for(std::chrono::milliseconds timeout);

    [[nodiscard]] std::optional<DownloadTask> try_pop();

    // Removes all tasks, in service order
    [[nodiscard]] std::vector<DownloadTask> drain();

    // Copies all tasks, in service order
    [[nodiscard]] std::vector<DownloadTask> snapshot() const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const;

private:
    struct Later {
        bool operator()(const DownloadTask& a, const DownloadTask& b) const noexcept {
            if (a.priority != b.priority) {
                return a.priority > b.priority;
            }
            return a.sequence > b.sequence;
        }
    };

    [[nodiscard]] DownloadTask pop_locked();

    std::priority_queue<DownloadTask, std::vector<DownloadTask>, Later> heap_;
    std::uint64_t next_sequence_{1};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace folio::queue

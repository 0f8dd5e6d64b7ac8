// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/queue/task_queue.hpp>

namespace folio::queue {

void TaskQueue::push(DownloadTask task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        task.sequence = next_sequence_++;
        heap_.push(std::move(task));
    }
    cv_.notify_one();
}

void TaskQueue::requeue(DownloadTask task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (task.sequence == 0 || task.sequence >= next_sequence_) {
            task.sequence = next_sequence_++;
        }
        heap_.push(std::move(task));
    }
    cv_.notify_one();
}

DownloadTask TaskQueue::pop_locked() {
    // priority_queue::top() is const; the entry is discarded right after
    DownloadTask task = std::move(const_cast<DownloadTask&>(heap_.top()));
    heap_.pop();
    return task;
}

std::optional<DownloadTask> TaskQueue::pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !heap_.empty(); })) {
        return std::nullopt;
    }
    return pop_locked();
}

std::optional<DownloadTask> TaskQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (heap_.empty()) return std::nullopt;
    return pop_locked();
}

std::vector<DownloadTask> TaskQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DownloadTask> tasks;
    tasks.reserve(heap_.size());
    while (!heap_.empty()) {
        tasks.push_back(pop_locked());
    }
    return tasks;
}

std::vector<DownloadTask> TaskQueue::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto copy = heap_;
    std::vector<DownloadTask> tasks;
    tasks.reserve(copy.size());
    while (!copy.empty()) {
        tasks.push_back(copy.top());
        copy.pop();
    }
    return tasks;
}

std::size_t TaskQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return heap_.size();
}

bool TaskQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return heap_.empty();
}

} // namespace folio::queue

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <stop_token>
#include <utility>
#include <vector>

namespace folio::core {

// Termination request shared by the queue and long-running loops
class ShutdownContext {
public:
    using Callback = std::function<void()>;
    using CallbackId = std::uint64_t;

    ShutdownContext() = default;

    ShutdownContext(const ShutdownContext&) = delete;
    ShutdownContext& operator=(const ShutdownContext&) = delete;

    // Callbacks run once, newest first, when request() is first called
    CallbackId register_callback(Callback callback);

    void unregister_callback(CallbackId id) noexcept;

    [[nodiscard]] bool requested() const noexcept {
        return requested_.load(std::memory_order_acquire);
    }

    // Returns false if shutdown was already requested
    bool request();

    // Waits until request() has finished running callbacks
    [[nodiscard]] bool wait_completed(std::chrono::milliseconds timeout) const;

private:
    std::atomic<bool> requested_{false};
    bool completed_{false};
    std::vector<std::pair<CallbackId, Callback>> callbacks_;
    CallbackId next_id_{1};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

// Turns SIGINT/SIGTERM/SIGHUP into ShutdownContext::request().
// Construct before starting other threads so they inherit the blocked mask.
// A second signal exits the process immediately.
class SignalWatcher {
public:
    explicit SignalWatcher(ShutdownContext& context);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    void run(std::stop_token stoken) noexcept;

    ShutdownContext& context_;
    sigset_t signals_{};
    sigset_t previous_{};
    std::jthread handler_;
    std::jthread watcher_;
};

} // namespace folio::core

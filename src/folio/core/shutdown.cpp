// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/core/shutdown.hpp>
#include <folio/core/logger.hpp>
#include <pthread.h>
#include <signal.h>
#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <system_error>

namespace folio::core {

namespace {

constexpr long SIGNAL_POLL_NSEC = 200'000'000;  // 200 ms

const char* signal_name(int sig) noexcept {
    switch (sig) {
        case SIGINT:  return "SIGINT";
        case SIGTERM: return "SIGTERM";
        case SIGHUP:  return "SIGHUP";
        default:      return "signal";
    }
}

} // namespace

//=============================================================================
// ShutdownContext
//=============================================================================

ShutdownContext::CallbackId ShutdownContext::register_callback(Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    CallbackId id = next_id_++;
    callbacks_.emplace_back(id, std::move(callback));
    return id;
}

void ShutdownContext::unregister_callback(CallbackId id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    std::erase_if(callbacks_, [id](const auto& entry) { return entry.first == id; });
}

bool ShutdownContext::request() {
    if (requested_.exchange(true, std::memory_order_acq_rel)) {
        return false;
    }

    std::vector<std::pair<CallbackId, Callback>> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks.swap(callbacks_);
    }

    // Run outside the lock so callbacks may unregister themselves
    for (auto it = callbacks.rbegin(); it != callbacks.rend(); ++it) {
        try {
            if (it->second) it->second();
        } catch (const std::exception& e) {
            FOLIO_LOG_ERROR("Shutdown callback failed: {}", e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        completed_ = true;
    }
    cv_.notify_all();
    return true;
}

bool ShutdownContext::wait_completed(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return completed_; });
}

//=============================================================================
// SignalWatcher
//=============================================================================

SignalWatcher::SignalWatcher(ShutdownContext& context)
    : context_(context) {
    sigemptyset(&signals_);
    sigaddset(&signals_, SIGINT);
    sigaddset(&signals_, SIGTERM);
    sigaddset(&signals_, SIGHUP);
    pthread_sigmask(SIG_BLOCK, &signals_, &previous_);

    watcher_ = std::jthread([this](std::stop_token stoken) { run(stoken); });
}

SignalWatcher::~SignalWatcher() {
    watcher_.request_stop();
    if (watcher_.joinable()) watcher_.join();
    if (handler_.joinable()) handler_.join();
    pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
}

void SignalWatcher::run(std::stop_token stoken) noexcept {
    int received = 0;

    while (!stoken.stop_requested()) {
        timespec timeout{0, SIGNAL_POLL_NSEC};
        int sig = sigtimedwait(&signals_, nullptr, &timeout);
        if (sig < 0) {
            continue;  // EAGAIN on timeout, EINTR
        }

        ++received;
        if (received == 1) {
            FOLIO_LOG_WARN("Received {}, shutting down gracefully (repeat to force exit)",
                           signal_name(sig));
            try {
                handler_ = std::jthread([this] { context_.request(); });
            } catch (const std::system_error&) {
                context_.request();
            }
        } else {
            FOLIO_LOG_ERROR("Received {} again, forcing exit", signal_name(sig));
            Logger::instance().flush();
            std::_Exit(1);
        }
    }
}

} // namespace folio::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace folio::core {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    off
};

[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

// Process-wide logger: colored console plus optional rotating file
class Logger {
public:
    static Logger& instance() noexcept {
        static Logger logger;
        return logger;
    }

    // Empty log_file disables the file sink
    void initialize(LogLevel level, const std::string& log_file = {});

    void level(LogLevel level);

    void flush();

    // Falls back to spdlog's default logger before initialize()
    [[nodiscard]] std::shared_ptr<spdlog::logger> get() const;

private:
    Logger() = default;

    std::shared_ptr<spdlog::logger> logger_;
    mutable std::mutex mutex_;
};

} // namespace folio::core

#define FOLIO_LOG_TRACE(...) ::folio::core::Logger::instance().get()->trace(__VA_ARGS__)
#define FOLIO_LOG_DEBUG(...) ::folio::core::Logger::instance().get()->debug(__VA_ARGS__)
#define FOLIO_LOG_INFO(...)  ::folio::core::Logger::instance().get()->info(__VA_ARGS__)
#define FOLIO_LOG_WARN(...)  ::folio::core::Logger::instance().get()->warn(__VA_ARGS__)
#define FOLIO_LOG_ERROR(...) ::folio::core::Logger::instance().get()->error(__VA_ARGS__)

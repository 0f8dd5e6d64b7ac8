// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/core/logger.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <vector>

namespace folio::core {

namespace {

constexpr std::size_t LOG_FILE_SIZE = 10 * 1024 * 1024;  // 10 MB
constexpr std::size_t LOG_FILE_COUNT = 5;

spdlog::level::level_enum to_spdlog(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::trace:    return spdlog::level::trace;
        case LogLevel::debug:    return spdlog::level::debug;
        case LogLevel::info:     return spdlog::level::info;
        case LogLevel::warn:     return spdlog::level::warn;
        case LogLevel::error:    return spdlog::level::err;
        case LogLevel::critical: return spdlog::level::critical;
        case LogLevel::off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

} // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::trace;
    if (lower == "debug") return LogLevel::debug;
    if (lower == "info") return LogLevel::info;
    if (lower == "warn" || lower == "warning") return LogLevel::warn;
    if (lower == "error") return LogLevel::error;
    if (lower == "critical") return LogLevel::critical;
    if (lower == "off") return LogLevel::off;
    return std::nullopt;
}

void Logger::initialize(LogLevel level, const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    sinks.push_back(console);

    std::string file_error;
    if (!log_file.empty()) {
        try {
            std::filesystem::path path(log_file);
            if (path.has_parent_path()) {
                std::filesystem::create_directories(path.parent_path());
            }
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, LOG_FILE_SIZE, LOG_FILE_COUNT);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file);
        } catch (const std::exception& e) {
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("folio", sinks.begin(), sinks.end());
    logger->set_level(to_spdlog(level));
    logger->flush_on(spdlog::level::warn);
    if (!file_error.empty()) {
        logger->warn("Cannot open log file {}: {}", log_file, file_error);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    logger_ = std::move(logger);
}

void Logger::level(LogLevel level) {
    get()->set_level(to_spdlog(level));
}

void Logger::flush() {
    get()->flush();
}

std::shared_ptr<spdlog::logger> Logger::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_ ? logger_ : spdlog::default_logger();
}

} // namespace folio::core

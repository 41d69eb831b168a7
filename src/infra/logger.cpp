/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file logger.cpp
 * @brief Implementation of the thread-safe diagnostic logging utility.
 */

#include "uuidforge/infra/logger.hpp"

#include "uuidforge/infra/text.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace uuidforge::infra {

std::mutex Logger::mutex_;
std::atomic<LogLevel> Logger::threshold_{LogLevel::INFO};
std::atomic<bool> Logger::stderr_only_{false};

/**
 * @brief Dispatches a formatted log entry to the appropriate system stream.
 *
 * Operational Logic:
 * 1. **Filtering**: Drops the message when it is below the threshold.
 * 2. **Synchronization**: Acquires a `lock_guard` to prevent interleaved output.
 * 3. **Chronometry**: Captures the current system clock and formats it.
 * 4. **Stream Segregation**: Routes messages to `stdout` or `stderr` based on severity.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    if (level < threshold_.load(std::memory_order_relaxed)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    bool to_err = stderr_only_.load(std::memory_order_relaxed) || level >= LogLevel::WARN;
    auto& stream = to_err ? std::cerr : std::cout;

    // Note: Mutex protects std::localtime's internal static buffer.
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    switch (level) {
    case LogLevel::TRACE:
        stream << "\033[90m[TRCE] ";
        break;
    case LogLevel::DEBUG:
        stream << "\033[36m[DBUG] ";
        break;
    case LogLevel::INFO:
        stream << "\033[32m[INFO] ";
        break;
    case LogLevel::WARN:
        stream << "\033[33m[WARN] ";
        break;
    case LogLevel::ERROR:
        stream << "\033[31m[FAIL] ";
        break;
    case LogLevel::FATAL:
        stream << "\033[1;31m[CRIT] ";
        break;
    }

    stream << message << "\033[0m" << std::endl;
}

void Logger::set_level(LogLevel level)
{
    threshold_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level()
{
    return threshold_.load(std::memory_order_relaxed);
}

void Logger::route_all_to_stderr(bool enabled)
{
    stderr_only_.store(enabled, std::memory_order_relaxed);
}

std::optional<LogLevel> Logger::parse_level(std::string_view name)
{
    std::string lowered = Text::to_lower(Text::trim(std::string(name)));

    if (lowered == "trace")
        return LogLevel::TRACE;
    if (lowered == "debug")
        return LogLevel::DEBUG;
    if (lowered == "info")
        return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning")
        return LogLevel::WARN;
    if (lowered == "error")
        return LogLevel::ERROR;
    if (lowered == "fatal")
        return LogLevel::FATAL;
    return std::nullopt;
}

} // namespace uuidforge::infra

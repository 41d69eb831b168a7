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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for uuidforge.
 *
 * @details
 * Declares the `Logger` class used by the generators and the command line tool.
 * Output is serialized through a single mutex so that lines written by
 * concurrent generator threads never interleave. A process-wide severity
 * threshold filters chatty TRACE/DEBUG output; the CLI raises it so that
 * identifiers printed on stdout are not mixed with diagnostics.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace uuidforge::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-call generator details (tick advances, sequence bumps).
    DEBUG, ///< State transitions worth seeing while troubleshooting.
    INFO,  ///< Nominal operational events (configuration loaded, startup).
    WARN,  ///< Anomalies such as a system clock moving backwards.
    ERROR, ///< Recoverable failures (rejected input, bad config value).
    FATAL  ///< Failures that terminate the command line tool.
};

/**
 * @class Logger
 * @brief Static, mutex-guarded console logger.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message.
     *
     * Messages below the current threshold are dropped before the lock is taken.
     * `TRACE`, `DEBUG` and `INFO` go to `std::cout`; `WARN` and above go to
     * `std::cerr`. When `route_all_to_stderr(true)` is active every level is
     * written to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * uuidforge::infra::Logger::log(LogLevel::WARN, "V1: clock moved backwards");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// Sets the minimum severity that is emitted. Defaults to `INFO`.
    static void set_level(LogLevel level);

    static LogLevel level();

    /// Sends every level to stderr, leaving stdout to the program's own output.
    static void route_all_to_stderr(bool enabled);

    /**
     * @brief Parses a level name (`"trace"`, `"debug"`, `"info"`, `"warn"`,
     * `"error"`, `"fatal"`, case-insensitive).
     * @return The level, or `std::nullopt` for an unknown name.
     */
    static std::optional<LogLevel> parse_level(std::string_view name);

  private:
    /// Guards `std::cout` and `std::cerr` against interleaved lines.
    static std::mutex mutex_;

    static std::atomic<LogLevel> threshold_;
    static std::atomic<bool> stderr_only_;
};

} // namespace uuidforge::infra

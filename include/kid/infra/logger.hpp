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
 * @brief Thread-safe diagnostic logging facility.
 *
 * @details
 * This header declares the `Logger` class, the single reporting interface of the
 * library and its tools. Output to `stdout`/`stderr` is serialized across
 * threads so entries never interleave. Messages below the configured minimum
 * level are dropped.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace kid::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details.
    DEBUG, ///< Diagnostics for development, e.g. why a decode was rejected.
    INFO,  ///< Nominal operational events.
    WARN,  ///< Non-blocking anomalies (e.g. the random source failed).
    ERROR, ///< Recoverable runtime errors.
    FATAL  ///< Failures that end the process.
};

/**
 * @class Logger
 * @brief Static, process-wide console logger.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: `std::cerr`.
     *
     * Messages below `level()` are discarded before the lock is taken.
     *
     * @code
     * kid::infra::Logger::log(LogLevel::INFO, "uniqcheck: 4 jobs queued");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the minimum level that reaches the console. Default `INFO`.
    static void set_level(LogLevel level);

    /// @brief Current minimum level.
    static LogLevel level();

    /**
     * @brief True if a message at `level` would be written.
     *
     * Lets hot paths skip building a message that would be thrown away.
     */
    static bool enabled(LogLevel level);

  private:
    /// @brief Guards `std::cout`/`std::cerr` and `std::localtime`'s static buffer.
    static std::mutex mutex_;

    static std::atomic<LogLevel> level_;
};

} // namespace kid::infra

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
 * @brief Diagnostic logging facility for EmberDB.
 *
 * @details
 * Declares the `Logger` class used by every EmberDB subsystem. Output is
 * serialized through a single mutex so entries written from the debounce
 * timer thread never interleave with entries written by the owning thread.
 * A process-wide severity threshold keeps the hot paths (index upkeep,
 * query planning) quiet unless tracing is requested.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace ember::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Planner decisions and per-operation details.
    DEBUG, ///< Batch completion, clears, timer teardown.
    INFO,  ///< Lifecycle events (collection creation).
    WARN,  ///< Suspicious but tolerated usage.
    ERROR, ///< Failures that do not abort the caller (e.g., a throwing observer).
    FATAL  ///< Unrecoverable failures.
};

/**
 * @class Logger
 * @brief A static utility class providing library-wide logging.
 *
 * @details
 * Entries below the configured threshold are dropped before any formatting
 * takes place. Callers that need to build an expensive message should test
 * `Logger::enabled()` first.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     * `TRACE`, `DEBUG` and `INFO` go to `std::cout`; `WARN` and above go to
     * `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * ember::infra::Logger::log(LogLevel::INFO, "Collection: 'users' ready.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that reaches the console.
     *
     * @param level The new threshold. Defaults to `LogLevel::INFO`.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the active threshold.
    static LogLevel level();

    /**
     * @brief Reports whether a message of the given severity would be printed.
     */
    static bool enabled(LogLevel level);

  private:
    /// @brief Guards access to `std::cout` and `std::cerr`.
    static std::mutex mutex_;

    /// @brief Minimum severity that is printed.
    static std::atomic<LogLevel> threshold_;
};

} // namespace ember::infra

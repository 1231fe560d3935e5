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
 * @brief Thread-safe diagnostic logging facility for the MID64 library and tools.
 *
 * @details
 * Declares the `Logger` class used by the generator (clock anomalies), the codecs
 * and the `mid64` command-line tool. Output is serialized across threads and can be
 * filtered by a process-wide severity threshold.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace mid64::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages, lowest first.
 */
enum class LogLevel {
    TRACE, ///< Per-identifier detail (packed fields, clock samples).
    DEBUG, ///< Diagnostic information for development.
    INFO,  ///< Nominal operational events (tool startup, stress summaries).
    WARN,  ///< Anomalies that do not stop generation (clock regression).
    ERROR, ///< Recoverable failures (rejected input).
    FATAL  ///< Failures that end the process.
};

/**
 * @class Logger
 * @brief Static, system-wide logging interface.
 *
 * @details
 * Every entry carries a timestamp, a colored severity tag and the payload.
 * `TRACE` through `INFO` go to `std::cout`; `WARN` and above go to `std::cerr`.
 * Entries below the configured threshold are discarded before the lock is taken.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @note Thread-safe and blocking.
     *
     * @code
     * mid64::infra::Logger::log(LogLevel::WARN, "Generator: clock moved backwards by 3 ms");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that reaches the console.
     *
     * Defaults to `LogLevel::INFO`.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the current severity threshold.
    static LogLevel level();

  private:
    /// @brief Guards `std::cout` / `std::cerr` against interleaved entries.
    static std::mutex mutex_;

    /// @brief Minimum severity written by `log()`.
    static std::atomic<LogLevel> threshold_;
};

} // namespace mid64::infra

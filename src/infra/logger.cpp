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

#include "mid64/infra/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace mid64::infra {

std::mutex Logger::mutex_;
std::atomic<LogLevel> Logger::threshold_{LogLevel::INFO};

void Logger::set_level(LogLevel level)
{
    threshold_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level()
{
    return threshold_.load(std::memory_order_relaxed);
}

/**
 * @brief Dispatches a formatted log entry to the appropriate system stream.
 *
 * Filtered entries return before any formatting work is done.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    if (level < threshold_.load(std::memory_order_relaxed)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    auto& stream = (level >= LogLevel::WARN) ? std::cerr : std::cout;

    // Mutex also protects std::localtime's static buffer.
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    switch (level) {
    case LogLevel::TRACE:
        // Gray - lowest priority detail.
        stream << "\033[90m[TRCE] ";
        break;
    case LogLevel::DEBUG:
        // Cyan - command parameters.
        stream << "\033[36m[DBUG] ";
        break;
    case LogLevel::INFO:
        // Green - command progress and results.
        stream << "\033[32m[INFO] ";
        break;
    case LogLevel::WARN:
        // Yellow - clock regressions, duplicates.
        stream << "\033[33m[WARN] ";
        break;
    case LogLevel::ERROR:
        // Red - failed tasks and bad input.
        stream << "\033[31m[FAIL] ";
        break;
    case LogLevel::FATAL:
        // Bold Red - the command aborts.
        stream << "\033[1;31m[CRIT] ";
        break;
    }

    // Reset the color and flush so interleaved stdout/stderr stay readable.
    stream << message << "\033[0m" << std::endl;
}

} // namespace mid64::infra

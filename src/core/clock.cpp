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
 * @file clock.cpp
 * @brief Implementations of the system and manual time sources.
 */

#include "mid64/core/clock.hpp"

namespace mid64::core {

std::chrono::milliseconds SystemClock::now() const
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch());
}

std::chrono::milliseconds ManualClock::now() const
{
    return std::chrono::milliseconds(static_cast<int64_t>(millis_.load(std::memory_order_acquire)));
}

void ManualClock::set(uint64_t unix_millis)
{
    millis_.store(unix_millis, std::memory_order_release);
}

void ManualClock::advance(std::chrono::milliseconds delta)
{
    // Two's-complement wrap makes a negative delta step backwards.
    millis_.fetch_add(static_cast<uint64_t>(delta.count()), std::memory_order_acq_rel);
}

} // namespace mid64::core

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
 * @file generator.cpp
 * @brief Implementation of the MID64 clock/counter state machine.
 */

#include "mid64/core/generator.hpp"

#include "mid64/infra/logger.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace mid64::core {

Generator::Generator() : clock_(std::make_shared<SystemClock>()) {}

Generator::Generator(std::shared_ptr<const Clock> clock) : clock_(std::move(clock))
{
    if (!clock_) {
        throw std::invalid_argument("Generator: clock must not be null");
    }
}

Generator& Generator::shared()
{
    static Generator instance;
    return instance;
}

/**
 * @brief Produces the next packed identifier value.
 *
 * Operational Logic:
 * 1. **Sample**: read the clock and rebase it onto the 2020 epoch.
 * 2. **Advance**: a different millisecond resets the counter to 0; the same
 *    millisecond increments it, wrapping at 16 bits.
 * 3. **Pack**: the counter is shifted in 16-bit arithmetic, dropping its high
 *    byte, so identifiers stay bit-compatible with previously stored ones.
 *
 * The regression warning is emitted after the lock is released.
 */
uint64_t Generator::generate(uint8_t tag)
{
    uint64_t id = 0;
    uint64_t regressed_by = 0;

    // --- Critical Section: sample, advance, pack ---
    {
        std::lock_guard<std::mutex> lock(mutex_);

        // 1. Sample the clock and rebase it onto the 2020 epoch.
        int64_t unix_ms = clock_->now().count();
        if (unix_ms < static_cast<int64_t>(kEpochMillis)) {
            throw std::runtime_error("Generator: clock reads " + std::to_string(unix_ms) +
                                     " ms, before the 2020-01-01 epoch");
        }
        uint64_t now = (static_cast<uint64_t>(unix_ms) - kEpochMillis) & kTimestampMask;

        // 2. A new millisecond (earlier ones included) restarts the counter.
        if (now != last_timestamp_) {
            if (now < last_timestamp_) {
                regressed_by = last_timestamp_ - now;
            }
            last_timestamp_ = now;
            counter_ = 0;
        } else {
            counter_ = static_cast<uint16_t>(counter_ + 1);
        }

        // 3. The 16-bit cast drops the counter's high byte.
        id = (last_timestamp_ << kSequenceBits) |
             static_cast<uint16_t>(counter_ << kTagBits) |
             tag;
    }
    // --- End Critical Section ---

    if (regressed_by != 0) {
        regressions_.fetch_add(1, std::memory_order_relaxed);
        infra::Logger::log(infra::LogLevel::WARN,
                           "Generator: clock moved backwards by " + std::to_string(regressed_by) +
                               " ms; ordering with earlier identifiers is not guaranteed");
    }

    return id;
}

} // namespace mid64::core

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
 * @file generator.hpp
 * @brief Thread-safe producer of time-ordered MID64 identifiers.
 *
 * @details
 * The `Generator` owns the `(last timestamp, counter)` state machine. Each call to
 * `generate()` samples the injected clock, resets the counter on a new millisecond
 * or bumps it within the same millisecond, and packs the result, all inside one
 * mutex-protected critical section.
 *
 * **Usage contract:** run one generator per process (see `Generator::shared()`).
 * Two generators in the same process track their counters independently and can
 * emit identical values for the same millisecond and tag.
 *
 * **Known limitations:**
 * - Only the low 8 bits of the counter reach the identifier, so at most 256
 *   distinct values exist per tag per millisecond. The 257th request within one
 *   millisecond repeats the first value. Callers needing more throughput should
 *   spread load across tags.
 * - A wall clock that moves backwards is treated as a new millisecond. The next
 *   identifier can then compare less than ones issued before the jump. Such
 *   regressions are counted (`clock_regressions()`) and logged, not corrected.
 */

#pragma once

#include "mid64/core/clock.hpp"
#include "mid64/core/mid.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

namespace mid64::core {

/**
 * @class Generator
 * @brief Mutex-guarded clock/counter state producing packed 64-bit identifiers.
 */
class Generator {
  public:
    /// @brief Creates a generator reading `SystemClock`.
    Generator();

    /**
     * @brief Creates a generator reading the given clock.
     *
     * @throws std::invalid_argument if `clock` is null.
     */
    explicit Generator(std::shared_ptr<const Clock> clock);

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    /**
     * @brief The lazily constructed process-wide generator (system clock).
     *
     * Initialization is thread-safe; the instance lives until process exit.
     */
    static Generator& shared();

    /**
     * @brief Produces the next packed identifier value.
     *
     * Blocks while another thread holds the generator lock.
     *
     * @param tag Discriminator written into the low byte.
     * @return uint64_t `timestamp << 16 | (counter & 0xFF) << 8 | tag`.
     * @throws std::runtime_error if the clock reads before 2020-01-01T00:00:00Z.
     */
    uint64_t generate(uint8_t tag = 0);

    /// @brief `generate()` wrapped in the identifier type.
    Mid next(uint8_t tag = 0) { return Mid(generate(tag)); }

    /// @brief Number of times the clock was observed earlier than the last timestamp.
    uint64_t clock_regressions() const { return regressions_.load(std::memory_order_relaxed); }

  private:
    std::shared_ptr<const Clock> clock_;

    /// @brief Guards `last_timestamp_` and `counter_`; held for sample-compare-update-pack only.
    std::mutex mutex_;

    uint64_t last_timestamp_ = 0;

    /// @brief Wraps silently at 65535; only its low byte is packed.
    uint16_t counter_ = 0;

    std::atomic<uint64_t> regressions_{0};
};

} // namespace mid64::core

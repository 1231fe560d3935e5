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
 * @file clock.hpp
 * @brief Millisecond time sources consumed by the `Generator`.
 *
 * @details
 * The generator never reads the system clock directly; it samples an injected
 * `Clock`. Production code uses `SystemClock`. Tests use `ManualClock` to pin or
 * step the time and make millisecond boundaries deterministic.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace mid64::core {

/**
 * @class Clock
 * @brief Abstract wall-clock source with millisecond resolution.
 */
class Clock {
  public:
    virtual ~Clock() = default;

    /**
     * @brief Current time as milliseconds since the Unix epoch (1970-01-01T00:00:00Z).
     *
     * Implementations must be safe to call from multiple threads.
     */
    virtual std::chrono::milliseconds now() const = 0;
};

/**
 * @class SystemClock
 * @brief `Clock` backed by `std::chrono::system_clock`.
 *
 * @warning The system clock is not monotonic: NTP corrections or manual changes
 * can move it backwards.
 */
class SystemClock : public Clock {
  public:
    std::chrono::milliseconds now() const override;
};

/**
 * @class ManualClock
 * @brief `Clock` whose reading only changes when told to.
 *
 * @code
 * auto clock = std::make_shared<mid64::core::ManualClock>(mid64::core::kEpochMillis + 1000);
 * mid64::core::Generator generator(clock);
 * generator.generate();
 * clock->advance(std::chrono::milliseconds(1));
 * @endcode
 */
class ManualClock : public Clock {
  public:
    explicit ManualClock(uint64_t unix_millis = 0) : millis_(unix_millis) {}

    std::chrono::milliseconds now() const override;

    /// @brief Pins the clock to an absolute Unix millisecond value.
    void set(uint64_t unix_millis);

    /// @brief Moves the clock forward (or backward, with a negative delta).
    void advance(std::chrono::milliseconds delta);

  private:
    std::atomic<uint64_t> millis_;
};

} // namespace mid64::core

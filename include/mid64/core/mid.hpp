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
 * @file mid.hpp
 * @brief The MID64 identifier value type and its bit layout.
 *
 * @details
 * A MID64 is a 64-bit unsigned integer packed, from the most significant bit down, as:
 *
 * | Bits  | Field     | Meaning                                            |
 * |-------|-----------|----------------------------------------------------|
 * | 63-16 | timestamp | Milliseconds since 2020-01-01T00:00:00Z (48 bits)  |
 * | 15-8  | counter   | Per-millisecond counter, low 8 bits                |
 * | 7-0   | tag       | Caller supplied discriminator                      |
 *
 * Bits 15-0 together form the *sequence*. Because the timestamp occupies the high
 * bits, comparing raw values orders identifiers by `(timestamp, sequence)`.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace mid64::core {

class Generator;

/// @brief Unix time of the identifier epoch, 2020-01-01T00:00:00Z, in milliseconds.
inline constexpr uint64_t kEpochMillis = 1577836800000ULL;

inline constexpr int kTimestampBits = 48;
inline constexpr int kSequenceBits = 16;
inline constexpr int kTagBits = 8;

/// @brief Largest value the 48-bit timestamp field can hold.
inline constexpr uint64_t kTimestampMask = (1ULL << kTimestampBits) - 1;

/// @brief System-clock instant at millisecond resolution.
using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

/**
 * @class Mid
 * @brief Immutable, 64-bit, time-ordered identifier.
 *
 * @details
 * Every field accessor is a pure bit extraction from the stored value, so any
 * 64-bit pattern is a valid `Mid`. The raw value `0` is the null sentinel and is
 * never produced by a generator running after the epoch.
 *
 * @code
 * mid64::core::Mid id = mid64::core::Mid::create(7); // tag 7, shared generator
 * std::cout << id << " minted at " << id.to_iso8601() << std::endl;
 * @endcode
 */
class Mid {
  public:
    /// @brief Constructs the null identifier.
    constexpr Mid() = default;

    /// @brief Wraps a raw value without validation.
    constexpr explicit Mid(uint64_t value) : value_(value) {}

    /**
     * @brief Mints a new identifier from the process-wide shared generator.
     *
     * @param tag Caller discriminator stored in the low byte.
     * @throws std::runtime_error if the system clock reads before the epoch.
     */
    static Mid create(uint8_t tag = 0);

    /**
     * @brief Mints a new identifier from an explicitly supplied generator.
     */
    static Mid create(Generator& generator, uint8_t tag = 0);

    /**
     * @brief Packs a timestamp field and a sequence field.
     *
     * `millis` is truncated to 48 bits. For every `Mid m`,
     * `Mid::from_fields(m.millis(), m.sequence()) == m`.
     */
    static constexpr Mid from_fields(uint64_t millis, uint16_t sequence)
    {
        return Mid(((millis & kTimestampMask) << kSequenceBits) | sequence);
    }

    /// @brief The distinguished "no identifier" value (raw 0).
    static constexpr Mid null() { return Mid(); }

    constexpr bool is_null() const { return value_ == 0; }

    /// @brief The raw 64-bit representation, suitable for storage and transport.
    constexpr uint64_t value() const { return value_; }

    /// @brief Timestamp field: milliseconds elapsed since the epoch.
    constexpr uint64_t millis() const { return value_ >> kSequenceBits; }

    /// @brief Low 16 bits: counter byte followed by tag byte.
    constexpr uint16_t sequence() const { return static_cast<uint16_t>(value_ & 0xFFFF); }

    /// @brief High byte of the sequence.
    constexpr uint8_t counter() const { return static_cast<uint8_t>((value_ >> kTagBits) & 0xFF); }

    constexpr uint8_t tag() const { return static_cast<uint8_t>(value_ & 0xFF); }

    /**
     * @brief Absolute time of the timestamp field (epoch + millis).
     *
     * The null identifier maps to the epoch instant itself. Millisecond
     * resolution keeps every 48-bit field value representable.
     */
    TimePoint timestamp() const;

    /// @brief Canonical text form: the raw value in decimal.
    std::string to_string() const;

    /// @brief UTC rendering of `timestamp()` as `YYYY-MM-DDTHH:MM:SS.mmmZ`.
    std::string to_iso8601() const;

    friend constexpr bool operator==(Mid a, Mid b) { return a.value_ == b.value_; }
    friend constexpr bool operator!=(Mid a, Mid b) { return a.value_ != b.value_; }
    friend constexpr bool operator<(Mid a, Mid b) { return a.value_ < b.value_; }
    friend constexpr bool operator<=(Mid a, Mid b) { return a.value_ <= b.value_; }
    friend constexpr bool operator>(Mid a, Mid b) { return a.value_ > b.value_; }
    friend constexpr bool operator>=(Mid a, Mid b) { return a.value_ >= b.value_; }

  private:
    uint64_t value_ = 0;
};

/// @brief Streams the decimal form of the identifier.
std::ostream& operator<<(std::ostream& os, const Mid& id);

} // namespace mid64::core

namespace std {

template <> struct hash<mid64::core::Mid> {
    size_t operator()(const mid64::core::Mid& id) const noexcept
    {
        return std::hash<uint64_t>{}(id.value());
    }
};

} // namespace std

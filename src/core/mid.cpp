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
 * @file mid.cpp
 * @brief Time conversion and text rendering for `Mid`.
 */

#include "mid64/core/mid.hpp"

#include "mid64/core/generator.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace mid64::core {

Mid Mid::create(uint8_t tag)
{
    return Generator::shared().next(tag);
}

Mid Mid::create(Generator& generator, uint8_t tag)
{
    return generator.next(tag);
}

TimePoint Mid::timestamp() const
{
    return TimePoint(std::chrono::milliseconds(static_cast<int64_t>(millis() + kEpochMillis)));
}

std::string Mid::to_string() const
{
    return std::to_string(value_);
}

/**
 * @brief Renders the timestamp field in UTC with millisecond precision.
 */
std::string Mid::to_iso8601() const
{
    uint64_t unix_ms = millis() + kEpochMillis;
    std::time_t seconds = static_cast<std::time_t>(unix_ms / 1000);
    unsigned millis_part = static_cast<unsigned>(unix_ms % 1000);

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "." << std::setfill('0') << std::setw(3)
       << millis_part << "Z";
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Mid& id)
{
    return os << id.value();
}

} // namespace mid64::core

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
 * @file bytes.hpp
 * @brief Big-endian conversion between unsigned integers and byte sequences.
 *
 * @details
 * Encoded sequences always hold exactly `sizeof(T)` bytes, most significant first,
 * so an encoded MID64 sorts bytewise in the same order as the identifiers
 * themselves. Decoding rejects any other length with `std::nullopt`.
 */

#pragma once

#include "mid64/core/mid.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace mid64::codec {

/**
 * @brief Encodes an unsigned integer as `sizeof(T)` big-endian bytes.
 *
 * @code
 * auto bytes = mid64::codec::to_bytes<uint16_t>(0x0102); // {0x01, 0x02}
 * @endcode
 */
template <typename T> std::vector<uint8_t> to_bytes(T value)
{
    static_assert(std::is_integral_v<T> && std::is_unsigned_v<T>,
                  "to_bytes requires an unsigned integral type");

    std::vector<uint8_t> bytes(sizeof(T));
    for (size_t i = sizeof(T); i > 0; --i) {
        bytes[i - 1] = static_cast<uint8_t>(value & 0xFF);
        value = static_cast<T>(value >> 8);
    }
    return bytes;
}

/**
 * @brief Decodes `sizeof(T)` big-endian bytes into an unsigned integer.
 *
 * @return The decoded value, or `std::nullopt` if `bytes.size() != sizeof(T)`.
 */
template <typename T> std::optional<T> from_bytes(const std::vector<uint8_t>& bytes)
{
    static_assert(std::is_integral_v<T> && std::is_unsigned_v<T>,
                  "from_bytes requires an unsigned integral type");

    if (bytes.size() != sizeof(T)) {
        return std::nullopt;
    }

    T value = 0;
    for (uint8_t byte : bytes) {
        // Integer promotion makes the shift well defined for uint8_t too.
        value = static_cast<T>((value << 8) | byte);
    }
    return value;
}

/// @brief Eight big-endian bytes of the identifier's raw value.
std::vector<uint8_t> to_bytes(const core::Mid& id);

/**
 * @brief Rebuilds an identifier from eight big-endian bytes.
 *
 * @return `std::nullopt` unless exactly eight bytes are supplied.
 */
std::optional<core::Mid> mid_from_bytes(const std::vector<uint8_t>& bytes);

/// @brief Lower-case hexadecimal rendering, two digits per byte, no separators.
std::string to_hex(const std::vector<uint8_t>& bytes);

} // namespace mid64::codec

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
 * @file string.hpp
 * @brief Supplementary string primitives for identifier text handling.
 *
 * @details
 * Defines the `String` utility class used by the JSON codec and the command-line
 * tool to sanitize and strictly parse decimal identifier text.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace mid64::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * Whitespace is whatever `std::isspace` classifies as such in the "C" locale
     * (space, `\t`, `\n`, `\r`, `\v`, `\f`).
     *
     * @param s The source string to process.
     * @return std::string The trimmed copy; empty if `s` is empty or all whitespace.
     *
     * @code
     * std::string clean = mid64::infra::String::trim("  1234\n"); // "1234"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Parses an unsigned 64-bit decimal integer.
     *
     * The whole string must consist of ASCII digits: no sign, no whitespace, no
     * radix prefix, no fraction or exponent. Leading zeros are accepted.
     *
     * @param s The text to parse.
     * @return The parsed value, or `std::nullopt` if `s` is empty, contains a
     * non-digit character, or exceeds `UINT64_MAX`.
     */
    static std::optional<uint64_t> parse_u64(const std::string& s);
};

} // namespace mid64::infra

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
 * @file string.cpp
 * @brief Implementation of the string sanitizing and parsing primitives.
 */

#include "mid64/infra/string.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace mid64::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note `static_cast<unsigned char>` keeps `std::isspace` defined for bytes
 * above 0x7F on platforms where `char` is signed.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

/**
 * @brief Strict decimal parse into `uint64_t`.
 *
 * `std::from_chars` stops at the first non-digit and would accept "12abc" as 12,
 * so the whole buffer is checked for digits first.
 */
std::optional<uint64_t> String::parse_u64(const std::string& s)
{
    if (s.empty()) {
        return std::nullopt;
    }

    bool all_digits = std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
    if (!all_digits) {
        return std::nullopt;
    }

    uint64_t value = 0;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        // std::errc::result_out_of_range for anything above UINT64_MAX.
        return std::nullopt;
    }
    return value;
}

} // namespace mid64::infra

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
 * @file bytes.cpp
 * @brief Identifier overloads of the big-endian byte codec.
 */

#include "mid64/codec/bytes.hpp"

#include <iomanip>
#include <sstream>

namespace mid64::codec {

std::vector<uint8_t> to_bytes(const core::Mid& id)
{
    return to_bytes<uint64_t>(id.value());
}

std::optional<core::Mid> mid_from_bytes(const std::vector<uint8_t>& bytes)
{
    std::optional<uint64_t> raw = from_bytes<uint64_t>(bytes);
    if (!raw) {
        return std::nullopt;
    }
    return core::Mid(*raw);
}

std::string to_hex(const std::vector<uint8_t>& bytes)
{
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (uint8_t byte : bytes) {
        ss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return ss.str();
}

} // namespace mid64::codec

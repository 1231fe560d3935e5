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
 * @file json.hpp
 * @brief Single-value JSON serialization of MID64 identifiers (cJSON).
 *
 * @details
 * An identifier serializes as exactly one JSON number holding its raw value, never
 * as an object. cJSON keeps parsed numbers as `double`, which is exact only up to
 * 2^53, while real identifiers are far larger. The codec therefore:
 * - emits identifiers as cJSON *raw* nodes so the printed digits are exact;
 * - decodes from text by validating with cJSON and reading the digits itself;
 * - decodes parsed number nodes only when their value is exactly representable.
 */

#pragma once

#include "mid64/core/mid.hpp"

#include <cJSON.h>
#include <optional>
#include <string>

namespace mid64::codec {

/**
 * @brief Encodes an identifier as a bare JSON number, e.g. `14056685568000775`.
 */
std::string to_json(const core::Mid& id);

/**
 * @brief Decodes a JSON document consisting of a single identifier number.
 *
 * Accepts a non-negative integer literal not above `UINT64_MAX`, with optional
 * surrounding whitespace. Objects, strings, negative numbers, fractions, exponents,
 * leading zeros and trailing content are rejected.
 *
 * @return The identifier, or `std::nullopt` when the text is not such a number.
 */
std::optional<core::Mid> from_json(const std::string& text);

/**
 * @brief Creates a cJSON node holding the identifier for embedding in a document.
 *
 * @return A new raw-number node. The caller owns it (attach it to a parent or
 * release it with `cJSON_Delete`).
 * @throws std::runtime_error if cJSON fails to allocate the node.
 */
cJSON* to_cjson(const core::Mid& id);

/**
 * @brief Reads an identifier from a cJSON node.
 *
 * Raw nodes (as produced by `to_cjson`) decode exactly. Number nodes decode only
 * when their value is a non-negative integer below 2^53.
 *
 * @return The identifier, or `std::nullopt` for null pointers and any other node.
 */
std::optional<core::Mid> from_cjson(const cJSON* node);

/**
 * @brief Renders an identifier and its decoded fields as a compact JSON object.
 *
 * Keys: `id`, `timestamp` (ISO 8601 UTC), `millis`, `counter`, `tag`, `bytes` (hex).
 *
 * @code
 * {"id":14056685568000775,"timestamp":"2026-10-18T12:00:00.000Z","millis":214488000000,
 *  "counter":3,"tag":7,"bytes":"0031f07b26000307"}
 * @endcode
 */
std::string describe(const core::Mid& id);

} // namespace mid64::codec

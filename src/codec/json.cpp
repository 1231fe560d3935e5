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
 * @file json.cpp
 * @brief cJSON-backed single-value codec for identifiers.
 */

#include "mid64/codec/json.hpp"

#include "mid64/codec/bytes.hpp"
#include "mid64/infra/string.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace mid64::codec {

namespace {

/// @brief 2^53. At and above it a parsed double may be a rounded neighbour of the text.
constexpr double kMaxExactDouble = 9007199254740992.0;

} // namespace

std::string to_json(const core::Mid& id)
{
    // A JSON number is the decimal digits of the raw value.
    return id.to_string();
}

/**
 * @brief Decodes a single identifier number from JSON text.
 *
 * cJSON performs the syntax check (and rejects trailing content via
 * `require_null_terminated`); the digits are then read as an exact
 * `uint64_t` because cJSON's own `double` would round them.
 */
std::optional<core::Mid> from_json(const std::string& text)
{
    std::string trimmed = infra::String::trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    cJSON* doc = cJSON_ParseWithOpts(trimmed.c_str(), nullptr, 1);
    if (!doc) {
        return std::nullopt;
    }
    bool is_number = cJSON_IsNumber(doc);
    cJSON_Delete(doc);

    if (!is_number) {
        return std::nullopt;
    }

    // cJSON tolerates leading zeros ("0123"); JSON grammar does not.
    if (trimmed.size() > 1 && trimmed[0] == '0') {
        return std::nullopt;
    }

    // Rejects '-', '.', 'e' and values above UINT64_MAX.
    std::optional<uint64_t> raw = infra::String::parse_u64(trimmed);
    if (!raw) {
        return std::nullopt;
    }
    return core::Mid(*raw);
}

cJSON* to_cjson(const core::Mid& id)
{
    cJSON* node = cJSON_CreateRaw(id.to_string().c_str());
    if (!node) {
        throw std::runtime_error("JSON: failed to allocate identifier node");
    }
    return node;
}

std::optional<core::Mid> from_cjson(const cJSON* node)
{
    if (!node) {
        return std::nullopt;
    }

    if (cJSON_IsRaw(node)) {
        if (!node->valuestring) {
            return std::nullopt;
        }
        return from_json(node->valuestring);
    }

    if (cJSON_IsNumber(node)) {
        double d = node->valuedouble;
        if (!(d >= 0.0) || d >= kMaxExactDouble || std::floor(d) != d) {
            return std::nullopt;
        }
        return core::Mid(static_cast<uint64_t>(d));
    }

    return std::nullopt;
}

std::string describe(const core::Mid& id)
{
    cJSON* id_node = to_cjson(id);
    cJSON* root = cJSON_CreateObject();
    if (!root) {
        cJSON_Delete(id_node);
        throw std::runtime_error("JSON: failed to allocate document");
    }

    // On success ownership of 'id_node' transfers to 'root'.
    if (!cJSON_AddItemToObject(root, "id", id_node)) {
        cJSON_Delete(id_node);
        cJSON_Delete(root);
        throw std::runtime_error("JSON: failed to attach identifier node");
    }

    // millis fits in 48 bits, so the double held by cJSON is exact.
    bool complete =
        cJSON_AddStringToObject(root, "timestamp", id.to_iso8601().c_str()) != nullptr &&
        cJSON_AddNumberToObject(root, "millis", static_cast<double>(id.millis())) != nullptr &&
        cJSON_AddNumberToObject(root, "counter", id.counter()) != nullptr &&
        cJSON_AddNumberToObject(root, "tag", id.tag()) != nullptr &&
        cJSON_AddStringToObject(root, "bytes", to_hex(to_bytes(id)).c_str()) != nullptr;
    if (!complete) {
        cJSON_Delete(root);
        throw std::runtime_error("JSON: failed to build identifier document");
    }

    char* raw_output = cJSON_PrintUnformatted(root);
    cJSON_Delete(root);
    if (!raw_output) {
        throw std::runtime_error("JSON: failed to print document");
    }

    std::string result(raw_output);
    std::free(raw_output);
    return result;
}

} // namespace mid64::codec

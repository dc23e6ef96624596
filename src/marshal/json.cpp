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
 * @brief cJSON conversions for identifiers.
 */

#include "kid/marshal/json.hpp"

#include "kid/core/codec.hpp"
#include "kid/core/error.hpp"

#include <cstdlib>

namespace kid::marshal {

cJSON* to_json(const Id& id)
{
    if (id.is_nil()) {
        return cJSON_CreateNull();
    }
    return cJSON_CreateString(Codec::encode(id).c_str());
}

std::optional<Id> from_json(const cJSON* node)
{
    if (node == nullptr || cJSON_IsNull(node)) {
        return std::nullopt;
    }
    if (!cJSON_IsString(node) || node->valuestring == nullptr) {
        throw InvalidIdError();
    }
    Id id = Id::from_string(node->valuestring);
    if (id.is_nil()) {
        return std::nullopt;
    }
    return id;
}

std::string to_json_text(const Id& id)
{
    cJSON* node = to_json(id);
    char* raw = cJSON_PrintUnformatted(node);
    std::string text = raw ? raw : "null";
    free(raw);
    cJSON_Delete(node);
    return text;
}

/**
 * @brief Parses one JSON value and converts it.
 *
 * The node is released before any exception leaves this function.
 */
std::optional<Id> from_json_text(std::string_view text)
{
    const std::string buffer(text);
    cJSON* node = cJSON_Parse(buffer.c_str());
    if (!node) {
        throw InvalidIdError();
    }

    std::optional<Id> result;
    try {
        result = from_json(node);
    } catch (const InvalidIdError&) {
        cJSON_Delete(node);
        throw;
    }
    cJSON_Delete(node);
    return result;
}

} // namespace kid::marshal

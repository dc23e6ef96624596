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
 * @brief JSON (cJSON) bindings for identifiers.
 *
 * @details
 * An identifier travels through JSON as its 16-character string. The nil
 * identifier is written as the `null` literal and read back as `std::nullopt`,
 * so "no identifier" never masquerades as a real value on the other side.
 */

#pragma once

#include "kid/core/id.hpp"

#include <cJSON.h>
#include <optional>
#include <string>
#include <string_view>

namespace kid::marshal {

/**
 * @brief Converts an identifier to a new cJSON node.
 *
 * @return A string node, or a null node if `id` is nil. The caller owns the
 * node (attach it to a parent or release it with `cJSON_Delete`).
 */
cJSON* to_json(const Id& id);

/**
 * @brief Reads an identifier from a cJSON node.
 *
 * @return `std::nullopt` for a JSON null, a missing node, or a string that
 * decodes to the nil identifier (`"0000000000000000"`); otherwise the decoded
 * identifier.
 * @throws kid::InvalidIdError for a malformed string or any other node type.
 */
std::optional<Id> from_json(const cJSON* node);

/// @brief Serializes to JSON text: `null` or `"06bqer9xnr09hyq5"`.
std::string to_json_text(const Id& id);

/**
 * @brief Parses JSON text holding a single identifier value.
 *
 * @throws kid::InvalidIdError if the text is not valid JSON or not an identifier.
 */
std::optional<Id> from_json_text(std::string_view text);

} // namespace kid::marshal

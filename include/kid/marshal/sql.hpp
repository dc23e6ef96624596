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
 * @file sql.hpp
 * @brief Column value bindings for storing identifiers in SQL databases.
 *
 * @details
 * Identifiers are stored as their 16-character text (e.g. `CHAR(16)`), which
 * keeps the column sortable in creation order. The nil identifier maps to SQL
 * `NULL` in both directions.
 */

#pragma once

#include "kid/core/id.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kid::marshal {

/**
 * @brief A driver-neutral column value.
 *
 * `std::monostate` is SQL `NULL`.
 */
using SqlValue =
    std::variant<std::monostate, std::int64_t, double, std::string, std::vector<std::uint8_t>>;

/// @brief Value to bind for `id`: `NULL` if nil, otherwise the encoded string.
SqlValue to_sql(const Id& id);

/**
 * @brief Reads an identifier from a column value.
 *
 * Text and blob columns are decoded as the 16-character form.
 *
 * @return `std::nullopt` for `NULL`.
 * @throws kid::InvalidIdError if the text does not decode.
 * @throws kid::ScanError for numeric columns.
 */
std::optional<Id> scan(const SqlValue& value);

} // namespace kid::marshal

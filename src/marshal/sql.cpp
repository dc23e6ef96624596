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
 * @file sql.cpp
 * @brief SQL column conversions for identifiers.
 */

#include "kid/marshal/sql.hpp"

#include "kid/core/codec.hpp"
#include "kid/core/error.hpp"

#include <string_view>

namespace kid::marshal {

SqlValue to_sql(const Id& id)
{
    if (id.is_nil()) {
        return std::monostate{};
    }
    return Codec::encode(id);
}

std::optional<Id> scan(const SqlValue& value)
{
    if (std::holds_alternative<std::monostate>(value)) {
        return std::nullopt;
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return Id::from_string(*text);
    }
    if (const auto* blob = std::get_if<std::vector<std::uint8_t>>(&value)) {
        // Drivers hand back CHAR/TEXT columns as raw bytes; they hold the text form.
        std::string_view text(reinterpret_cast<const char*>(blob->data()), blob->size());
        return Id::from_string(text);
    }
    if (std::holds_alternative<std::int64_t>(value)) {
        throw ScanError("int64");
    }
    throw ScanError("double");
}

} // namespace kid::marshal

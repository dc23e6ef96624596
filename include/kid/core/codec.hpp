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
 * @file codec.hpp
 * @brief Fixed-width base-32 codec for identifiers.
 *
 * @details
 * Maps the 80 bits of an `Id` onto 16 characters of 5 bits each, most
 * significant bits first. The alphabet omits the vowels a, i, o and u and is
 * sorted by code point, so comparing two encodings lexicographically gives the
 * same answer as comparing the underlying bytes.
 */

#pragma once

#include "kid/core/id.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace kid {

/**
 * @class Codec
 * @brief Stateless encoder/decoder between `Id` and its text form.
 *
 * @details
 * Both directions are hand-unrolled shift/mask sequences over the fixed
 * 10-byte/16-character layout. There is never any padding. All members are
 * safe to call concurrently.
 */
class Codec {
  public:
    /// @brief The 32-symbol alphabet, indexed by 5-bit value.
    static constexpr std::string_view kAlphabet = "0123456789bcdefghjklmnpqrstvwxyz";

    /// @brief Marker in the decode table for bytes that are not alphabet symbols.
    static constexpr std::uint8_t kInvalidSymbol = 0xFF;

    /**
     * @brief Encodes `id` into exactly 16 characters at `dst`.
     *
     * Does not allocate and does not write a terminator.
     */
    static void encode(const Id& id, char* dst);

    /// @brief Encodes `id` into a new 16-character string.
    static std::string encode(const Id& id);

    /**
     * @brief Decodes `text` into `out`.
     *
     * Validation order:
     * 1. `text` must be exactly 16 characters.
     * 2. Every character must belong to the alphabet (case-sensitive).
     * 3. The bytes are unpacked.
     * 4. The final character is re-encoded from the last byte and compared.
     *
     * @return true on success. On failure `out` is set to the nil identifier.
     */
    static bool decode(std::string_view text, Id& out);

    /// @brief True if `c` is one of the 32 alphabet symbols.
    static bool is_symbol(char c);
};

} // namespace kid

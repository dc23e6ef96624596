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
 * @file codec.cpp
 * @brief Unrolled base-32 packing and unpacking.
 */

#include "kid/core/codec.hpp"

#include "kid/infra/logger.hpp"

#include <array>
#include <cstddef>

namespace kid {

namespace {

/// @brief Reverse lookup table built from `Codec::kAlphabet` at compile time.
constexpr std::array<std::uint8_t, 256> make_decode_table()
{
    std::array<std::uint8_t, 256> table{};
    for (std::size_t i = 0; i < table.size(); ++i) {
        table[i] = Codec::kInvalidSymbol;
    }
    for (std::size_t i = 0; i < Codec::kAlphabet.size(); ++i) {
        table[static_cast<unsigned char>(Codec::kAlphabet[i])] = static_cast<std::uint8_t>(i);
    }
    return table;
}

// Constant-initialized, so decoding from another translation unit's static
// initializers sees the finished table.
constexpr std::array<std::uint8_t, 256> kDecodeTable = make_decode_table();

inline char sym(unsigned v)
{
    return Codec::kAlphabet[v];
}

inline std::uint8_t val(char c)
{
    return kDecodeTable[static_cast<unsigned char>(c)];
}

} // namespace

/**
 * @brief Packs 10 bytes into 16 symbols.
 *
 * Output position i takes bits [5i, 5i+5) of the 80-bit big-endian value.
 * Positions 1, 3, 4, 6, 9, 11, 12 and 14 straddle a byte boundary and combine
 * the tail of one byte with the head of the next.
 */
void Codec::encode(const Id& id, char* dst)
{
    const auto& b = id.bytes();

    dst[15] = sym(b[9] & 0x1F);
    dst[14] = sym((b[9] >> 5) | ((b[8] << 3) & 0x1F));
    dst[13] = sym((b[8] >> 2) & 0x1F);
    dst[12] = sym((b[8] >> 7) | ((b[7] << 1) & 0x1F));
    dst[11] = sym((b[7] >> 4) | ((b[6] << 4) & 0x1F));
    dst[10] = sym((b[6] >> 1) & 0x1F);
    dst[9] = sym((b[6] >> 6) | ((b[5] << 2) & 0x1F));
    dst[8] = sym(b[5] >> 3);
    dst[7] = sym(b[4] & 0x1F);
    dst[6] = sym((b[4] >> 5) | ((b[3] << 3) & 0x1F));
    dst[5] = sym((b[3] >> 2) & 0x1F);
    dst[4] = sym((b[3] >> 7) | ((b[2] << 1) & 0x1F));
    dst[3] = sym((b[2] >> 4) | ((b[1] << 4) & 0x1F));
    dst[2] = sym((b[1] >> 1) & 0x1F);
    dst[1] = sym((b[1] >> 6) | ((b[0] << 2) & 0x1F));
    dst[0] = sym(b[0] >> 3);
}

std::string Codec::encode(const Id& id)
{
    std::string text(Id::kEncodedLen, '0');
    encode(id, text.data());
    return text;
}

bool Codec::is_symbol(char c)
{
    return val(c) != kInvalidSymbol;
}

/**
 * @brief Validates and unpacks 16 symbols into 10 bytes.
 *
 * The trailing-symbol check runs before the remaining bytes are filled so a
 * rejected input never leaves a half-populated result behind.
 */
bool Codec::decode(std::string_view text, Id& out)
{
    out = Id();

    if (text.size() != Id::kEncodedLen) {
        if (infra::Logger::enabled(infra::LogLevel::DEBUG)) {
            infra::Logger::log(infra::LogLevel::DEBUG,
                               "Codec: rejected input of length " + std::to_string(text.size()));
        }
        return false;
    }

    for (char c : text) {
        if (!is_symbol(c)) {
            if (infra::Logger::enabled(infra::LogLevel::DEBUG)) {
                infra::Logger::log(infra::LogLevel::DEBUG,
                                   "Codec: rejected non-alphabet character in '" +
                                       std::string(text) + "'");
            }
            return false;
        }
    }

    Id::Bytes b{};
    const char* s = text.data();

    b[9] = static_cast<std::uint8_t>((val(s[14]) << 5) | val(s[15]));
    if (sym(b[9] & 0x1F) != s[15]) {
        return false;
    }
    b[8] = static_cast<std::uint8_t>((val(s[12]) << 7) | (val(s[13]) << 2) | (val(s[14]) >> 3));
    b[7] = static_cast<std::uint8_t>((val(s[11]) << 4) | (val(s[12]) >> 1));
    b[6] = static_cast<std::uint8_t>((val(s[9]) << 6) | (val(s[10]) << 1) | (val(s[11]) >> 4));
    b[5] = static_cast<std::uint8_t>((val(s[8]) << 3) | (val(s[9]) >> 2));
    b[4] = static_cast<std::uint8_t>((val(s[6]) << 5) | val(s[7]));
    b[3] = static_cast<std::uint8_t>((val(s[4]) << 7) | (val(s[5]) << 2) | (val(s[6]) >> 3));
    b[2] = static_cast<std::uint8_t>((val(s[3]) << 4) | (val(s[4]) >> 1));
    b[1] = static_cast<std::uint8_t>((val(s[1]) << 6) | (val(s[2]) << 1) | (val(s[3]) >> 4));
    b[0] = static_cast<std::uint8_t>((val(s[0]) << 3) | (val(s[1]) >> 2));

    out = Id(b);
    return true;
}

} // namespace kid

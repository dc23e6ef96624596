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
 * @file id.hpp
 * @brief The fixed-size, k-sortable identifier value type.
 *
 * @details
 * An `Id` is 10 bytes, big-endian throughout:
 * - bytes 0-5: Unix time in milliseconds (48 bits, 1970 through year 10889).
 * - bytes 6-7: sequence value issued by the `IdGenerator`.
 * - bytes 8-9: random value with no ordering meaning.
 *
 * The all-zero value is the nil sentinel. Ordering only looks at the first
 * 8 bytes (timestamp and sequence); equality looks at all 10.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace kid {

/**
 * @class Id
 * @brief Immutable 10-byte identifier.
 *
 * @details
 * Instances are created by `kid::infra::IdGenerator::generate()`, decoded from
 * their 16-character text form with `from_string()`, or copied from raw bytes
 * with `from_bytes()`. A default-constructed `Id` is nil.
 */
class Id {
  public:
    /// @brief Size of the binary representation in bytes.
    static constexpr std::size_t kRawLen = 10;

    /// @brief Size of the base-32 text representation in characters.
    static constexpr std::size_t kEncodedLen = 16;

    using Bytes = std::array<std::uint8_t, kRawLen>;

    /// @brief UTC time point with millisecond resolution (covers the full 48-bit range).
    using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

    /// @brief Constructs the nil identifier.
    Id() : bytes_{} {}

    /// @brief Wraps an existing 10-byte layout verbatim.
    explicit Id(const Bytes& bytes) : bytes_(bytes) {}

    /**
     * @brief Copies a raw byte buffer into an identifier.
     *
     * Only the length is validated; any 10-byte content is a valid identifier.
     *
     * @throws kid::InvalidIdError if `len` is not exactly 10.
     */
    static Id from_bytes(const std::uint8_t* data, std::size_t len);

    /// @overload
    static Id from_bytes(const std::vector<std::uint8_t>& data);

    /**
     * @brief Decodes the 16-character base-32 text form.
     *
     * Decoding is case-sensitive; only the canonical lowercase alphabet is accepted.
     *
     * @throws kid::InvalidIdError on any malformed input.
     *
     * @code
     * auto id = kid::Id::from_string("06bqer9xnr09hyq5");
     * @endcode
     */
    static Id from_string(std::string_view text);

    /// @brief True if every byte is zero.
    bool is_nil() const;

    /// @brief Milliseconds since the Unix epoch (bytes 0-5).
    std::int64_t timestamp() const;

    /// @brief The timestamp as a UTC time point.
    TimePoint time() const;

    /// @brief The timestamp rendered as `YYYY-MM-DD HH:MM:SS.mmm UTC`.
    std::string time_string() const;

    /// @brief Sequence field (bytes 6-7).
    std::uint16_t sequence() const;

    /// @brief Random field (bytes 8-9).
    std::uint16_t random() const;

    /// @brief The raw 10-byte layout.
    const Bytes& bytes() const { return bytes_; }

    /// @brief The 16-character encoded form.
    std::string to_string() const;

    /**
     * @brief Three-way comparison on the timestamp and sequence prefix.
     *
     * @return -1, 0 or 1. The random suffix is ignored, so two distinct
     * identifiers may compare equal here while `operator==` reports them different.
     */
    int compare(const Id& other) const;

    /// @brief Static form of `compare`, usable as a plain function.
    static int compare(const Id& a, const Id& b) { return a.compare(b); }

    bool operator==(const Id& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Id& other) const { return bytes_ != other.bytes_; }

  private:
    Bytes bytes_;
};

/**
 * @brief Sorts identifiers in place, oldest first.
 *
 * Uses `Id::compare` with a stable sort, so identifiers sharing a timestamp and
 * sequence keep their relative order. The result matches sorting the encoded
 * strings lexicographically.
 */
void sort(std::vector<Id>& ids);

/// @brief Writes the encoded form.
std::ostream& operator<<(std::ostream& os, const Id& id);

} // namespace kid

namespace std {

template <> struct hash<kid::Id> {
    std::size_t operator()(const kid::Id& id) const noexcept
    {
        // FNV-1a over all 10 bytes.
        std::uint64_t h = 14695981039346656037ULL;
        for (std::uint8_t b : id.bytes()) {
            h ^= b;
            h *= 1099511628211ULL;
        }
        return static_cast<std::size_t>(h);
    }
};

} // namespace std

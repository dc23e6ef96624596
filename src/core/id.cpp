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
 * @file id.cpp
 * @brief Construction, accessors and ordering for `kid::Id`.
 */

#include "kid/core/id.hpp"

#include "kid/core/codec.hpp"
#include "kid/core/error.hpp"

#include <algorithm>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace kid {

Id Id::from_bytes(const std::uint8_t* data, std::size_t len)
{
    if (data == nullptr || len != kRawLen) {
        throw InvalidIdError();
    }
    Bytes b{};
    std::memcpy(b.data(), data, kRawLen);
    return Id(b);
}

Id Id::from_bytes(const std::vector<std::uint8_t>& data)
{
    return from_bytes(data.data(), data.size());
}

Id Id::from_string(std::string_view text)
{
    Id id;
    if (!Codec::decode(text, id)) {
        throw InvalidIdError();
    }
    return id;
}

bool Id::is_nil() const
{
    return *this == Id();
}

std::int64_t Id::timestamp() const
{
    const auto& b = bytes_;
    return static_cast<std::int64_t>(
        static_cast<std::uint64_t>(b[0]) << 40 | static_cast<std::uint64_t>(b[1]) << 32 |
        static_cast<std::uint64_t>(b[2]) << 24 | static_cast<std::uint64_t>(b[3]) << 16 |
        static_cast<std::uint64_t>(b[4]) << 8 | static_cast<std::uint64_t>(b[5]));
}

Id::TimePoint Id::time() const
{
    return TimePoint(std::chrono::milliseconds(timestamp()));
}

/**
 * @brief Formats the timestamp in UTC.
 *
 * `gmtime_r` is used instead of `std::gmtime` so concurrent callers do not
 * share its static buffer. Years past 9999 print with five digits.
 */
std::string Id::time_string() const
{
    const std::int64_t ms = timestamp();
    const std::time_t secs = static_cast<std::time_t>(ms / 1000);

    std::tm utc{};
    gmtime_r(&secs, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
       << (ms % 1000) << " UTC";
    return ss.str();
}

std::uint16_t Id::sequence() const
{
    return static_cast<std::uint16_t>(bytes_[6] << 8 | bytes_[7]);
}

std::uint16_t Id::random() const
{
    return static_cast<std::uint16_t>(bytes_[8] << 8 | bytes_[9]);
}

std::string Id::to_string() const
{
    return Codec::encode(*this);
}

int Id::compare(const Id& other) const
{
    // Big-endian layout: byte order equals numeric order of the 64-bit prefix.
    int r = std::memcmp(bytes_.data(), other.bytes_.data(), 8);
    return (r > 0) - (r < 0);
}

void sort(std::vector<Id>& ids)
{
    std::stable_sort(ids.begin(), ids.end(),
                     [](const Id& a, const Id& b) { return a.compare(b) < 0; });
}

std::ostream& operator<<(std::ostream& os, const Id& id)
{
    char text[Id::kEncodedLen];
    Codec::encode(id, text);
    return os.write(text, Id::kEncodedLen);
}

} // namespace kid

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
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 */

#include "kid/infra/string.hpp"

#include <cctype>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace kid::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note The use of `static_cast<unsigned char>` is critical to prevent undefined
 * behavior with `std::isspace` when encountering characters with negative values
 * in signed `char` environments.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::string String::hex_list(const std::uint8_t* data, std::size_t len)
{
    std::ostringstream ss;
    for (std::size_t i = 0; i < len; ++i) {
        std::ostringstream cell;
        cell << "0x" << std::hex << static_cast<unsigned>(data[i]);
        if (i > 0) {
            ss << ",";
        }
        // Each cell is right-aligned to four columns after a separating space.
        ss << ' ' << std::setw(4) << cell.str();
    }
    return ss.str();
}

std::string String::group_thousands(std::uint64_t value)
{
    std::string digits = std::to_string(value);
    std::string out;
    out.reserve(digits.size() + digits.size() / 3);

    // Leading group is 1-3 digits; every following group is exactly 3.
    std::size_t lead = digits.size() % 3;
    if (lead == 0) {
        lead = 3;
    }
    out.append(digits, 0, lead);
    for (std::size_t i = lead; i < digits.size(); i += 3) {
        out.push_back(',');
        out.append(digits, i, 3);
    }
    return out;
}

} // namespace kid::infra

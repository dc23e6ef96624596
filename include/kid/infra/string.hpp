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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * Text helpers used by the command-line tools: trimming input lines and
 * rendering raw bytes for inspection output.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace kid::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed content, empty if `s` is all whitespace.
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Renders bytes as a comma-separated list of hex literals.
     *
     * Every literal is unpadded (`0x1`), right-aligned in four columns and
     * preceded by a space, so the list starts with whitespace.
     *
     * @code
     * const std::uint8_t raw[] = {0x01, 0x95, 0x00};
     * kid::infra::String::hex_list(raw, 3); // "  0x1, 0x95,  0x0"
     * @endcode
     */
    static std::string hex_list(const std::uint8_t* data, std::size_t len);

    /// @brief Formats an integer with `,` thousands separators ("50,000,000").
    static std::string group_thousands(std::uint64_t value);
};

} // namespace kid::infra

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
 * @file error.hpp
 * @brief Exception types raised by the identifier library.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace kid {

/**
 * @class InvalidIdError
 * @brief Raised when text or raw bytes cannot be interpreted as an identifier.
 *
 * Covers every rejection path of the decoder (wrong length, a character outside
 * the alphabet, a failed trailing-character check) and the length check of the
 * byte-array constructor. Whoever catches it never holds a partially decoded value.
 */
class InvalidIdError : public std::runtime_error {
  public:
    InvalidIdError() : std::runtime_error("kid: invalid id") {}
};

/**
 * @class ScanError
 * @brief Raised by the SQL adapter when a column value has an unsupported type.
 */
class ScanError : public std::runtime_error {
  public:
    explicit ScanError(const std::string& type_name)
        : std::runtime_error("kid: scanning unsupported type: " + type_name)
    {
    }
};

} // namespace kid

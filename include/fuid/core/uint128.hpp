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
 * @file uint128.hpp
 * @brief The 128-bit payload type and its decimal text helpers.
 *
 * @details
 * Every identifier in the library is a plain 128-bit unsigned integer. The
 * standard streams have no formatter for it, so `Decimal` supplies the
 * conversions used by the command-line tool and the test suite.
 */

#pragma once

#include <string>
#include <string_view>

namespace fuid {

/// @brief Unsigned 128-bit integer (GCC/Clang extension).
using uint128 = unsigned __int128;

/// @brief Largest representable payload, 2^128 - 1.
inline constexpr uint128 UINT128_MAX_VALUE = ~static_cast<uint128>(0);

/**
 * @class Decimal
 * @brief Static conversions between `uint128` and base-10 text.
 */
class Decimal {
  public:
    /**
     * @brief Renders a value as decimal digits without sign or padding.
     *
     * @code
     * Decimal::to_string(852751187393); // "852751187393"
     * @endcode
     */
    static std::string to_string(uint128 value);

    /**
     * @brief Parses a string made only of decimal digits.
     *
     * @param text The digits. Empty input, any non-digit character (including
     * a sign or whitespace) and values above 2^128 - 1 are rejected.
     * @param out Receives the parsed value on success; untouched on failure.
     * @return true If the whole string was consumed and fits in 128 bits.
     */
    static bool parse(std::string_view text, uint128& out);
};

} // namespace fuid

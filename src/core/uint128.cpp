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
 * @file uint128.cpp
 * @brief Decimal rendering and parsing for 128-bit values.
 */

#include "fuid/core/uint128.hpp"

#include <algorithm>

namespace fuid {

std::string Decimal::to_string(uint128 value)
{
    if (value == 0) {
        return "0";
    }

    std::string digits;
    while (value > 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

bool Decimal::parse(std::string_view text, uint128& out)
{
    if (text.empty()) {
        return false;
    }

    uint128 result = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        auto digit = static_cast<uint128>(c - '0');

        // result * 10 + digit must stay within 2^128 - 1.
        if (result > (UINT128_MAX_VALUE - digit) / 10) {
            return false;
        }
        result = result * 10 + digit;
    }

    out = result;
    return true;
}

} // namespace fuid

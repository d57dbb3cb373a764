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
 * @file base62.cpp
 * @brief Implementation of the base-62 codec.
 *
 * @details
 * Encoding is repeated division by 62. Decoding accumulates `v * 62^i` from
 * the least significant symbol upward, with every multiplication, every
 * addition and the running power checked against the 128-bit range.
 */

#include "fuid/core/base62.hpp"

#include <algorithm>

namespace fuid {

int Base62::symbol_value(char c) noexcept
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'A' && c <= 'Z') {
        return c - 'A' + 10;
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a' + 36;
    }
    return -1;
}

std::size_t Base62::encode_to(uint128 value, char* out) noexcept
{
    if (value == 0) {
        out[0] = ALPHABET[0];
        return 1;
    }

    // Digits come out least significant first; collect them, then flip.
    std::size_t length = 0;
    while (value > 0) {
        out[length++] = ALPHABET[static_cast<std::size_t>(value % BASE)];
        value /= BASE;
    }
    std::reverse(out, out + length);
    return length;
}

std::string Base62::encode(uint128 value)
{
    char buffer[MAX_LENGTH];
    std::size_t length = encode_to(value, buffer);
    return std::string(buffer, length);
}

std::optional<uint128> Base62::try_decode(std::string_view text, DecodeFailure* failure) noexcept
{
    const std::size_t length = text.size();
    const auto base = static_cast<uint128>(BASE);

    auto overflow = [failure]() -> std::optional<uint128> {
        if (failure) {
            *failure = DecodeFailure{DecodeErrorKind::ARITHMETIC_OVERFLOW, '\0', 0};
        }
        return std::nullopt;
    };

    uint128 result = 0;
    uint128 power = 1; // 62^i while power_overflowed is false
    bool power_overflowed = false;

    for (std::size_t i = 0; i < length; ++i) {
        const char c = text[length - 1 - i];
        const int v = symbol_value(c);
        if (v < 0) {
            if (failure) {
                // Scan runs right to left; position is reported from the left.
                *failure = DecodeFailure{DecodeErrorKind::INVALID_SYMBOL, c, length - i};
            }
            return std::nullopt;
        }

        if (i > 0 && !power_overflowed) {
            if (power > UINT128_MAX_VALUE / base) {
                power_overflowed = true;
            } else {
                power *= base;
            }
        }

        if (v == 0) {
            continue;
        }
        if (power_overflowed) {
            return overflow();
        }

        auto term = static_cast<uint128>(v);
        if (term > UINT128_MAX_VALUE / power) {
            return overflow();
        }
        term *= power;

        if (result > UINT128_MAX_VALUE - term) {
            return overflow();
        }
        result += term;
    }

    return result;
}

uint128 Base62::decode(std::string_view text)
{
    DecodeFailure failure;
    std::optional<uint128> value = try_decode(text, &failure);
    if (!value) {
        throw DecodeError(failure);
    }
    return *value;
}

} // namespace fuid

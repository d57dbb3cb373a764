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
 * @file base62.hpp
 * @brief Base-62 codec between 128-bit integers and alphanumeric strings.
 *
 * @details
 * The alphabet is fixed and ordered `0-9`, `A-Z`, `a-z` (values 0-61). Output
 * is most-significant symbol first, never padded, and zero is the single
 * symbol `"0"`. The 62 symbols are safe as bare file names, URL segments and
 * code identifiers, and are selectable with a double-click.
 *
 * The codec is written against a caller-supplied character buffer and a
 * non-throwing status form (`encode_to`, `try_decode`), so it needs neither
 * the heap nor exceptions. `encode` and `decode` wrap those for everyday use.
 */

#pragma once

#include "fuid/core/error.hpp"
#include "fuid/core/uint128.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace fuid {

/**
 * @class Base62
 * @brief Stateless base-62 encoder/decoder for `uint128` values.
 */
class Base62 {
  public:
    /// @brief Number of symbols in the alphabet.
    static constexpr std::size_t BASE = 62;

    /// @brief Longest canonical encoding: 62^21 < 2^128 <= 62^22.
    static constexpr std::size_t MAX_LENGTH = 22;

    /// @brief The ordered alphabet; `ALPHABET[v]` is the symbol for value `v`.
    static constexpr std::string_view ALPHABET =
        "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

    /**
     * @brief Maps a symbol to its value.
     * @return The value in `[0, 61]`, or -1 if `c` is not in the alphabet.
     */
    static int symbol_value(char c) noexcept;

    /**
     * @brief Encodes into a caller-owned buffer.
     *
     * @param value Any 128-bit value.
     * @param out Buffer of at least `MAX_LENGTH` characters. Not NUL-terminated.
     * @return std::size_t Number of symbols written (1 to `MAX_LENGTH`).
     */
    static std::size_t encode_to(uint128 value, char* out) noexcept;

    /**
     * @brief Encodes a value as its canonical base-62 string.
     *
     * Total: every value has exactly one encoding. Only zero starts with `'0'`.
     *
     * @code
     * Base62::encode(852751187393); // "F0ob4rZ"
     * Base62::encode(0);            // "0"
     * @endcode
     */
    static std::string encode(uint128 value);

    /**
     * @brief Decodes without throwing.
     *
     * Symbols are consumed from the rightmost (least significant) to the
     * leftmost. The first invalid symbol met in that order is reported with
     * its 1-based position from the START of the string. Any product or sum
     * leaving the 128-bit range reports `ARITHMETIC_OVERFLOW`. Leading `'0'`
     * symbols add nothing and are accepted at any length. The empty string
     * decodes to 0.
     *
     * @param text The encoded string.
     * @param failure Optional out-parameter filled when decoding fails.
     * @return The value, or `std::nullopt` on failure.
     */
    static std::optional<uint128> try_decode(std::string_view text,
                                             DecodeFailure* failure = nullptr) noexcept;

    /**
     * @brief Decodes a base-62 string.
     *
     * Same rules as `try_decode`.
     *
     * @throws DecodeError On an invalid symbol or arithmetic overflow.
     *
     * @code
     * Base62::decode("F0ob4rZ");  // 852751187393
     * Base62::decode("ds{Z455f"); // throws: invalid base62 symbol '{' at position 3
     * @endcode
     */
    static uint128 decode(std::string_view text);
};

} // namespace fuid

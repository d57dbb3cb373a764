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
 * @brief Failure descriptions produced by the base-62 decoder.
 *
 * @details
 * Decoding is the only fallible operation in the library. A failure is
 * described twice: as the plain `DecodeFailure` record returned by the
 * non-throwing API, and as the `DecodeError` exception thrown by the
 * convenience API. Both carry the same information.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace fuid {

/**
 * @enum DecodeErrorKind
 * @brief The two ways a string can fail to decode.
 */
enum class DecodeErrorKind {
    INVALID_SYMBOL,     ///< A character outside `[0-9A-Za-z]` was found.
    ARITHMETIC_OVERFLOW ///< The implied value does not fit in 128 bits.
};

/**
 * @struct DecodeFailure
 * @brief Allocation-free description of a decode failure.
 */
struct DecodeFailure {
    DecodeErrorKind kind = DecodeErrorKind::INVALID_SYMBOL;

    /// @brief The offending character; `'\0'` for overflow.
    char symbol = '\0';

    /// @brief 1-based position of `symbol` counted from the start of the input; 0 for overflow.
    std::size_t position = 0;

    /**
     * @brief Human-readable description.
     *
     * - `invalid base62 symbol '{' at position 3`
     * - `arithmetic overflow while decoding base62 string`
     */
    std::string describe() const;
};

/**
 * @class DecodeError
 * @brief Exception thrown when a string is not a valid base-62 encoding.
 *
 * @details
 * Non-retryable: the failure is a permanent fact about the input.
 *
 * @code
 * try {
 *     auto id = fuid::Fuid::from_string(text);
 * } catch (const fuid::DecodeError& e) {
 *     if (e.kind() == fuid::DecodeErrorKind::INVALID_SYMBOL) {
 *         // e.symbol(), e.position()
 *     }
 * }
 * @endcode
 */
class DecodeError : public std::runtime_error {
  public:
    explicit DecodeError(const DecodeFailure& failure);

    DecodeErrorKind kind() const noexcept { return failure_.kind; }
    char symbol() const noexcept { return failure_.symbol; }
    std::size_t position() const noexcept { return failure_.position; }
    const DecodeFailure& failure() const noexcept { return failure_; }

  private:
    DecodeFailure failure_;
};

} // namespace fuid

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
 * @file error.cpp
 * @brief Message formatting for decode failures.
 */

#include "fuid/core/error.hpp"

namespace fuid {

std::string DecodeFailure::describe() const
{
    switch (kind) {
    case DecodeErrorKind::INVALID_SYMBOL:
        return "invalid base62 symbol '" + std::string(1, symbol) + "' at position " +
               std::to_string(position);
    case DecodeErrorKind::ARITHMETIC_OVERFLOW:
        return "arithmetic overflow while decoding base62 string";
    }
    return "unknown base62 decode failure";
}

DecodeError::DecodeError(const DecodeFailure& failure)
    : std::runtime_error(failure.describe()), failure_(failure)
{
}

} // namespace fuid

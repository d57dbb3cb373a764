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
 * @brief Line handling helpers for textual identifier input.
 *
 * @details
 * The codec is strict: a space or newline is an invalid symbol. Input that
 * arrives line by line (the `check` command reads stdin) is cleaned with
 * these helpers before it reaches the decoder.
 */

#pragma once

#include <string>
#include <string_view>

namespace fuid::infra {

/**
 * @class String
 * @brief A static container for text clean-up routines.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace.
     *
     * Whitespace is space, `\t`, `\n`, `\r`, `\v` and `\f`.
     *
     * @return std::string The trimmed copy; empty if `s` is all whitespace.
     *
     * @code
     * String::trim("  6fTiplVKIi6bJFe8rTXPcu\r\n"); // "6fTiplVKIi6bJFe8rTXPcu"
     * @endcode
     */
    static std::string trim(std::string_view s);

    /// @brief True if `s` is empty or only whitespace.
    static bool is_blank(std::string_view s);
};

} // namespace fuid::infra

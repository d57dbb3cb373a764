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
 * @file fuid.hpp
 * @brief The `Fuid` identifier: a UUID-sized value with a short base-62 text form.
 *
 * @details
 * A `Fuid` is generated like a random UUID but prints as at most 22
 * alphanumeric characters (`6fTiplVKIi6bJFe8rTXPcu`) instead of the 36
 * character hyphenated hex form. The integer is the canonical form; the string
 * is derived on demand and never cached.
 */

#pragma once

#include "fuid/core/base62.hpp"
#include "fuid/core/error.hpp"
#include "fuid/core/uint128.hpp"
#include "fuid/core/uuid.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace fuid {

/**
 * @class Fuid
 * @brief Immutable 128-bit identifier value.
 *
 * @details
 * Equality, ordering and hashing follow the wrapped integer. Ordering is
 * numeric, which differs from comparing the encoded strings whenever their
 * lengths differ (`"z" < "10"` numerically, the opposite lexically).
 *
 * All conversions are total except parsing, which reports the decoder's
 * `DecodeError` unchanged.
 */
class Fuid {
  public:
    /// @brief The zero identifier; encodes as `"0"`.
    constexpr Fuid() noexcept = default;

    /**
     * @brief Draws a new random identifier (Version 4 UUID bits).
     *
     * Safe to call from any thread.
     */
    static Fuid random();

    /// @brief Wraps any 128-bit value verbatim.
    static constexpr Fuid from_int(uint128 value) noexcept { return Fuid(value); }

    /**
     * @brief Parses a base-62 encoded identifier.
     *
     * @throws DecodeError If `text` contains a symbol outside `[0-9A-Za-z]` or
     * its value overflows 128 bits.
     *
     * @code
     * auto id = fuid::Fuid::from_string("6fTiplVKIi6bJFe8rTXPcu");
     * @endcode
     */
    static Fuid from_string(std::string_view text);

    /**
     * @brief Non-throwing parse; same acceptance rules as `from_string`.
     *
     * @param failure Optional out-parameter describing the rejection.
     */
    static std::optional<Fuid> try_parse(std::string_view text,
                                         DecodeFailure* failure = nullptr) noexcept;

    /// @brief Bit-for-bit reinterpretation of a UUID.
    static Fuid from_uuid(const Uuid& uuid) noexcept;

    /// @brief The canonical base-62 string.
    std::string to_string() const;

    /// @brief `Fuid("<encoded>")`, for diagnostics.
    std::string debug_string() const;

    constexpr uint128 to_int() const noexcept { return value_; }

    /// @brief Bit-for-bit reinterpretation as a UUID.
    Uuid to_uuid() const noexcept;

    friend constexpr bool operator==(const Fuid& a, const Fuid& b) noexcept { return a.value_ == b.value_; }
    friend constexpr bool operator!=(const Fuid& a, const Fuid& b) noexcept { return a.value_ != b.value_; }
    friend constexpr bool operator<(const Fuid& a, const Fuid& b) noexcept { return a.value_ < b.value_; }
    friend constexpr bool operator>(const Fuid& a, const Fuid& b) noexcept { return a.value_ > b.value_; }
    friend constexpr bool operator<=(const Fuid& a, const Fuid& b) noexcept { return a.value_ <= b.value_; }
    friend constexpr bool operator>=(const Fuid& a, const Fuid& b) noexcept { return a.value_ >= b.value_; }

  private:
    constexpr explicit Fuid(uint128 value) noexcept : value_(value) {}

    uint128 value_ = 0;
};

/// @brief Writes the encoded form.
std::ostream& operator<<(std::ostream& os, const Fuid& id);

/**
 * @brief Reads one whitespace-delimited token and parses it like `from_string`.
 *
 * On a rejected token `failbit` is set and `id` is left unchanged.
 */
std::istream& operator>>(std::istream& is, Fuid& id);

/**
 * @brief Fail-fast construction from an integer. Always succeeds.
 */
Fuid make_fuid(uint128 value) noexcept;

/**
 * @brief Fail-fast construction from a literal encoded string.
 *
 * Intended for identifiers written into source code, where an invalid string
 * is a programming error. Unlike `Fuid::from_string`, there is no recoverable
 * error: an invalid `text` is logged at FATAL and the process terminates.
 *
 * @code
 * const auto root = fuid::make_fuid("6fTiplVKIi6bJFe8rTXPcu");
 * @endcode
 */
Fuid make_fuid(std::string_view text) noexcept;

/**
 * @brief String-literal form; the terminating NUL is not part of the identifier.
 *
 * Taking the array by reference keeps `make_fuid(0)` on the integer overload.
 */
template <std::size_t N> Fuid make_fuid(const char (&text)[N]) noexcept
{
    return make_fuid(std::string_view(text, N - 1));
}

} // namespace fuid

namespace std {

template <> struct hash<fuid::Fuid> {
    std::size_t operator()(const fuid::Fuid& id) const noexcept
    {
        const fuid::uint128 v = id.to_int();
        const auto hi = static_cast<std::uint64_t>(v >> 64);
        const auto lo = static_cast<std::uint64_t>(v);
        std::size_t seed = std::hash<std::uint64_t>{}(hi);
        seed ^= std::hash<std::uint64_t>{}(lo) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        return seed;
    }
};

} // namespace std

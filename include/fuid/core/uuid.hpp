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
 * @file uuid.hpp
 * @brief A standard 128-bit RFC 4122 unique identifier value.
 *
 * @details
 * `Uuid` stores its 16 bytes in network order (byte 0 is the most significant),
 * which is the layout the canonical `8-4-4-4-12` text form prints. Reading the
 * bytes as one big-endian integer gives the `uint128` a `Fuid` wraps, so the
 * two types convert bit-for-bit in both directions.
 */

#pragma once

#include "fuid/core/uint128.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace fuid {

/**
 * @class Uuid
 * @brief Immutable 16-byte UUID value with canonical text conversions.
 */
class Uuid {
  public:
    static constexpr std::size_t SIZE = 16;
    using Bytes = std::array<std::uint8_t, SIZE>;

    /// @brief The nil UUID (all bits zero).
    Uuid() noexcept;

    explicit Uuid(const Bytes& bytes) noexcept;

    /// @brief Lays `value` out big-endian into the 16 bytes.
    static Uuid from_u128(uint128 value) noexcept;

    /// @brief Reads the 16 bytes as one big-endian integer.
    uint128 as_u128() const noexcept;

    const Bytes& bytes() const noexcept { return bytes_; }

    /// @brief The version nibble (high nibble of byte 6), e.g. 4 for random UUIDs.
    int version() const noexcept;

    bool is_nil() const noexcept;

    /**
     * @brief Canonical lowercase form, e.g. `db1f847a-5add-4dfd-be9e-3c22fcab34f8`.
     */
    std::string to_string() const;

    /**
     * @brief Parses the canonical 36-character hyphenated form.
     *
     * Hex digits may be upper or lower case. Braces, URNs and the
     * 32-digit unhyphenated form are not accepted.
     */
    static std::optional<Uuid> try_parse(std::string_view text) noexcept;

    /**
     * @brief Throwing variant of `try_parse`.
     * @throws std::invalid_argument If `text` is not a canonical UUID.
     */
    static Uuid parse(std::string_view text);

    friend bool operator==(const Uuid& a, const Uuid& b) noexcept { return a.bytes_ == b.bytes_; }
    friend bool operator!=(const Uuid& a, const Uuid& b) noexcept { return a.bytes_ != b.bytes_; }
    friend bool operator<(const Uuid& a, const Uuid& b) noexcept { return a.bytes_ < b.bytes_; }

  private:
    Bytes bytes_;
};

std::ostream& operator<<(std::ostream& os, const Uuid& uuid);

} // namespace fuid

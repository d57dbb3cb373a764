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
 * @file uuid.cpp
 * @brief Byte layout and text form of the `Uuid` value type.
 */

#include "fuid/core/uuid.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fuid {

namespace {

/// @brief Value of a hex digit, or -1.
int hex_value(char c) noexcept
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

/// @brief Offsets of the four hyphens in the canonical 36-character form.
bool is_hyphen_offset(std::size_t i) noexcept
{
    return i == 8 || i == 13 || i == 18 || i == 23;
}

} // namespace

Uuid::Uuid() noexcept : bytes_{} {}

Uuid::Uuid(const Bytes& bytes) noexcept : bytes_(bytes) {}

Uuid Uuid::from_u128(uint128 value) noexcept
{
    Bytes bytes{};
    for (std::size_t i = SIZE; i-- > 0;) {
        bytes[i] = static_cast<std::uint8_t>(value & 0xFF);
        value >>= 8;
    }
    return Uuid(bytes);
}

uint128 Uuid::as_u128() const noexcept
{
    uint128 value = 0;
    for (std::uint8_t b : bytes_) {
        value = (value << 8) | b;
    }
    return value;
}

int Uuid::version() const noexcept
{
    return bytes_[6] >> 4;
}

bool Uuid::is_nil() const noexcept
{
    for (std::uint8_t b : bytes_) {
        if (b != 0) {
            return false;
        }
    }
    return true;
}

std::string Uuid::to_string() const
{
    const uint128 value = as_u128();
    const auto hi = static_cast<std::uint64_t>(value >> 64);
    const auto lo = static_cast<std::uint64_t>(value);

    std::stringstream ss;
    ss << std::hex << std::setfill('0')
       // time_low
       << std::setw(8) << (hi >> 32) << "-"
       // time_mid
       << std::setw(4) << ((hi >> 16) & 0xFFFF) << "-"
       // time_hi_and_version
       << std::setw(4) << (hi & 0xFFFF) << "-"
       // clock_seq
       << std::setw(4) << (lo >> 48) << "-"
       // node
       << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

std::optional<Uuid> Uuid::try_parse(std::string_view text) noexcept
{
    if (text.size() != 36) {
        return std::nullopt;
    }

    Bytes bytes{};
    std::size_t nibble = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (is_hyphen_offset(i)) {
            if (text[i] != '-') {
                return std::nullopt;
            }
            continue;
        }

        const int v = hex_value(text[i]);
        if (v < 0) {
            return std::nullopt;
        }
        auto& slot = bytes[nibble / 2];
        slot = static_cast<std::uint8_t>((nibble % 2 == 0) ? (v << 4) : (slot | v));
        ++nibble;
    }

    return Uuid(bytes);
}

Uuid Uuid::parse(std::string_view text)
{
    std::optional<Uuid> uuid = try_parse(text);
    if (!uuid) {
        throw std::invalid_argument("invalid UUID \"" + std::string(text) + "\"");
    }
    return *uuid;
}

std::ostream& operator<<(std::ostream& os, const Uuid& uuid)
{
    return os << uuid.to_string();
}

} // namespace fuid

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
 * @file id_generator.cpp
 * @brief Implementation of Version 4 UUID generation.
 */

#include "fuid/infra/id_generator.hpp"

#include <cstdint>
#include <random>

namespace fuid::infra {

/**
 * @brief Generates an RFC 4122 compliant Version 4 UUID.
 *
 * Implementation Strategy:
 * 1. **Thread Safety**: `thread_local` engines give each thread an isolated
 * generator, so no lock is taken.
 * 2. **Entropy Source**: A 64-bit Mersenne Twister seeded once per thread from
 * `std::random_device`.
 * 3. **Protocol Compliance**: version nibble forced to 4, variant forced to `10`.
 */
Uuid IdGenerator::generate()
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<std::uint64_t> dis;

    // Two 64-bit samples give the 128 raw bits.
    std::uint64_t hi = dis(gen);
    std::uint64_t lo = dis(gen);

    // time_hi_and_version: top nibble of bits 48..63 of `hi` becomes 0100.
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;

    // clock_seq_hi_and_reserved: top two bits of `lo` become 10.
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return Uuid::from_u128((static_cast<uint128>(hi) << 64) | lo);
}

} // namespace fuid::infra

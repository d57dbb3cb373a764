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
 * @file id_generator.hpp
 * @brief Entropy source for random (version 4) identifiers.
 *
 * @details
 * This file declares the `IdGenerator` class, the only place in the library
 * that touches a random number generator. Every `Fuid::random()` call draws
 * its 128 bits here.
 */

#pragma once

#include "fuid/core/uuid.hpp"

namespace fuid::infra {

/**
 * @class IdGenerator
 * @brief A static utility producing RFC 4122 Version 4 UUID values.
 *
 * @details
 * Each thread owns its own engine, so concurrent callers never contend on a
 * lock and never share generator state.
 */
class IdGenerator {
  public:
    /**
     * @brief Generates a random Version 4 UUID.
     *
     * 122 bits are random. The remaining six are fixed:
     * - Version nibble (byte 6, high nibble) = `0100`.
     * - Variant bits (byte 8, top two bits) = `10`.
     *
     * @return Uuid A fresh value whose text form matches
     * `xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx` with `y` in `{8, 9, a, b}`.
     *
     * @code
     * fuid::Uuid id = fuid::infra::IdGenerator::generate();
     * @endcode
     */
    static Uuid generate();
};

} // namespace fuid::infra

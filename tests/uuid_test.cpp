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
 * @file uuid_test.cpp
 * @brief Unit tests for the `Uuid` value type and the Version 4 generator.
 */

#include "fuid/core/uuid.hpp"
#include "fuid/infra/id_generator.hpp"
#include "framework.hpp"

#include <string>

using fuid::Uuid;
using fuid::uint128;

void test_uuid_parse_and_print()
{
    const std::string text = "db1f847a-5add-4dfd-be9e-3c22fcab34f8";
    Uuid uuid = Uuid::parse(text);

    ASSERT_EQ(uuid.to_string(), text);
    ASSERT_EQ(uuid.version(), 4);
    ASSERT_EQ(static_cast<int>(uuid.bytes()[0]), 0xdb);
    ASSERT_EQ(static_cast<int>(uuid.bytes()[15]), 0xf8);

    // Upper-case input is accepted and printed back in lower case.
    ASSERT_EQ(Uuid::parse("DB1F847A-5ADD-4DFD-BE9E-3C22FCAB34F8"), uuid);
}

void test_uuid_rejects_malformed_text()
{
    ASSERT_FALSE(Uuid::try_parse("").has_value());
    ASSERT_FALSE(Uuid::try_parse("db1f847a5add4dfdbe9e3c22fcab34f8").has_value());
    ASSERT_FALSE(Uuid::try_parse("{db1f847a-5add-4dfd-be9e-3c22fcab34f8}").has_value());
    ASSERT_FALSE(Uuid::try_parse("db1f847a-5add-4dfd-be9e-3c22fcab34fg").has_value());
    ASSERT_FALSE(Uuid::try_parse("db1f847a_5add-4dfd-be9e-3c22fcab34f8").has_value());
    ASSERT_FALSE(Uuid::try_parse("db1f847a-5add-4dfd-be9e3-c22fcab34f8").has_value());
    ASSERT_THROWS(Uuid::parse("not-a-uuid"), std::invalid_argument);
}

/**
 * @brief Byte 0 is the most significant byte of the 128-bit value.
 */
void test_uuid_integer_layout()
{
    Uuid one = Uuid::from_u128(1);
    ASSERT_EQ(static_cast<int>(one.bytes()[15]), 1);
    ASSERT_EQ(static_cast<int>(one.bytes()[0]), 0);
    ASSERT_EQ(one.to_string(), std::string("00000000-0000-0000-0000-000000000001"));

    Uuid top = Uuid::from_u128(static_cast<uint128>(0xAB) << 120);
    ASSERT_EQ(static_cast<int>(top.bytes()[0]), 0xAB);

    Uuid max = Uuid::from_u128(fuid::UINT128_MAX_VALUE);
    ASSERT_EQ(max.to_string(), std::string("ffffffff-ffff-ffff-ffff-ffffffffffff"));
    ASSERT_EQ(max.as_u128(), fuid::UINT128_MAX_VALUE);

    uint128 value = Uuid::parse("c49f5859-c0e2-4bc5-b75a-f2020cbc5cbd").as_u128();
    ASSERT_EQ(Uuid::from_u128(value).to_string(), std::string("c49f5859-c0e2-4bc5-b75a-f2020cbc5cbd"));
}

void test_uuid_nil()
{
    Uuid nil;
    ASSERT_TRUE(nil.is_nil());
    ASSERT_EQ(nil.to_string(), std::string("00000000-0000-0000-0000-000000000000"));
    ASSERT_FALSE(Uuid::from_u128(1).is_nil());
}

/**
 * @brief Validates the canonical 36-character form and the Version 4 markers.
 *
 * The text form is 8-4-4-4-12 hex digits; character 14 is the version `4`
 * and character 19 is one of `8 9 a b`.
 */
void test_uuid_generator_format()
{
    for (int i = 0; i < 64; ++i) {
        std::string id = fuid::infra::IdGenerator::generate().to_string();
        ASSERT_EQ(id.length(), static_cast<size_t>(36));
        ASSERT_EQ(id[14], '4');
        ASSERT_TRUE(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
    }
}

/**
 * @brief Sequential invocations advance the thread-local engine.
 */
void test_uuid_generator_uniqueness()
{
    Uuid id1 = fuid::infra::IdGenerator::generate();
    Uuid id2 = fuid::infra::IdGenerator::generate();
    ASSERT_NE(id1, id2);
}

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
 * @file fuid_test.cpp
 * @brief Unit tests for the `Fuid` identifier type.
 */

#include "fuid/core/fuid.hpp"
#include "framework.hpp"

#include <iomanip>
#include <sstream>
#include <string>
#include <unordered_set>

using fuid::Fuid;
using fuid::uint128;

namespace {

const char* const ID_A = "6fTiplVKIi6bJFe8rTXPcu";
const char* const ID_B = "5z1JeaxqBJ4Y3pEXh2B8Sj";

} // namespace

void test_fuid_string_round_trip()
{
    Fuid a = Fuid::from_string(ID_A);
    Fuid b = Fuid::from_string(ID_B);

    ASSERT_EQ(a.to_string(), std::string(ID_A));
    ASSERT_EQ(b.to_string(), std::string(ID_B));
    ASSERT_NE(a, b);
}

/**
 * @brief Random identifiers differ from each other and from fixed values.
 *
 * Probabilistic: 122 random bits make a collision in this sample negligible.
 */
void test_fuid_random_distinct()
{
    ASSERT_NE(Fuid::random(), Fuid::from_string(ID_A));
    ASSERT_NE(Fuid::random(), Fuid::from_string(ID_B));

    std::unordered_set<Fuid> seen;
    for (int i = 0; i < 256; ++i) {
        seen.insert(Fuid::random());
    }
    ASSERT_EQ(seen.size(), static_cast<std::size_t>(256));
}

/**
 * @brief Random identifiers carry Version 4 / RFC 4122 variant bits.
 */
void test_fuid_random_layout()
{
    for (int i = 0; i < 32; ++i) {
        fuid::Uuid uuid = Fuid::random().to_uuid();
        ASSERT_EQ(uuid.version(), 4);
        ASSERT_EQ(uuid.bytes()[8] & 0xC0, 0x80);
    }
}

void test_fuid_rejects_invalid_string()
{
    ASSERT_THROWS(Fuid::from_string("ab!"), fuid::DecodeError);

    fuid::DecodeFailure failure;
    ASSERT_FALSE(Fuid::try_parse("ab!", &failure).has_value());
    ASSERT_TRUE(failure.kind == fuid::DecodeErrorKind::INVALID_SYMBOL);
    ASSERT_EQ(failure.symbol, '!');
    ASSERT_EQ(failure.position, static_cast<std::size_t>(3));

    ASSERT_FALSE(Fuid::try_parse(std::string(65, 'z')).has_value());
}

void test_fuid_try_parse_matches_from_string()
{
    for (const char* text : {ID_A, ID_B, "0", "", "F0ob4rZ", "7n42DGM5Tflk9n8mt7Fhc7"}) {
        std::optional<Fuid> parsed = Fuid::try_parse(text);
        ASSERT_TRUE(parsed.has_value());
        ASSERT_EQ(*parsed, Fuid::from_string(text));
    }
}

void test_fuid_int_round_trip()
{
    ASSERT_EQ(Fuid::from_int(852751187393ULL).to_string(), std::string("F0ob4rZ"));
    ASSERT_EQ(Fuid::from_string("F0ob4rZ").to_int(), static_cast<uint128>(852751187393ULL));

    for (int i = 0; i < 16; ++i) {
        Fuid id = Fuid::random();
        ASSERT_EQ(Fuid::from_int(id.to_int()), id);
    }
    ASSERT_EQ(Fuid::from_int(fuid::UINT128_MAX_VALUE).to_int(), fuid::UINT128_MAX_VALUE);
}

/**
 * @brief The integer, the UUID bytes and the encoding describe the same bits.
 */
void test_fuid_uuid_interop()
{
    fuid::Uuid uuid = fuid::Uuid::parse("db1f847a-5add-4dfd-be9e-3c22fcab34f8");
    Fuid id = Fuid::from_uuid(uuid);

    ASSERT_EQ(id.to_string(), std::string(ID_A));
    ASSERT_EQ(id.to_uuid(), uuid);
    ASSERT_EQ(Fuid::from_string(ID_B).to_uuid().to_string(),
              std::string("c49f5859-c0e2-4bc5-b75a-f2020cbc5cbd"));

    for (int i = 0; i < 16; ++i) {
        fuid::Uuid u = Fuid::random().to_uuid();
        ASSERT_EQ(Fuid::from_uuid(u).to_uuid(), u);
    }
}

/**
 * @brief Ordering is numeric, not the lexical order of the encodings.
 */
void test_fuid_numeric_ordering()
{
    Fuid z = Fuid::from_string("z");   // 61
    Fuid ten = Fuid::from_string("10"); // 62

    ASSERT_TRUE(z < ten);
    ASSERT_TRUE(ten > z);
    ASSERT_TRUE(std::string("z") > std::string("10"));
    ASSERT_TRUE(z <= z);
    ASSERT_TRUE(ten >= z);
}

void test_fuid_hash_follows_equality()
{
    std::unordered_set<Fuid> set;
    set.insert(Fuid::from_string(ID_A));
    set.insert(Fuid::from_string("000" + std::string(ID_A)));
    set.insert(Fuid::from_uuid(fuid::Uuid::parse("db1f847a-5add-4dfd-be9e-3c22fcab34f8")));
    ASSERT_EQ(set.size(), static_cast<std::size_t>(1));

    ASSERT_EQ(std::hash<Fuid>{}(Fuid::from_string("F0ob4rZ")),
              std::hash<Fuid>{}(Fuid::from_int(852751187393ULL)));
}

void test_fuid_stream_io()
{
    std::ostringstream out;
    out << Fuid::from_string(ID_A) << " " << Fuid::from_int(0);
    ASSERT_EQ(out.str(), std::string(ID_A) + " 0");

    // Field width and alignment apply to the encoded form.
    std::ostringstream padded;
    padded << std::setw(10) << Fuid::from_string("F0ob4rZ") << "|" << std::left << std::setw(4)
           << Fuid::from_int(61) << "|";
    ASSERT_EQ(padded.str(), std::string("   F0ob4rZ|z   |"));

    std::istringstream in(std::string(ID_B) + "  F0ob4rZ");
    Fuid first;
    Fuid second;
    in >> first >> second;
    ASSERT_FALSE(in.fail());
    ASSERT_EQ(first, Fuid::from_string(ID_B));
    ASSERT_EQ(second, Fuid::from_int(852751187393ULL));

    std::istringstream bad("ab!");
    Fuid untouched = Fuid::from_string(ID_A);
    bad >> untouched;
    ASSERT_TRUE(bad.fail());
    ASSERT_EQ(untouched, Fuid::from_string(ID_A));
}

void test_fuid_debug_string()
{
    ASSERT_EQ(Fuid::from_int(852751187393ULL).debug_string(), std::string("Fuid(\"F0ob4rZ\")"));
}

void test_fuid_default_is_zero()
{
    Fuid id;
    ASSERT_EQ(id.to_int(), static_cast<uint128>(0));
    ASSERT_EQ(id.to_string(), std::string("0"));
    ASSERT_TRUE(id.to_uuid().is_nil());
}

/**
 * @brief The fail-fast constructor agrees with the fallible one on valid input.
 */
void test_make_fuid()
{
    ASSERT_EQ(fuid::make_fuid(ID_A), Fuid::from_string(ID_A));
    ASSERT_EQ(fuid::make_fuid(852751187393ULL), Fuid::from_string("F0ob4rZ"));
    ASSERT_EQ(fuid::make_fuid(std::string_view("F0ob4rZ")).to_int(),
              static_cast<uint128>(852751187393ULL));
    ASSERT_EQ(fuid::make_fuid("F0ob4rZ"), Fuid::from_int(852751187393ULL));

    // Zero stays on the integer overload.
    ASSERT_EQ(fuid::make_fuid(0), Fuid());
    ASSERT_EQ(fuid::make_fuid(0).to_string(), std::string("0"));
}

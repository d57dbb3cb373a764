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
 * @file fuid.cpp
 * @brief Construction and conversions of the `Fuid` value type.
 *
 * @details
 * Everything here delegates to `Base62` for text and to `Uuid` for the
 * byte layout; `Fuid` adds no rules of its own.
 */

#include "fuid/core/fuid.hpp"

#include "fuid/infra/id_generator.hpp"
#include "fuid/infra/logger.hpp"

#include <exception>

namespace fuid {

Fuid Fuid::random()
{
    return from_uuid(infra::IdGenerator::generate());
}

Fuid Fuid::from_string(std::string_view text)
{
    return Fuid(Base62::decode(text));
}

std::optional<Fuid> Fuid::try_parse(std::string_view text, DecodeFailure* failure) noexcept
{
    std::optional<uint128> value = Base62::try_decode(text, failure);
    if (!value) {
        return std::nullopt;
    }
    return Fuid(*value);
}

Fuid Fuid::from_uuid(const Uuid& uuid) noexcept
{
    return Fuid(uuid.as_u128());
}

std::string Fuid::to_string() const
{
    return Base62::encode(value_);
}

std::string Fuid::debug_string() const
{
    return "Fuid(\"" + to_string() + "\")";
}

Uuid Fuid::to_uuid() const noexcept
{
    return Uuid::from_u128(value_);
}

std::ostream& operator<<(std::ostream& os, const Fuid& id)
{
    char buffer[Base62::MAX_LENGTH];
    std::size_t length = Base62::encode_to(id.to_int(), buffer);
    return os << std::string_view(buffer, length);
}

std::istream& operator>>(std::istream& is, Fuid& id)
{
    std::string token;
    if (!(is >> token)) {
        return is;
    }

    std::optional<Fuid> parsed = Fuid::try_parse(token);
    if (!parsed) {
        is.setstate(std::ios::failbit);
        return is;
    }
    id = *parsed;
    return is;
}

Fuid make_fuid(uint128 value) noexcept
{
    return Fuid::from_int(value);
}

Fuid make_fuid(std::string_view text) noexcept
{
    DecodeFailure failure;
    std::optional<Fuid> id = Fuid::try_parse(text, &failure);
    if (!id) {
        // An exception escaping the log call terminates through noexcept as well.
        infra::Logger::log(infra::LogLevel::FATAL, "make_fuid: \"" + std::string(text) +
                                                       "\" is not a valid fuid: " +
                                                       failure.describe());
        std::terminate();
    }
    return *id;
}

} // namespace fuid

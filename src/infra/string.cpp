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
 * @file string.cpp
 * @brief Implementation of the text clean-up routines.
 */

#include "fuid/infra/string.hpp"

#include <cctype>

namespace fuid::infra {

namespace {

// std::isspace is undefined for negative char values.
bool is_space(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string String::trim(std::string_view s)
{
    std::size_t begin = 0;
    while (begin < s.size() && is_space(s[begin])) {
        ++begin;
    }

    std::size_t end = s.size();
    while (end > begin && is_space(s[end - 1])) {
        --end;
    }

    return std::string(s.substr(begin, end - begin));
}

bool String::is_blank(std::string_view s)
{
    for (char c : s) {
        if (!is_space(c)) {
            return false;
        }
    }
    return true;
}

} // namespace fuid::infra

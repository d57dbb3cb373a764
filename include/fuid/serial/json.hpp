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
 * @file json.hpp
 * @brief cJSON integration: a `Fuid` as a JSON string leaf.
 *
 * @details
 * Built only with `FUID_WITH_CJSON`. A `Fuid` serializes to its encoded form
 * as a JSON string (`"6fTiplVKIi6bJFe8rTXPcu"`) and deserializes from one,
 * rejecting anything that is not a string holding a valid encoding.
 *
 * Ownership follows cJSON: nodes returned by `to_json` belong to the caller
 * until attached to a parent with `cJSON_AddItemToObject` / `cJSON_AddItemToArray`.
 */

#pragma once

#include "fuid/core/fuid.hpp"

#include <cJSON.h>
#include <stdexcept>
#include <string>

namespace fuid::serial {

/**
 * @class SerializationError
 * @brief Raised when JSON input cannot be turned into a `Fuid`.
 *
 * @details
 * The message names the rejected input and, for decode failures, wraps the
 * decoder's description, e.g.
 * `invalid fuid "ab!": invalid base62 symbol '!' at position 3`.
 */
class SerializationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// @brief Creates a detached JSON string node. Returns `nullptr` if cJSON cannot allocate.
cJSON* to_json(const Fuid& id);

/**
 * @brief Reads a `Fuid` from a JSON string node.
 * @throws SerializationError If `node` is null, not a string, or not a valid encoding.
 */
Fuid from_json(const cJSON* node);

/**
 * @brief Compact JSON text for `id`, e.g. `"F0ob4rZ"` including the quotes.
 * @throws SerializationError If cJSON fails to allocate.
 */
std::string serialize(const Fuid& id);

/**
 * @brief Parses JSON text holding a single string value.
 * @throws SerializationError On malformed JSON or an invalid identifier.
 */
Fuid deserialize(const std::string& json_text);

/**
 * @brief Adds `id` under `key` to a JSON object.
 * @return true If the member was added.
 */
bool add_to_object(cJSON* object, const char* key, const Fuid& id);

/**
 * @brief Reads the member `key` of a JSON object as a `Fuid`.
 * @throws SerializationError If the member is missing or invalid.
 */
Fuid get_from_object(const cJSON* object, const char* key);

} // namespace fuid::serial

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
 * @file json.cpp
 * @brief cJSON encoding and decoding of `Fuid` values.
 */

#include "fuid/serial/json.hpp"

#include "fuid/infra/logger.hpp"

#include <cstdlib>
#include <memory>

namespace fuid::serial {

cJSON* to_json(const Fuid& id)
{
    return cJSON_CreateString(id.to_string().c_str());
}

Fuid from_json(const cJSON* node)
{
    if (!node) {
        throw SerializationError("expected a fuid string, got nothing");
    }
    if (!cJSON_IsString(node) || !node->valuestring) {
        throw SerializationError("expected a fuid string");
    }

    const std::string text = node->valuestring;
    DecodeFailure failure;
    std::optional<Fuid> id = Fuid::try_parse(text, &failure);
    if (!id) {
        std::string message = "invalid fuid \"" + text + "\": " + failure.describe();
        infra::Logger::log(infra::LogLevel::DEBUG, "json: " + message);
        throw SerializationError(message);
    }
    return *id;
}

std::string serialize(const Fuid& id)
{
    cJSON* node = to_json(id);
    if (!node) {
        throw SerializationError("cJSON allocation failed");
    }

    char* raw_output = cJSON_PrintUnformatted(node);
    cJSON_Delete(node);
    if (!raw_output) {
        throw SerializationError("cJSON allocation failed");
    }

    std::string text(raw_output);
    free(raw_output);
    return text;
}

Fuid deserialize(const std::string& json_text)
{
    // Owns the parsed tree on every exit path, including a throwing from_json.
    std::unique_ptr<cJSON, decltype(&cJSON_Delete)> node(cJSON_Parse(json_text.c_str()),
                                                          &cJSON_Delete);
    if (!node) {
        throw SerializationError("invalid JSON syntax");
    }
    return from_json(node.get());
}

bool add_to_object(cJSON* object, const char* key, const Fuid& id)
{
    if (!object || !key) {
        return false;
    }
    return cJSON_AddStringToObject(object, key, id.to_string().c_str()) != nullptr;
}

Fuid get_from_object(const cJSON* object, const char* key)
{
    if (!object || !key) {
        throw SerializationError("missing JSON object or member name");
    }
    const cJSON* member = cJSON_GetObjectItemCaseSensitive(object, key);
    if (!member) {
        throw SerializationError(std::string("missing fuid member '") + key + "'");
    }
    return from_json(member);
}

} // namespace fuid::serial

/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "JsonObject.hpp"

namespace otpkit {

JsonObject::JsonObject(json_t *root):
    JsonPtr(root)
{
    // Anything other than an object reads as an empty config:
    if (!json_is_object(root_))
        reset();
}

Status
JsonObject::objectCheck(const std::string &source)
{
    if (!json_is_object(root_))
    {
        reset();
        return OTPKIT_ERROR(OTPKIT_CC_JSONError,
                            source + " does not hold a JSON object");
    }
    return Status();
}

Status
JsonObject::load(const std::string &filename)
{
    OTPKIT_CHECK(JsonPtr::load(filename));
    return objectCheck(filename);
}

Status
JsonObject::decode(const std::string &data)
{
    OTPKIT_CHECK(JsonPtr::decode(data));
    return objectCheck("JSON text");
}

Status
JsonObject::hasString(const char *key) const
{
    const json_t *value = json_object_get(root_, key);
    if (!value)
        return OTPKIT_ERROR(OTPKIT_CC_JSONError,
                            std::string("Missing config value ") + key);
    if (!json_is_string(value))
        return OTPKIT_ERROR(OTPKIT_CC_JSONError,
                            std::string("Config value ") + key +
                            " is not a string");
    return Status();
}

const char *
JsonObject::getString(const char *key, const char *fallback) const
{
    return hasString(key) ?
        json_string_value(json_object_get(root_, key)) : fallback;
}

} // namespace otpkit

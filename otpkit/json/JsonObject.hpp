/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPKIT_JSON_JSON_OBJECT_HPP
#define OTPKIT_JSON_JSON_OBJECT_HPP

#include "JsonPtr.hpp"

namespace otpkit {

/**
 * A JsonPtr with an object (key-value pair) as it's root element.
 * This allows all sorts of member lookups.
 */
class JsonObject:
    public JsonPtr
{
public:
    OTPKIT_JSON_CONSTRUCTORS(JsonObject, JsonPtr)
    JsonObject(json_t *root);

    /**
     * Loads a JSON file, which must hold an object.
     */
    Status
    load(const std::string &filename);

    /**
     * Parses JSON text, which must hold an object.
     */
    Status
    decode(const std::string &data);

protected:
    // Type helpers:
    Status hasString (const char *key) const;

    // Read helpers:
    const char *getString (const char *key, const char *fallback) const;

private:
    /**
     * Rejects a freshly-parsed root that is not an object.
     */
    Status objectCheck(const std::string &source);
};

// Helper macros for implementing JsonObject child classes:

#define OTPKIT_JSON_VALUE(name, key, Type) \
    Type name() const                           { return Type(json_incref(json_object_get(root_, key))); }

#define OTPKIT_JSON_STRING(name, key, fallback) \
    const char *name() const                    { return getString(key, fallback); } \
    otpkit::Status name##Ok() const             { return hasString(key); }

} // namespace otpkit

#endif

/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "JsonPtr.hpp"
#include "../util/Debug.hpp"
#include "../util/Util.hpp"
#include <errno.h>
#include <stddef.h>
#include <stdio.h>

namespace otpkit {

/**
 * Every jansson allocation starts with this header,
 * so the block can be wiped on release.
 * Config files hold key URIs, and key URIs hold shared secrets.
 */
union JsonBlockHeader
{
    size_t size;
    max_align_t align;
};

static void *
jsonWipingMalloc(size_t size)
{
    auto header = static_cast<JsonBlockHeader *>(
        malloc(sizeof(JsonBlockHeader) + size));
    if (!header)
        return nullptr;
    header->size = size;
    return header + 1;
}

static void
jsonWipingFree(void *p)
{
    if (!p)
        return;
    auto header = static_cast<JsonBlockHeader *>(p) - 1;
    OTPKIT_UtilGuaranteedMemset(header, 0,
                                sizeof(JsonBlockHeader) + header->size);
    free(header);
}

/**
 * Installs the wiping allocators before any JSON is parsed.
 */
static struct JsonAllocSetup
{
    JsonAllocSetup()
    {
        json_set_alloc_funcs(jsonWipingMalloc, jsonWipingFree);
    }
} gJsonAllocSetup;

JsonPtr::~JsonPtr()
{
    reset();
}

JsonPtr::JsonPtr():
    root_(nullptr)
{}

JsonPtr::JsonPtr(JsonPtr &&move):
    root_(move.root_)
{
    move.root_ = nullptr;
}

JsonPtr::JsonPtr(const JsonPtr &copy):
    root_(json_incref(copy.root_))
{}

JsonPtr &
JsonPtr::operator=(const JsonPtr &copy)
{
    if (this != &copy)
        reset(json_incref(copy.root_));
    return *this;
}

JsonPtr::JsonPtr(json_t *root):
    root_(root)
{}

void
JsonPtr::reset(json_t *root)
{
    json_decref(root_);
    root_ = root;
}

Status
JsonPtr::load(const std::string &filename)
{
    OTPKIT_DebugLog("Loading config %s", filename.c_str());

    FILE *file = fopen(filename.c_str(), "r");
    if (!file)
        return OTPKIT_ERROR(OTPKIT_CC_FileReadError, "Cannot open " +
                            filename + ": " + strerror(errno));

    json_error_t error;
    json_t *root = json_loadf(file, 0, &error);
    fclose(file);
    if (!root)
        return OTPKIT_ERROR(OTPKIT_CC_JSONError, filename + ":" +
                            std::to_string(error.line) + ": " + error.text);
    reset(root);
    return Status();
}

Status
JsonPtr::decode(const std::string &data)
{
    json_error_t error;
    json_t *root = json_loadb(data.data(), data.size(), 0, &error);
    if (!root)
        return OTPKIT_ERROR(OTPKIT_CC_JSONError, error.text);
    reset(root);
    return Status();
}

} // namespace otpkit

/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Helpers for implementing the C API.
 */

#ifndef OTPKIT_UTIL_UTIL_HPP
#define OTPKIT_UTIL_UTIL_HPP

#include "../../src/OtpKit.h"
#include "Debug.hpp"
#include <stdlib.h>
#include <string.h>
#include <new>

namespace otpkit {

#define OTPKIT_LOG_ERROR(code, err_string) \
    { \
        OTPKIT_DebugLog("Error: %s, code: %d, func: %s, source: %s, line: %d", \
            err_string, static_cast<int>(code), __FUNCTION__, __FILE__, __LINE__); \
    }

#define OTPKIT_SET_ERR_CODE(err, set_code) \
    if (err != NULL) { \
        err->code = set_code; \
    }

#define OTPKIT_RET_ERROR(err, desc) \
    { \
        if (pError) \
        { \
            pError->code = err; \
            strcpy(pError->szDescription, desc); \
            strcpy(pError->szSourceFunc, __FUNCTION__); \
            strcpy(pError->szSourceFile, __FILE__); \
            pError->nSourceLine = __LINE__; \
        } \
        cc = err; \
        OTPKIT_LOG_ERROR(cc, desc); \
        goto exit; \
    }

#define OTPKIT_CHECK_ASSERT(assert, err, desc) \
    { \
        if (!(assert)) \
        { \
            OTPKIT_RET_ERROR(err, desc); \
        } \
    } \

#define OTPKIT_CHECK_NULL(arg) \
    { \
        OTPKIT_CHECK_ASSERT(arg != NULL, OTPKIT_CC_NULLPtr, "NULL pointer"); \
    } \

/**
 * Allocates a zeroed C structure, which the caller frees with `free`.
 */
template<typename T> T *
structAlloc()
{
    auto out = static_cast<T *>(calloc(1, sizeof(T)));
    if (!out)
        throw std::bad_alloc();
    return out;
}

/**
 * Copies a string into a malloc'ed buffer.
 */
char *
stringCopy(const char *string);

char *
stringCopy(const std::string &string);

/**
 * Wipes and frees a malloc'ed string.
 */
void
stringFree(char *string);

void *OTPKIT_UtilGuaranteedMemset(void *v, int c, size_t n);

} // namespace otpkit

#endif

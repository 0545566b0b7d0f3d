/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPKIT_UTIL_DEBUG_HPP
#define OTPKIT_UTIL_DEBUG_HPP

#include "Status.hpp"

#define DEBUG_LEVEL 1

#define OTPKIT_DebugLevel(level, ...)   \
{                                       \
    if (DEBUG_LEVEL >= level)           \
    {                                   \
        OTPKIT_DebugLog(__VA_ARGS__);   \
    }                                   \
}

namespace otpkit {

/**
 * Starts logging to the given file, in addition to stderr.
 * Output is appended. Once the file passes 512 KiB it is moved
 * aside with a "-prev" suffix and a fresh one is started.
 * An empty path disables the log file.
 */
Status
debugInitialize(const std::string &path);

void
debugTerminate();

void OTPKIT_DebugLog(const char *format, ...)
#ifdef __GNUC__
    __attribute__((format(printf, 1, 2)))
#endif
    ;

} // namespace otpkit

#endif

/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Debug.hpp"
#include <errno.h>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <time.h>
#include <mutex>
#include <vector>

namespace otpkit {

#define MAX_LOG_SIZE (1 << 19) // 512 KiB per file

static std::mutex gDebugMutex;
static FILE *gLogFile = nullptr;
static std::string gLogPath;

/**
 * Opens the log file for appending,
 * first moving it aside if it has grown too large.
 * The caller must hold the mutex.
 */
static Status
debugLogOpen()
{
    if (gLogFile)
        fclose(gLogFile);

    gLogFile = fopen(gLogPath.c_str(), "a");
    if (gLogFile && !fseek(gLogFile, 0, SEEK_END) &&
        MAX_LOG_SIZE < ftell(gLogFile))
    {
        fclose(gLogFile);
        gLogFile = nullptr;
        const std::string prev = gLogPath + "-prev";
        if (rename(gLogPath.c_str(), prev.c_str()))
            return OTPKIT_ERROR(OTPKIT_CC_SysError, "Cannot move " +
                                gLogPath + ": " + strerror(errno));
        gLogFile = fopen(gLogPath.c_str(), "a");
    }

    if (!gLogFile)
        return OTPKIT_ERROR(OTPKIT_CC_SysError, "Cannot open " + gLogPath +
                            ": " + strerror(errno));
    return Status();
}

Status
debugInitialize(const std::string &path)
{
    std::lock_guard<std::mutex> lock(gDebugMutex);
    if (gLogFile)
        fclose(gLogFile);
    gLogFile = nullptr;

    gLogPath = path;
    if (gLogPath.empty())
        return Status();
    return debugLogOpen();
}

void
debugTerminate()
{
    std::lock_guard<std::mutex> lock(gDebugMutex);
    if (gLogFile)
        fclose(gLogFile);
    gLogFile = nullptr;
}

void OTPKIT_DebugLog(const char *format, ...)
{
    // "2015-06-01 12:00:00 otpkit: "
    char stamp[64];
    time_t now = time(nullptr);
    struct tm utc;
    gmtime_r(&now, &utc);
    strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S otpkit: ", &utc);

    va_list args;
    va_start(args, format);
    int size = vsnprintf(nullptr, 0, format, args);
    va_end(args);
    if (size < 0)
        return;

    std::vector<char> message(size + 1);
    va_start(args, format);
    vsnprintf(message.data(), message.size(), format, args);
    va_end(args);

    std::string line = stamp;
    line.append(message.data(), size);
    if ('\n' != line.back())
        line += '\n';

    std::lock_guard<std::mutex> lock(gDebugMutex);
#ifdef DEBUG
    fputs(line.c_str(), stderr);
#endif
    if (!gLogFile)
        return;

    if (MAX_LOG_SIZE < ftell(gLogFile))
    {
        Status s = debugLogOpen();
        if (!s)
            fprintf(stderr, "%s\n", s.message().c_str());
        if (!gLogFile)
            return;
    }
    fputs(line.c_str(), gLogFile);
    fflush(gLogFile);
}

} // namespace otpkit

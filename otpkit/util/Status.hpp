/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */
#ifndef OTPKIT_UTIL_STATUS_HPP
#define OTPKIT_UTIL_STATUS_HPP

// We need tOTPKIT_CC and tOTPKIT_Error:
#include "../../src/OtpKit.h"
#include <ostream>
#include <string>

namespace otpkit {

/**
 * The outcome of a core function: success, or an error code with a
 * message and the source location that raised it.
 */
class Status
{
public:
    /**
     * Constructs a success status.
     */
    Status();

    /**
     * Constructs an error status.
     */
    Status(tOTPKIT_CC value, std::string message,
        std::string file, std::string function, size_t line);

    tOTPKIT_CC value()          const { return value_; }
    std::string message()       const { return message_; }

    /**
     * Formats the error location as "file:line: function".
     */
    std::string where() const;

    explicit operator bool() const { return value_ == OTPKIT_CC_Ok; }

    /**
     * Writes the error to the debug log, if this is an error.
     */
    const Status &log() const;

    /**
     * Copies this status into a C API error structure,
     * truncating long strings.
     */
    void toError(tOTPKIT_Error &error) const;

    static Status fromError(const tOTPKIT_Error &error);

private:
    tOTPKIT_CC value_;
    std::string message_;
    std::string file_;
    std::string function_;
    size_t line_;
};

std::ostream &operator<<(std::ostream &output, const Status &s);

/**
 * Constructs an error status using the current source location.
 */
#define OTPKIT_ERROR(value, message) \
    Status(value, message, __FILE__, __FUNCTION__, __LINE__)

/**
 * Checks a status code, and returns if it represents an error.
 */
#define OTPKIT_CHECK(f) \
    do { \
        Status s = (f); \
        if (!s) return s; \
    } while (false)

/**
 * Use when a new-style function calls an old-style tOTPKIT_Error function.
 */
#define OTPKIT_CHECK_OLD(f) \
    do { \
        tOTPKIT_CC cc; \
        tOTPKIT_Error error; \
        error.code = OTPKIT_CC_Ok; \
        cc = f; \
        if (OTPKIT_CC_Ok != cc) \
            return Status::fromError(error); \
    } while (false)

/**
 * Use when an old-style function calls a new-style otpkit::Status function.
 */
#define OTPKIT_CHECK_NEW(f, pError) \
    do { \
        Status s = (f); \
        if (!s) { \
            s.log(); \
            if (pError) \
                s.toError(*pError); \
            cc = s.value(); \
            goto exit; \
        } \
    } while (false)

} // namespace otpkit

#endif

/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */
#include "Status.hpp"
#include "Debug.hpp"

#include <string.h>
#include <utility>

namespace otpkit {

Status::Status() :
    value_(OTPKIT_CC_Ok),
    line_(0)
{
}

Status::Status(tOTPKIT_CC value, std::string message,
    std::string file, std::string function, size_t line) :
    value_(value),
    message_(std::move(message)),
    file_(std::move(file)),
    function_(std::move(function)),
    line_(line)
{
}

std::string
Status::where() const
{
    return file_ + ":" + std::to_string(line_) + ": " + function_;
}

const Status &
Status::log() const
{
    if (!*this)
    {
        OTPKIT_DebugLog("%s returned error %d (%s)", where().c_str(),
                        static_cast<int>(value_), message_.c_str());
    }
    return *this;
}

static void
copyString(char *out, const std::string &in)
{
    strncpy(out, in.c_str(), OTPKIT_MAX_STRING_LENGTH);
    out[OTPKIT_MAX_STRING_LENGTH] = 0;
}

void Status::toError(tOTPKIT_Error &error) const
{
    error.code = value_;
    copyString(error.szDescription, message_);
    copyString(error.szSourceFunc, function_);
    copyString(error.szSourceFile, file_);
    error.nSourceLine = line_;
}

Status Status::fromError(const tOTPKIT_Error &error)
{
    return Status(error.code, error.szDescription,
        error.szSourceFile, error.szSourceFunc, error.nSourceLine);
}

std::ostream &operator<<(std::ostream &output, const Status &s)
{
    return output << s.where() << " returned error " << s.value() <<
        " (" << s.message() << ")";
}

} // namespace otpkit

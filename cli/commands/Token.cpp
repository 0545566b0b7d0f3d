/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../../otpkit/crypto/OtpKey.hpp"
#include "../../otpkit/token/Token.hpp"
#include <errno.h>
#include <stdlib.h>
#include <time.h>
#include <iostream>

using namespace otpkit;

/**
 * Reads a decimal command-line number.
 */
static Status
numberArg(long long &result, const char *arg, const char *what)
{
    errno = 0;
    char *end = nullptr;
    long long value = strtoll(arg, &end, 10);
    if (ERANGE == errno || end == arg || *end)
        return OTPKIT_ERROR(OTPKIT_CC_ParseError,
                            std::string("Bad ") + what + " " + arg);
    result = value;
    return Status();
}

COMMAND(InitLevel::token, TokenCheck, "token-check", "",
        "validate a key URI")
{
    if (argc != 0)
        return OTPKIT_ERROR(OTPKIT_CC_Error, helpString(*this));

    std::cout << "ok" << std::endl;

    return Status();
}

COMMAND(InitLevel::token, TokenInfo, "token-info", "",
        "show the settings in a key URI")
{
    if (argc != 0)
        return OTPKIT_ERROR(OTPKIT_CC_Error, helpString(*this));

    const auto &token = *session.token;
    std::cout << "label: " << token.label() << std::endl;
    std::cout << "issuer: " << token.issuer() << std::endl;
    std::cout << "algorithm: " << token.algorithmName() << std::endl;
    std::cout << "digits: " << token.digits() << std::endl;
    std::cout << "period: " << token.period() << std::endl;

    return Status();
}

COMMAND(InitLevel::token, Totp, "totp", " [<unix-time>]",
        "print the time-based password")
{
    if (1 < argc)
        return OTPKIT_ERROR(OTPKIT_CC_Error, helpString(*this));

    long long now = time(nullptr);
    if (1 == argc)
        OTPKIT_CHECK(numberArg(now, argv[0], "time"));

    const auto &token = *session.token;
    const auto period = token.period();
    const auto remaining = period - (now - token.counter(now) * period);
    std::cout << token.generate(now) << std::endl;
    std::cout << "valid for: " << remaining << "s" << std::endl;

    return Status();
}

COMMAND(InitLevel::none, Hotp, "hotp", " <base32-key> <counter> [<digits>]",
        "print a counter-based password")
{
    if (argc < 2 || 3 < argc)
        return OTPKIT_ERROR(OTPKIT_CC_Error, helpString(*this));

    OtpKey key;
    OTPKIT_CHECK(key.decodeBase32(argv[0]));

    long long counter;
    OTPKIT_CHECK(numberArg(counter, argv[1], "counter"));
    if (counter < 0)
        return OTPKIT_ERROR(OTPKIT_CC_ParseError, "Negative counter");

    long long digits = OTPKIT_DEFAULT_DIGITS;
    if (3 == argc)
        OTPKIT_CHECK(numberArg(digits, argv[2], "digits"));
    if (digits < OTPKIT_MIN_DIGITS || OTPKIT_MAX_DIGITS < digits)
        return OTPKIT_ERROR(OTPKIT_CC_InvalidDigits, "Digits out of range");

    std::cout << key.hotp(counter, digits) << std::endl;

    return Status();
}

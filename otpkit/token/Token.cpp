/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Token.hpp"
#include "../util/Debug.hpp"
#include "../util/Uri.hpp"
#include <errno.h>
#include <stdlib.h>
#include <time.h>
#include <algorithm>

namespace otpkit {

/**
 * Parses a base-10 integer with an optional sign.
 * Rejects whitespace, trailing junk, and overflow.
 */
static bool
integerDecode(long &result, const std::string &text)
{
    if (text.empty())
        return false;
    const char first = text[0];
    if (!('0' <= first && first <= '9') && '+' != first && '-' != first)
        return false;

    errno = 0;
    char *end = nullptr;
    long value = strtol(text.c_str(), &end, 10);
    if (ERANGE == errno || end == text.c_str() ||
        end != text.c_str() + text.size())
        return false;

    result = value;
    return true;
}

/**
 * Reads an optional integer parameter, checking it against a range.
 */
static Status
rangeDecode(unsigned &result, const Uri::QueryMap &query,
            const std::string &key, long min, long max,
            tOTPKIT_CC code, const std::string &uri)
{
    auto i = query.find(key);
    if (query.end() == i)
        return Status();

    long value;
    if (!integerDecode(value, i->second))
        return OTPKIT_ERROR(code, "Invalid " + key + " \"" + i->second +
                            "\" is not an integer in " + uri);
    if (value < min || max < value)
        return OTPKIT_ERROR(code, "Invalid " + key + " " + i->second +
                            ", must be between " + std::to_string(min) +
                            " and " + std::to_string(max) + " in " + uri);

    result = value;
    return Status();
}

Status
Token::create(std::shared_ptr<Token> &result, const std::string &uri)
{
    std::shared_ptr<Token> out(new Token());
    OTPKIT_CHECK(out->init(uri));

    result = std::move(out);
    return Status();
}

Status
Token::init(const std::string &uri)
{
    Uri parsed;
    if (!parsed.decode(uri, false))
        return OTPKIT_ERROR(OTPKIT_CC_MalformedUri, "Malformed URI " + uri);

    if ("otpauth" != parsed.scheme())
        return OTPKIT_ERROR(OTPKIT_CC_InvalidScheme, "Scheme must be otpauth, "
                            "not \"" + parsed.scheme() + "\" in " + uri);

    if (!parsed.authorityOk() || "totp" != parsed.authorityRaw())
        return OTPKIT_ERROR(OTPKIT_CC_InvalidHost, "Host must be totp, "
                            "not \"" + parsed.authorityRaw() + "\" in " + uri);

    // Strip the slashes around the label:
    const auto path = parsed.path();
    const auto first = path.find_first_not_of('/');
    if (std::string::npos != first)
        label_ = path.substr(first, path.find_last_not_of('/') - first + 1);

    const auto query = parsed.queryDecode();

    // Secret:
    auto secret = query.find("secret");
    if (query.end() == secret)
        return OTPKIT_ERROR(OTPKIT_CC_MissingSecret,
                            "No secret parameter in " + uri);
    if (secret->second.empty())
        return OTPKIT_ERROR(OTPKIT_CC_InvalidSecret,
                            "Empty secret parameter in " + uri);
    std::string upper = secret->second;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](char c)
    {
        return 'a' <= c && c <= 'z' ? c - 'a' + 'A' : c;
    });
    if (!key_.decodeBase32(upper))
        return OTPKIT_ERROR(OTPKIT_CC_InvalidSecret, "Secret \"" +
                            secret->second + "\" is not unpadded base32 in " +
                            uri);
    if (key_.key().empty())
        return OTPKIT_ERROR(OTPKIT_CC_InvalidSecret,
                            "Secret \"" + secret->second +
                            "\" decodes to nothing in " + uri);

    // Issuer:
    auto issuer = query.find("issuer");
    if (query.end() != issuer)
        issuer_ = issuer->second;

    // Algorithm:
    auto algorithm = query.find("algorithm");
    if (query.end() != algorithm)
    {
        Status s = otpAlgorithmDecode(algorithm_, algorithm->second);
        if (!s)
            return OTPKIT_ERROR(s.value(), s.message() + " in " + uri);
    }

    // Numbers:
    OTPKIT_CHECK(rangeDecode(digits_, query, "digits",
                             OTPKIT_MIN_DIGITS, OTPKIT_MAX_DIGITS,
                             OTPKIT_CC_InvalidDigits, uri));
    OTPKIT_CHECK(rangeDecode(period_, query, "period",
                             OTPKIT_MIN_PERIOD, OTPKIT_MAX_PERIOD,
                             OTPKIT_CC_InvalidPeriod, uri));

    OTPKIT_DebugLevel(1, "Token \"%s\": %s, %u digits, %u seconds",
                      label_.c_str(), algorithmName(), digits_, period_);
    return Status();
}

int64_t
Token::counter(int64_t now) const
{
    return OtpKey::timeCounter(now, period_);
}

std::string
Token::generate(int64_t now) const
{
    return key_.totp(now, period_, digits_, algorithm_);
}

std::string
Token::generate() const
{
    return generate(time(nullptr));
}

bool
Token::operator==(const Token &other) const
{
    const auto a = secret();
    const auto b = other.secret();
    return
        label_ == other.label_ &&
        issuer_ == other.issuer_ &&
        algorithm_ == other.algorithm_ &&
        digits_ == other.digits_ &&
        period_ == other.period_ &&
        a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin());
}

} // namespace otpkit

/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPKIT_TOKEN_TOKEN_HPP
#define OTPKIT_TOKEN_TOKEN_HPP

#include "../crypto/OtpKey.hpp"
#include "../util/Data.hpp"
#include "../util/Status.hpp"
#include <memory>

namespace otpkit {

/**
 * A TOTP token described by an authenticator-app key URI:
 *
 *   otpauth://totp/<label>?secret=<base32>&issuer=<text>
 *     &algorithm=<SHA1|SHA256|SHA512>&digits=<6..10>&period=<1..90>
 *
 * Only `secret` is required. If a parameter appears more than once,
 * the last occurrence wins. Unknown parameters are ignored.
 *
 * Tokens never change after creation, so they can be shared between
 * threads freely.
 */
class Token
{
public:
    /**
     * Parses and validates a key URI.
     * Nothing is written to `result` unless every check passes.
     */
    static Status
    create(std::shared_ptr<Token> &result, const std::string &uri);

    /**
     * The URI path, without leading or trailing slashes.
     */
    const std::string &
    label() const { return label_; }

    /**
     * The issuer parameter, or an empty string if there is none.
     */
    const std::string &
    issuer() const { return issuer_; }

    OtpAlgorithm
    algorithm() const { return algorithm_; }

    const char *
    algorithmName() const { return otpAlgorithmName(algorithm_); }

    unsigned
    digits() const { return digits_; }

    unsigned
    period() const { return period_; }

    /**
     * The decoded shared secret.
     */
    DataSlice
    secret() const { return key_.key(); }

    /**
     * Returns the moving factor for the given Unix time.
     */
    int64_t
    counter(int64_t now) const;

    /**
     * Computes the password for the given Unix time.
     */
    std::string
    generate(int64_t now) const;

    /**
     * Computes the password for the current system time.
     */
    std::string
    generate() const;

    bool operator==(const Token &other) const;
    bool operator!=(const Token &other) const { return !(*this == other); }

private:
    std::string label_;
    std::string issuer_;
    OtpAlgorithm algorithm_ = OtpAlgorithm::sha1;
    unsigned digits_ = OTPKIT_DEFAULT_DIGITS;
    unsigned period_ = OTPKIT_DEFAULT_PERIOD;
    OtpKey key_;

    Token() {}

    Status
    init(const std::string &uri);
};

} // namespace otpkit

#endif

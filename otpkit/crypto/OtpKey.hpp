/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPKIT_CRYPTO_OTPKEY_HPP
#define OTPKIT_CRYPTO_OTPKEY_HPP

#include "OtpAlgorithm.hpp"
#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace otpkit {

/**
 * Implements the HOTP algorithm defined by rfc4226,
 * and the TOTP algorithm defined by rfc6238.
 */
class OtpKey
{
public:
    OtpKey() {}
    OtpKey(DataSlice key): key_(key.begin(), key.end()) {}

    /**
     * Initializes the key with an unpadded base32-encoded string.
     */
    Status
    decodeBase32(const std::string &key);

    /**
     * Produces a counter-based password.
     */
    std::string
    hotp(uint64_t counter, unsigned digits=6,
         OtpAlgorithm algorithm=OtpAlgorithm::sha1) const;

    /**
     * Produces a time-based password.
     * @param now Unix time, in seconds.
     */
    std::string
    totp(int64_t now, unsigned timeStep=30, unsigned digits=6,
         OtpAlgorithm algorithm=OtpAlgorithm::sha1) const;

    /**
     * Converts a Unix time into a TOTP moving factor.
     * Rounds towards negative infinity, so times before 1970
     * produce negative counters rather than sharing counter 0.
     */
    static int64_t
    timeCounter(int64_t now, unsigned timeStep);

    /**
     * Encodes the key as an unpadded base32 string.
     */
    std::string
    encodeBase32() const;

    /**
     * Obtains access to the underlying binary key.
     */
    DataSlice
    key() const { return key_; }

private:
    DataChunk key_;
};

} // namespace otpkit

#endif

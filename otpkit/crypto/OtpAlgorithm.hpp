/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPKIT_CRYPTO_OTP_ALGORITHM_HPP
#define OTPKIT_CRYPTO_OTP_ALGORITHM_HPP

#include "../util/Status.hpp"

namespace otpkit {

/**
 * The HMAC hash functions allowed in a key URI.
 */
enum class OtpAlgorithm
{
    sha1,
    sha256,
    sha512
};

/**
 * Returns the key URI spelling, such as "SHA256".
 */
const char *
otpAlgorithmName(OtpAlgorithm algorithm);

/**
 * Returns the HMAC output size in bytes.
 */
size_t
otpAlgorithmSize(OtpAlgorithm algorithm);

/**
 * Looks up an algorithm by its exact, case-sensitive key URI name.
 */
Status
otpAlgorithmDecode(OtpAlgorithm &result, const std::string &name);

} // namespace otpkit

#endif

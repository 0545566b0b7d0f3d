/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "OtpKey.hpp"
#include "Encoding.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <sstream>
#include <stdexcept>

namespace otpkit {

static const EVP_MD *
otpAlgorithmDigest(OtpAlgorithm algorithm)
{
    switch (algorithm)
    {
    case OtpAlgorithm::sha1:
        return EVP_sha1();
    case OtpAlgorithm::sha256:
        return EVP_sha256();
    case OtpAlgorithm::sha512:
        return EVP_sha512();
    }
    return EVP_sha1();
}

Status
OtpKey::decodeBase32(const std::string &key)
{
    OTPKIT_CHECK(base32Decode(key_, key, false));
    return Status();
}

std::string
OtpKey::hotp(uint64_t counter, unsigned digits, OtpAlgorithm algorithm) const
{
    static const uint32_t powers[] =
    {
        1, 10, 100, 1000, 10000, 100000, 1000000,
        10000000, 100000000, 1000000000
    };

    // Do HMAC(key_, counter):
    DataArray<EVP_MAX_MD_SIZE> hmac;
    unsigned size = 0;
    DataArray<8> cb =
    {{
        static_cast<uint8_t>(counter >> 56),
        static_cast<uint8_t>(counter >> 48),
        static_cast<uint8_t>(counter >> 40),
        static_cast<uint8_t>(counter >> 32),
        static_cast<uint8_t>(counter >> 24),
        static_cast<uint8_t>(counter >> 16),
        static_cast<uint8_t>(counter >> 8),
        static_cast<uint8_t>(counter)
    }};
    static const uint8_t emptyKey[1] = {0};
    const uint8_t *keyData = key_.empty() ? emptyKey : key_.data();
    if (!HMAC(otpAlgorithmDigest(algorithm), keyData, key_.size(),
              cb.data(), cb.size(), hmac.data(), &size) ||
        size != otpAlgorithmSize(algorithm))
        throw std::runtime_error("HMAC computation failed");

    // Calculate the truncated output:
    unsigned offset = hmac[size - 1] & 0xf;
    uint32_t p = (static_cast<uint32_t>(hmac[offset]) << 24) |
        (static_cast<uint32_t>(hmac[offset + 1]) << 16) |
        (static_cast<uint32_t>(hmac[offset + 2]) << 8) | hmac[offset + 3];
    p &= 0x7fffffff;

    // The masked value has at most 10 decimal digits:
    if (digits < sizeof(powers) / sizeof(powers[0]))
        p %= powers[digits];

    // Format as a fixed-width decimal number:
    std::stringstream ss;
    ss.width(digits);
    ss.fill('0');
    ss << p;
    return ss.str();
}

std::string
OtpKey::totp(int64_t now, unsigned timeStep, unsigned digits,
             OtpAlgorithm algorithm) const
{
    return hotp(timeCounter(now, timeStep), digits, algorithm);
}

int64_t
OtpKey::timeCounter(int64_t now, unsigned timeStep)
{
    const int64_t step = timeStep;
    int64_t counter = now / step;
    if (now % step && now < 0)
        --counter;
    return counter;
}

std::string
OtpKey::encodeBase32() const
{
    return base32Encode(key_, false);
}

} // namespace otpkit

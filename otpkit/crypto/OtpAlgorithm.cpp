/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "OtpAlgorithm.hpp"

namespace otpkit {

const char *
otpAlgorithmName(OtpAlgorithm algorithm)
{
    switch (algorithm)
    {
    case OtpAlgorithm::sha1:
        return "SHA1";
    case OtpAlgorithm::sha256:
        return "SHA256";
    case OtpAlgorithm::sha512:
        return "SHA512";
    }
    return "";
}

size_t
otpAlgorithmSize(OtpAlgorithm algorithm)
{
    switch (algorithm)
    {
    case OtpAlgorithm::sha1:
        return 20;
    case OtpAlgorithm::sha256:
        return 32;
    case OtpAlgorithm::sha512:
        return 64;
    }
    return 0;
}

Status
otpAlgorithmDecode(OtpAlgorithm &result, const std::string &name)
{
    for (auto algorithm: {OtpAlgorithm::sha1,
                          OtpAlgorithm::sha256,
                          OtpAlgorithm::sha512})
    {
        if (name == otpAlgorithmName(algorithm))
        {
            result = algorithm;
            return Status();
        }
    }

    return OTPKIT_ERROR(OTPKIT_CC_InvalidAlgorithm,
                        "Unknown algorithm \"" + name +
                        "\", expected SHA1, SHA256, or SHA512");
}

} // namespace otpkit

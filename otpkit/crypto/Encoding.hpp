/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPKIT_CRYPTO_ENCODING_HPP
#define OTPKIT_CRYPTO_ENCODING_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace otpkit {

/**
 * Encodes data into a lowercase hex string.
 */
std::string
base16Encode(DataSlice data);

/**
 * Decodes a hex string, accepting either case.
 */
Status
base16Decode(DataChunk &result, const std::string &in);

/**
 * Encodes data into a base-32 string according to rfc4648.
 * @param padding false to leave off the trailing '=' characters.
 */
std::string
base32Encode(DataSlice data, bool padding=true);

/**
 * Decodes a base-32 string as defined by rfc4648.
 * Only the uppercase alphabet is accepted.
 * @param padding true if the input must be padded to a multiple of
 * 8 characters, false if the input must not contain any padding.
 */
Status
base32Decode(DataChunk &result, const std::string &in, bool padding=true);

} // namespace otpkit

#endif

/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Encoding.hpp"
#include <algorithm>

namespace otpkit {

static int
base16Value(char c)
{
    if ('0' <= c && c <= '9')
        return c - '0';
    if ('a' <= c && c <= 'f')
        return 10 + c - 'a';
    if ('A' <= c && c <= 'F')
        return 10 + c - 'A';
    return -1;
}

std::string
base16Encode(DataSlice data)
{
    const char base16Sym[] = "0123456789abcdef";
    std::string out;
    out.reserve(2 * data.size());

    for (auto c: data)
    {
        out += base16Sym[c >> 4];
        out += base16Sym[c & 0xf];
    }
    return out;
}

Status
base16Decode(DataChunk &result, const std::string &in)
{
    // The string must be a multiple of 2 characters long:
    if (in.size() % 2)
        return OTPKIT_ERROR(OTPKIT_CC_ParseError, "Bad hex string length");

    DataChunk out;
    out.reserve(in.size() / 2);

    for (size_t i = 0; i < in.size(); i += 2)
    {
        int high = base16Value(in[i]);
        int low = base16Value(in[i + 1]);
        if (high < 0 || low < 0)
            return OTPKIT_ERROR(OTPKIT_CC_ParseError, "Bad hex character");
        out.push_back(high << 4 | low);
    }

    result = std::move(out);
    return Status();
}

std::string
base32Encode(DataSlice data, bool padding)
{
    const char base32Sym[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
    std::string out;
    auto chunks = (data.size() + 4) / 5; // Rounding up
    out.reserve(8 * chunks);

    auto i = data.begin();
    uint16_t buffer = 0; // Bits waiting to be written out, MSB first
    int bits = 0; // Number of bits currently in the buffer
    while (i != data.end() || 0 < bits)
    {
        // Reload the buffer if we need more bits:
        if (i != data.end() && bits < 5)
        {
            buffer |= *i++ << (8 - bits);
            bits += 8;
        }

        // Write out 5 most-significant bits in the buffer:
        out += base32Sym[buffer >> 11];
        buffer <<= 5;
        bits -= 5;
    }

    // Pad the final string to a multiple of 8 characters long:
    if (padding)
        out.append(-out.size() % 8, '=');
    return out;
}

Status
base32Decode(DataChunk &result, const std::string &in, bool padding)
{
    // The string must be a multiple of 8 characters long:
    if (padding && in.size() % 8)
        return OTPKIT_ERROR(OTPKIT_CC_ParseError, "Bad base32 string length");

    DataChunk out;
    out.reserve(5 * (in.size() / 8) + 5);

    auto i = in.begin();
    uint16_t buffer = 0; // Bits waiting to be written out, MSB first
    int bits = 0; // Number of bits currently in the buffer
    while (i != in.end())
    {
        // Read one character from the string:
        int value = 0;
        if ('A' <= *i && *i <= 'Z')
            value = *i++ - 'A';
        else if ('2' <= *i && *i <= '7')
            value = 26 + *i++ - '2';
        else
            break;

        // Append the bits to the buffer:
        buffer |= value << (11 - bits);
        bits += 5;

        // Write out some bits if the buffer has a byte's worth:
        if (8 <= bits)
        {
            out.push_back(buffer >> 8);
            buffer <<= 8;
            bits -= 8;
        }
    }

    // A final group of 1, 3, or 6 characters cannot come from whole bytes:
    auto symbols = (i - in.begin()) % 8;
    if (1 == symbols || 3 == symbols || 6 == symbols)
        return OTPKIT_ERROR(OTPKIT_CC_ParseError, "Bad base32 final group");

    if (padding)
    {
        // Any extra characters must be '=':
        if (!std::all_of(i, in.end(), [](char c){ return '=' == c; }))
            return OTPKIT_ERROR(OTPKIT_CC_ParseError, "Bad base32 character");

        // There cannot be extra padding:
        if (8 <= in.end() - i)
            return OTPKIT_ERROR(OTPKIT_CC_ParseError, "Bad base32 padding");
    }
    else if (in.end() != i)
    {
        return OTPKIT_ERROR(OTPKIT_CC_ParseError, "Bad base32 character");
    }

    // Nonzero leftover bits are tolerated, as rfc4648 section 3.5 permits.

    result = std::move(out);
    return Status();
}

} // namespace otpkit

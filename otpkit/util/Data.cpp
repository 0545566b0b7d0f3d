/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Data.hpp"

namespace otpkit {

std::string
toString(DataSlice slice)
{
    if (slice.empty())
        return std::string();
    return std::string(reinterpret_cast<const char *>(slice.data()),
                       slice.size());
}

DataChunk
buildData(std::initializer_list<DataSlice> slices)
{
    size_t size = 0;
    for (auto slice: slices)
        size += slice.size();

    DataChunk out;
    out.reserve(size);
    for (auto slice: slices)
        out.insert(out.end(), slice.begin(), slice.end());
    return out;
}

} // namespace otpkit

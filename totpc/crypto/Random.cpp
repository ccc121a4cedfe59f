/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Random.hpp"
#include <openssl/rand.h>

namespace totpc {

Status
randomData(DataChunk &result, size_t size)
{
    DataChunk out;
    out.resize(size);

    if (1 != RAND_bytes(out.data(), out.size()))
        return TOTPC_ERROR(TOTPC_CC_SysError, "Random data generation failed");

    result = std::move(out);
    return Status();
}

} // namespace totpc

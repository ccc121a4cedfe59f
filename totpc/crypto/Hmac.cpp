/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Hmac.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace totpc {

Status
hmacSha1(DataArray<sha1DigestSize> &result, DataSlice key, DataSlice message)
{
    DataArray<sha1DigestSize> out;
    unsigned size = 0;
    if (!HMAC(EVP_sha1(), key.data(), key.size(),
        message.data(), message.size(), out.data(), &size))
        return TOTPC_ERROR(TOTPC_CC_DigestError, "HMAC-SHA1 failed");
    if (out.size() != size)
        return TOTPC_ERROR(TOTPC_CC_DigestError, "Wrong HMAC-SHA1 size");

    result = out;
    return Status();
}

} // namespace totpc

/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TOTPC_CRYPTO_HMAC_HPP
#define TOTPC_CRYPTO_HMAC_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace totpc {

constexpr size_t sha1DigestSize = 20;

/**
 * Computes HMAC-SHA1(key, message) as defined by rfc2104.
 */
Status
hmacSha1(DataArray<sha1DigestSize> &result, DataSlice key, DataSlice message);

} // namespace totpc

#endif

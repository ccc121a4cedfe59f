/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TOTPC_CRYPTO_RANDOM_HPP
#define TOTPC_CRYPTO_RANDOM_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace totpc {

/**
 * Fills a buffer with cryptographically-secure random data.
 */
Status
randomData(DataChunk &result, size_t size);

} // namespace totpc

#endif

/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Helpers for checking user-supplied values.
 */

#ifndef TOTPC_UTIL_UTIL_HPP
#define TOTPC_UTIL_UTIL_HPP

#include "Status.hpp"
#include <stdint.h>

namespace totpc {

/**
 * Parses a decimal number no larger than max.
 * The whole string must be digits.
 */
Status
parseUnsigned(uint64_t &result, const std::string &text, uint64_t max);

/**
 * Fails unless min <= value <= max.
 * @param name The setting name, for the error message.
 */
Status
checkRange(const std::string &name, long long value,
    long long min, long long max);

} // namespace totpc

#endif

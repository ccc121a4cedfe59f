/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TOTPC_UTIL_DEBUG_HPP
#define TOTPC_UTIL_DEBUG_HPP

#include "Status.hpp"

#define DEBUG_LEVEL 1

#define TOTPC_DebugLevel(level, ...)    \
{                                       \
    if (DEBUG_LEVEL >= level)           \
    {                                   \
        TOTPC_DebugLog(__VA_ARGS__);    \
    }                                   \
}

namespace totpc {

/**
 * Sets up the log sink.
 * @param path File to append log lines to, or empty for no file.
 * @param verbose True to echo log lines to stdout.
 */
Status
debugInitialize(const std::string &path, bool verbose);

void
debugTerminate();

void TOTPC_DebugLog(const char *format, ...);

} // namespace totpc

#endif

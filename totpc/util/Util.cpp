/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Util.hpp"
#include <ctype.h>
#include <errno.h>
#include <stdlib.h>

namespace totpc {

Status
parseUnsigned(uint64_t &result, const std::string &text, uint64_t max)
{
    // strtoull accepts signs and leading spaces, so check first:
    if (text.empty() || !isdigit(static_cast<uint8_t>(text[0])))
        return TOTPC_ERROR(TOTPC_CC_Error, "Not a number: " + text);

    errno = 0;
    char *end = nullptr;
    unsigned long long value = strtoull(text.c_str(), &end, 10);
    if (*end)
        return TOTPC_ERROR(TOTPC_CC_Error, "Not a number: " + text);
    if (ERANGE == errno || max < value)
        return TOTPC_ERROR(TOTPC_CC_Error, "Number too large: " + text);

    result = value;
    return Status();
}

Status
checkRange(const std::string &name, long long value,
    long long min, long long max)
{
    if (value < min || max < value)
        return TOTPC_ERROR(TOTPC_CC_Error, name + " must be between " +
            std::to_string(min) + " and " + std::to_string(max));
    return Status();
}

} // namespace totpc

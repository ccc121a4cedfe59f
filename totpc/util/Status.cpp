/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */
#include "Status.hpp"
#include "Debug.hpp"
#include <sstream>

namespace totpc {

Status::Status() :
    value_(TOTPC_CC_Ok),
    file_(""),
    function_(""),
    line_(0)
{
}

Status::Status(tTOTPC_CC value, std::string message,
    const char *file, const char *function, size_t line) :
    value_(value),
    message_(message),
    file_(file),
    function_(function),
    line_(line)
{
}

const Status &
Status::log() const
{
    if (!*this)
    {
        std::stringstream ss;
        ss << *this;
        TOTPC_DebugLog("%s", ss.str().c_str());
    }
    return *this;
}

std::ostream &operator<<(std::ostream &output, const Status &s)
{
    output <<
        s.file() << ":" << s.line() << ": " << s.function() <<
        " returned error " << s.value() << " (" << s.message() << ")";
    return output;
}

} // namespace totpc

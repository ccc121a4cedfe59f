/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */
#ifndef TOTPC_UTIL_STATUS_HPP
#define TOTPC_UTIL_STATUS_HPP

#include <stddef.h>
#include <ostream>
#include <string>

namespace totpc {

/**
 * Result codes reported through Status.
 */
typedef enum eTOTPC_CC
{
    /** The function completed without an error */
    TOTPC_CC_Ok = 0,
    /** An error occured */
    TOTPC_CC_Error = 1,
    /** Base32 text ended without covering all of its bits */
    TOTPC_CC_MalformedInput = 2,
    /** The shared secret could not be decoded, or was empty */
    TOTPC_CC_InvalidSecret = 3,
    /** The HMAC primitive failed */
    TOTPC_CC_DigestError = 4,
    /** The credential store has no entry for the account */
    TOTPC_CC_NotFound = 5,
    /** JSON parsing or formatting error */
    TOTPC_CC_JSONError = 6,
    /** An operating-system or library call failed */
    TOTPC_CC_SysError = 7
} tTOTPC_CC;

/**
 * Describes the results of calling a core function,
 * which can be either success or failure.
 */
class Status
{
public:
    /**
     * Constructs a success status.
     */
    Status();

    /**
     * Constructs an error status.
     */
    Status(tTOTPC_CC value, std::string message,
        const char *file, const char *function, size_t line);

    // Read accessors:
    tTOTPC_CC value()           const { return value_; }
    std::string message()       const { return message_; }
    std::string file()          const { return file_; }
    std::string function()      const { return function_; }
    size_t line()               const { return line_; }

    /**
     * Returns true if the status code represents success.
     */
    explicit operator bool() const { return value_ == TOTPC_CC_Ok; }

    /**
     * Writes the status to the debug log if it represents an error.
     */
    const Status &log() const;

private:
    // Error information:
    tTOTPC_CC value_;
    std::string message_;

    // Error location:
    const char *file_;
    const char *function_;
    size_t line_;
};

std::ostream &operator<<(std::ostream &output, const Status &s);

/**
 * Constructs an error status using the current source location.
 */
#define TOTPC_ERROR(value, message) \
    Status(value, message, __FILE__, __FUNCTION__, __LINE__)

/**
 * Checks a status code, and returns if it represents an error.
 */
#define TOTPC_CHECK(f) \
    do { \
        Status s = (f); \
        if (!s) return s; \
    } while (false)

} // namespace totpc

#endif

/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Time-based one-time passwords (rfc6238) from base32 shared secrets.
 */

#ifndef TOTPC_TOTP_HPP
#define TOTPC_TOTP_HPP

#include "util/Status.hpp"
#include <stdint.h>

namespace totpc {

class SecretLookup;

/**
 * Computes the code for a base32 secret at a given unix time.
 * The secret is case-insensitive and may contain whitespace.
 * Fails with TOTPC_CC_InvalidSecret if the secret is unusable.
 */
Status
totpGenerate(std::string &result, const std::string &secret,
    uint64_t unixTime, unsigned timeStep=30, unsigned digits=6);

/**
 * Computes the current code for an account in the credential store.
 */
Status
totpFor(std::string &result, const SecretLookup &store,
    const std::string &account, unsigned timeStep=30, unsigned digits=6);

/**
 * Returns the number of seconds before the code for unixTime expires.
 */
uint64_t
totpSecondsRemaining(uint64_t unixTime, unsigned timeStep=30);

/**
 * Returns the current unix time.
 */
uint64_t
totpNow();

} // namespace totpc

#endif

/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Totp.hpp"
#include "crypto/OtpKey.hpp"
#include "store/SecretStore.hpp"
#include "util/Debug.hpp"
#include <time.h>

namespace totpc {

Status
totpGenerate(std::string &result, const std::string &secret,
    uint64_t unixTime, unsigned timeStep, unsigned digits)
{
    OtpKey key;
    TOTPC_CHECK(key.decodeBase32(secret));
    TOTPC_CHECK(key.totp(result, unixTime, timeStep, digits));
    return Status();
}

Status
totpFor(std::string &result, const SecretLookup &store,
    const std::string &account, unsigned timeStep, unsigned digits)
{
    std::string secret;
    TOTPC_CHECK(store.lookup(secret, account));

    TOTPC_DebugLevel(1, "Generating code for %s", account.c_str());
    TOTPC_CHECK(totpGenerate(result, secret, totpNow(), timeStep, digits));
    return Status();
}

uint64_t
totpSecondsRemaining(uint64_t unixTime, unsigned timeStep)
{
    if (!timeStep)
        return 0;
    return timeStep - unixTime % timeStep;
}

uint64_t
totpNow()
{
    return static_cast<uint64_t>(time(nullptr));
}

} // namespace totpc

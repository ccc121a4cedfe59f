/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../../totpc/Totp.hpp"
#include "../../totpc/crypto/OtpKey.hpp"
#include "../../totpc/store/SecretStore.hpp"
#include "../../totpc/util/Util.hpp"
#include <iostream>

using namespace totpc;

COMMAND(InitLevel::store, Code, "code",
        " <account>")
{
    if (argc != 1)
        return TOTPC_ERROR(TOTPC_CC_Error, helpString(*this));
    const auto account = argv[0];

    std::string code;
    TOTPC_CHECK(totpFor(code, *session.store, account,
                        session.timeStep, session.digits));
    std::cout << code << std::endl;

    return Status();
}

COMMAND(InitLevel::none, CodeSecret, "code-secret",
        " <base32-secret> [unix-time]")
{
    if (argc < 1 || 2 < argc)
        return TOTPC_ERROR(TOTPC_CC_Error, helpString(*this));
    const auto secret = argv[0];
    uint64_t now = totpNow();
    if (argc == 2)
        TOTPC_CHECK(parseUnsigned(now, argv[1], UINT64_MAX));

    std::string code;
    TOTPC_CHECK(totpGenerate(code, secret, now,
                             session.timeStep, session.digits));
    std::cout << code << std::endl;

    return Status();
}

COMMAND(InitLevel::none, Remaining, "remaining",
        " [unix-time]")
{
    if (1 < argc)
        return TOTPC_ERROR(TOTPC_CC_Error, helpString(*this));
    uint64_t now = totpNow();
    if (argc == 1)
        TOTPC_CHECK(parseUnsigned(now, argv[0], UINT64_MAX));

    std::cout << totpSecondsRemaining(now, session.timeStep) << std::endl;

    return Status();
}

COMMAND(InitLevel::store, List, "list",
        "")
{
    if (argc != 0)
        return TOTPC_ERROR(TOTPC_CC_Error, helpString(*this));

    for (auto &i: session.store->accounts())
        std::cout << i << std::endl;

    return Status();
}

COMMAND(InitLevel::none, KeyCreate, "key-create",
        " [bytes]")
{
    if (1 < argc)
        return TOTPC_ERROR(TOTPC_CC_Error, helpString(*this));
    uint64_t size = 10;
    if (argc == 1)
        TOTPC_CHECK(parseUnsigned(size, argv[0], otpMaxKeySize));

    OtpKey key;
    TOTPC_CHECK(key.create(size));
    std::cout << key.encodeBase32() << std::endl;

    return Status();
}

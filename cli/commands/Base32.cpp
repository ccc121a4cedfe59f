/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../../totpc/crypto/Encoding.hpp"
#include <string.h>
#include <iostream>

using namespace totpc;

COMMAND(InitLevel::none, Base32Encode, "base32-encode",
        " <text> [--wrap]")
{
    bool wrap = argc == 2 && !strcmp(argv[1], "--wrap");
    if (argc != 1 && !wrap)
        return TOTPC_ERROR(TOTPC_CC_Error, helpString(*this));
    const std::string text = argv[0];

    std::cout << base32Encode(text, wrap);
    if (!wrap)
        std::cout << std::endl;

    return Status();
}

COMMAND(InitLevel::none, Base32Decode, "base32-decode",
        " <base32>")
{
    if (argc != 1)
        return TOTPC_ERROR(TOTPC_CC_Error, helpString(*this));

    DataChunk data;
    TOTPC_CHECK(base32Decode(data, argv[0]));
    std::cout << toString(data);

    return Status();
}

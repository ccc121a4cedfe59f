/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Encoding.hpp"
#include <algorithm>

namespace totpc {

const Base32Alphabet base32Standard("ABCDEFGHIJKLMNOPQRSTUVWXYZ234567");
const Base32Alphabet base32Hex("0123456789ABCDEFGHIJKLMNOPQRSTUV");

Base32Alphabet::Base32Alphabet(const char *symbols)
{
    values_.fill(-1);
    for (unsigned i = 0; i < symbols_.size(); ++i)
    {
        symbols_[i] = symbols[i];
        values_[static_cast<uint8_t>(symbols[i])] = i;
    }
}

std::string
base32Encode(DataSlice data, bool wrapLines, const Base32Alphabet &alphabet)
{
    std::string out;
    auto chunks = (data.size() + 4) / 5; // Rounding up
    out.reserve(8 * chunks + (wrapLines ? chunks / 9 + 1 : 0));

    size_t line = 0; // Characters on the current output line
    auto i = data.begin();
    while (i != data.end())
    {
        // Load up to 5 bytes into a 40-bit window, MSB first,
        // leaving zeros where the input runs out:
        size_t bytes = std::min<size_t>(5, data.end() - i);
        uint64_t window = 0;
        for (size_t n = 0; n < 5; ++n)
        {
            window <<= 8;
            if (n < bytes)
                window |= *i++;
        }

        // Write out the symbols that cover real input bits,
        // then pad the group to 8 characters:
        size_t symbols = (8 * bytes + 4) / 5; // Rounding up
        for (size_t n = 0; n < 8; ++n)
        {
            if (n < symbols)
                out += alphabet.symbol(window >> (35 - 5 * n));
            else
                out += '=';
        }

        if (wrapLines)
        {
            line += 8;
            if (base32LineWidth <= line)
            {
                out += '\n';
                line = 0;
            }
        }
    }

    // Terminate the last partial line:
    if (wrapLines && line)
        out += '\n';
    return out;
}

Status
base32Decode(DataChunk &result, const std::string &in,
    const Base32Alphabet &alphabet)
{
    DataChunk out;
    out.reserve(5 * (in.size() / 8));

    uint64_t window = 0; // Bits waiting to be written out, MSB first
    unsigned symbols = 0; // Number of symbols currently in the window
    bool padded = false;
    for (char c: in)
    {
        if ('=' == c)
        {
            padded = true;
            break;
        }

        // Skip whitespace and anything else outside the alphabet:
        int value = alphabet.value(c);
        if (value < 0)
            continue;

        window = window << 5 | value;
        if (8 == ++symbols)
        {
            for (int shift = 32; 0 <= shift; shift -= 8)
                out.push_back(static_cast<uint8_t>(window >> shift));
            window = 0;
            symbols = 0;
        }
    }

    if (symbols)
    {
        if (!padded)
            return TOTPC_ERROR(TOTPC_CC_MalformedInput,
                std::to_string(40 - 5 * symbols) + " bits missing");

        // Treat the missing symbols as zero,
        // and keep only the bytes the real symbols reach:
        window <<= 5 * (8 - symbols);
        unsigned bytes = 1;
        if (4 <= symbols)
            bytes = 2;
        if (5 <= symbols)
            bytes = 3;
        if (7 <= symbols)
            bytes = 4;
        for (unsigned n = 0; n < bytes; ++n)
            out.push_back(static_cast<uint8_t>(window >> (32 - 8 * n)));
    }

    result = std::move(out);
    return Status();
}

} // namespace totpc

/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TOTPC_CRYPTO_ENCODING_HPP
#define TOTPC_CRYPTO_ENCODING_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace totpc {

/**
 * A set of 32 symbols, each standing for one 5-bit value.
 */
class Base32Alphabet
{
public:
    /**
     * @param symbols The 32 distinct symbols, in value order.
     */
    explicit Base32Alphabet(const char *symbols);

    char symbol(unsigned value) const { return symbols_[value & 0x1f]; }

    /**
     * Maps a character back to its 5-bit value,
     * or returns -1 if the character is not part of the alphabet.
     */
    int value(char c) const { return values_[static_cast<uint8_t>(c)]; }

private:
    std::array<char, 32> symbols_;
    std::array<int8_t, 256> values_;
};

/**
 * The rfc4648 base32 alphabet, A-Z2-7.
 */
extern const Base32Alphabet base32Standard;

/**
 * The rfc4648 "extended hex" alphabet, 0-9A-V.
 */
extern const Base32Alphabet base32Hex;

/**
 * Characters per line when wrapping base32 output.
 */
constexpr size_t base32LineWidth = 72;

/**
 * Encodes data into a base-32 string according to rfc4648.
 * @param wrapLines Break the output into newline-terminated lines
 * of base32LineWidth characters.
 */
std::string
base32Encode(DataSlice data, bool wrapLines=false,
    const Base32Alphabet &alphabet=base32Standard);

/**
 * Decodes a base-32 string as defined by rfc4648.
 * Characters outside the alphabet are skipped, so wrapped or
 * hand-typed text decodes the same as the compact form.
 * Decoding stops at the first '=' character.
 * Fails with TOTPC_CC_MalformedInput if the text ends in the middle
 * of a group without padding. The result is only touched on success.
 */
Status
base32Decode(DataChunk &result, const std::string &in,
    const Base32Alphabet &alphabet=base32Standard);

} // namespace totpc

#endif

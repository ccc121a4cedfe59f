/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "OtpKey.hpp"
#include "Encoding.hpp"
#include "Hmac.hpp"
#include "Random.hpp"
#include <ctype.h>
#include <algorithm>
#include <sstream>

namespace totpc {

Status
OtpKey::create(size_t keySize)
{
    if (!keySize)
        return TOTPC_ERROR(TOTPC_CC_Error, "OTP keys cannot be empty");
    if (otpMaxKeySize < keySize)
        return TOTPC_ERROR(TOTPC_CC_Error, "OTP keys cannot exceed " +
            std::to_string(otpMaxKeySize) + " bytes");

    TOTPC_CHECK(randomData(key_, keySize));
    return Status();
}

Status
OtpKey::decodeBase32(const std::string &key)
{
    std::string upper(key);
    std::transform(upper.begin(), upper.end(), upper.begin(),
        [](char c){ return static_cast<char>(toupper(static_cast<uint8_t>(c))); });

    DataChunk out;
    Status s = base32Decode(out, upper);
    if (!s)
        return TOTPC_ERROR(TOTPC_CC_InvalidSecret,
            "Bad base32 OTP key: " + s.message());
    if (out.empty())
        return TOTPC_ERROR(TOTPC_CC_InvalidSecret, "Empty OTP key");

    key_ = std::move(out);
    return Status();
}

std::string
OtpKey::encodeBase32() const
{
    return base32Encode(key_);
}

Status
OtpKey::hotp(std::string &result, uint64_t counter, unsigned digits) const
{
    if (key_.empty())
        return TOTPC_ERROR(TOTPC_CC_InvalidSecret, "Empty OTP key");
    if (!digits || otpMaxDigits < digits)
        return TOTPC_ERROR(TOTPC_CC_Error,
            "Bad OTP length " + std::to_string(digits));

    // Do HMAC_SHA1(key_, counter):
    DataArray<sha1DigestSize> hmac;
    DataArray<8> cb =
    {{
        static_cast<uint8_t>(counter >> 56),
        static_cast<uint8_t>(counter >> 48),
        static_cast<uint8_t>(counter >> 40),
        static_cast<uint8_t>(counter >> 32),
        static_cast<uint8_t>(counter >> 24),
        static_cast<uint8_t>(counter >> 16),
        static_cast<uint8_t>(counter >> 8),
        static_cast<uint8_t>(counter)
    }};
    TOTPC_CHECK(hmacSha1(hmac, key_, cb));

    // Calculate the truncated output:
    unsigned offset = hmac[19] & 0xf;
    uint32_t p =
        static_cast<uint32_t>(hmac[offset]) << 24 |
        static_cast<uint32_t>(hmac[offset + 1]) << 16 |
        static_cast<uint32_t>(hmac[offset + 2]) << 8 |
        static_cast<uint32_t>(hmac[offset + 3]);
    p &= 0x7fffffff;

    uint64_t modulus = 1;
    for (unsigned i = 0; i < digits; ++i)
        modulus *= 10;

    // Format as a fixed-width decimal number:
    std::stringstream ss;
    ss.width(digits);
    ss.fill('0');
    ss << p % modulus;
    result = ss.str();
    return Status();
}

Status
OtpKey::totp(std::string &result, uint64_t unixTime,
    unsigned timeStep, unsigned digits) const
{
    if (!timeStep)
        return TOTPC_ERROR(TOTPC_CC_Error, "OTP time step cannot be zero");

    return hotp(result, unixTime / timeStep, digits);
}

} // namespace totpc

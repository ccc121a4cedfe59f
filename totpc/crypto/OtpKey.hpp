/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TOTPC_CRYPTO_OTPKEY_HPP
#define TOTPC_CRYPTO_OTPKEY_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace totpc {

/**
 * The largest code length the truncated HMAC can fill.
 */
constexpr unsigned otpMaxDigits = 10;

/**
 * The largest key `OtpKey::create` will generate, in bytes.
 */
constexpr size_t otpMaxKeySize = 1024;

/**
 * Implements the TOTP algorithm defined by rfc6238.
 */
class OtpKey
{
public:
    OtpKey() {}
    OtpKey(DataSlice key): key_(key.begin(), key.end()) {}

    /**
     * Initializes the key with random data.
     */
    Status
    create(size_t keySize=10);

    /**
     * Initializes the key with a base32-encoded string.
     * Lowercase letters are accepted.
     * Fails with TOTPC_CC_InvalidSecret if the text does not decode
     * to at least one byte.
     */
    Status
    decodeBase32(const std::string &key);

    /**
     * Produces a counter-based password, as defined by rfc4226.
     */
    Status
    hotp(std::string &result, uint64_t counter, unsigned digits=6) const;

    /**
     * Produces the time-based password for the step containing unixTime.
     */
    Status
    totp(std::string &result, uint64_t unixTime,
        unsigned timeStep=30, unsigned digits=6) const;

    /**
     * Encodes the key as a base32 string.
     */
    std::string
    encodeBase32() const;

    /**
     * Obtains access to the underlying binary key.
     */
    DataSlice
    key() const { return key_; }

private:
    DataChunk key_;
};

} // namespace totpc

#endif

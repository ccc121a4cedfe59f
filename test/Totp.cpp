/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../totpc/Totp.hpp"
#include "../totpc/store/SecretStore.hpp"
#include <catch2/catch.hpp>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <ctype.h>
#include <stdio.h>

/**
 * Straight transcription of the rfc6238 reference algorithm,
 * used as an oracle for the library code.
 */
static std::string
referenceTotp(const std::string &key, uint64_t time, int step, int digits)
{
    uint64_t t = time / step;
    unsigned char msg[8];
    for (int i = 7; 0 <= i; --i)
    {
        msg[i] = t & 0xff;
        t >>= 8;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned size = 0;
    HMAC(EVP_sha1(), key.data(), key.size(), msg, sizeof(msg), hash, &size);

    int offset = hash[size - 1] & 0xf;
    long binary =
        ((hash[offset] & 0x7f) << 24) |
        ((hash[offset + 1] & 0xff) << 16) |
        ((hash[offset + 2] & 0xff) << 8) |
        (hash[offset + 3] & 0xff);

    long power = 1;
    for (int i = 0; i < digits; ++i)
        power *= 10;

    char out[16];
    snprintf(out, sizeof(out), "%0*ld", digits, binary % power);
    return out;
}

static const char rfcSecret[] = "12345678901234567890";
static const char rfcSecretBase32[] = "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ";

TEST_CASE("TOTP matches the reference algorithm", "[otp][totp]")
{
    const uint64_t times[] =
    {
        0, 29, 30, 59, 1111111109, 1111111111, 1234567890, 2000000000,
        20000000000
    };
    for (auto time: times)
    {
        for (unsigned digits: {6u, 8u})
        {
            std::string code;
            REQUIRE(totpc::totpGenerate(code, rfcSecretBase32, time, 30, digits));
            REQUIRE(code == referenceTotp(rfcSecret, time, 30, digits));
        }
    }

    std::string code;
    REQUIRE(totpc::totpGenerate(code, rfcSecretBase32, 59, 30, 8));
    REQUIRE(code == "94287082");
}

TEST_CASE("TOTP secrets are forgiving", "[otp][totp]")
{
    std::string lower(rfcSecretBase32);
    for (auto &c: lower)
        c = tolower(c);

    std::string a, b, c;
    REQUIRE(totpc::totpGenerate(a, rfcSecretBase32, 59));
    REQUIRE(totpc::totpGenerate(b, lower, 59));
    REQUIRE(totpc::totpGenerate(c, "GEZD GNBV GY3T QOJQ\nGEZD GNBV GY3T QOJQ", 59));
    REQUIRE(a == b);
    REQUIRE(a == c);
}

TEST_CASE("TOTP rejects bad secrets", "[otp][totp]")
{
    std::string code;
    for (auto secret: {"", "   ", "====", "GEZDG"})
    {
        auto s = totpc::totpGenerate(code, secret, 59);
        REQUIRE_FALSE(s);
        REQUIRE(s.value() == totpc::TOTPC_CC_InvalidSecret);
    }
    REQUIRE(code.empty());
}

TEST_CASE("TOTP is deterministic", "[otp][totp]")
{
    std::string a, b;
    REQUIRE(totpc::totpGenerate(a, "JBSWY3DPEHPK3PXP", 1700000000));
    REQUIRE(totpc::totpGenerate(b, "JBSWY3DPEHPK3PXP", 1700000000));
    REQUIRE(a == b);
}

TEST_CASE("TOTP only depends on the time step", "[otp][totp]")
{
    for (uint64_t t = 1700000000; t < 1700000100; t += 7)
    {
        std::string a, b;
        REQUIRE(totpc::totpGenerate(a, "JBSWY3DPEHPK3PXP", t));
        REQUIRE(totpc::totpGenerate(b, "JBSWY3DPEHPK3PXP", t - t % 30));
        REQUIRE(a == b);
    }
}

TEST_CASE("TOTP code format", "[otp][totp]")
{
    for (unsigned digits: {6u, 8u})
    {
        for (uint64_t t = 0; t < 3000; t += 30)
        {
            std::string code;
            REQUIRE(totpc::totpGenerate(code, "JBSWY3DPEHPK3PXP", t, 30, digits));
            REQUIRE(code.size() == digits);
            for (auto c: code)
                REQUIRE(isdigit(static_cast<unsigned char>(c)));
        }
    }
}

TEST_CASE("TOTP seconds remaining", "[otp][totp]")
{
    REQUIRE(totpc::totpSecondsRemaining(0) == 30);
    REQUIRE(totpc::totpSecondsRemaining(29) == 1);
    REQUIRE(totpc::totpSecondsRemaining(59) == 1);
    REQUIRE(totpc::totpSecondsRemaining(60) == 30);
    REQUIRE(totpc::totpSecondsRemaining(65, 60) == 55);
}

TEST_CASE("TOTP for a stored account", "[otp][totp][store]")
{
    totpc::JsonSecretStore store;
    REQUIRE(store.decode("{ \"alice\": \"JBSWY3DPEHPK3PXP\" }"));

    SECTION("found")
    {
        auto before = totpc::totpNow();
        std::string code;
        REQUIRE(totpc::totpFor(code, store, "alice"));
        auto after = totpc::totpNow();

        std::string a, b;
        REQUIRE(totpc::totpGenerate(a, "JBSWY3DPEHPK3PXP", before));
        REQUIRE(totpc::totpGenerate(b, "JBSWY3DPEHPK3PXP", after));
        REQUIRE((code == a || code == b));
    }
    SECTION("not found")
    {
        std::string code;
        auto s = totpc::totpFor(code, store, "bob");
        REQUIRE_FALSE(s);
        REQUIRE(s.value() == totpc::TOTPC_CC_NotFound);
    }
}

namespace {

/**
 * A lookup that always hands back the same secret.
 */
class FixedLookup:
    public totpc::SecretLookup
{
public:
    FixedLookup(std::string secret): secret_(secret) {}

    totpc::Status
    lookup(std::string &result, const std::string &account) const override
    {
        if (account != "fixed")
            return totpc::Status(totpc::TOTPC_CC_NotFound, account,
                __FILE__, __FUNCTION__, __LINE__);
        result = secret_;
        return totpc::Status();
    }

private:
    std::string secret_;
};

}

TEST_CASE("TOTP through a custom lookup", "[otp][totp]")
{
    std::string code;

    FixedLookup good("JBSWY3DPEHPK3PXP");
    REQUIRE(totpc::totpFor(code, good, "fixed", 30, 8));
    REQUIRE(code.size() == 8);

    FixedLookup bad("not base32!");
    auto s = totpc::totpFor(code, bad, "fixed");
    REQUIRE(s.value() == totpc::TOTPC_CC_InvalidSecret);

    s = totpc::totpFor(code, good, "other");
    REQUIRE(s.value() == totpc::TOTPC_CC_NotFound);
}

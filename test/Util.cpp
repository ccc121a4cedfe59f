/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../totpc/util/Util.hpp"
#include <catch2/catch.hpp>
#include <limits.h>

TEST_CASE("Number parsing", "[util]" )
{
    uint64_t n = 7;

    SECTION("plain")
    {
        REQUIRE(totpc::parseUnsigned(n, "59", 100));
        REQUIRE(n == 59);
        REQUIRE(totpc::parseUnsigned(n, "0", 100));
        REQUIRE(n == 0);
        REQUIRE(totpc::parseUnsigned(n, "18446744073709551615", UINT64_MAX));
        REQUIRE(n == UINT64_MAX);
    }
    SECTION("limit")
    {
        REQUIRE(totpc::parseUnsigned(n, "1024", 1024));
        REQUIRE(n == 1024);
        REQUIRE_FALSE(totpc::parseUnsigned(n, "1025", 1024));
        REQUIRE(n == 1024);
    }
    SECTION("junk")
    {
        const char *junk[] = {"", "-1", "+5", " 5", "5 ", "12abc", "abc", "0x10"};
        for (auto text: junk)
        {
            auto s = totpc::parseUnsigned(n, text, UINT64_MAX);
            REQUIRE_FALSE(s);
            REQUIRE(s.value() == totpc::TOTPC_CC_Error);
            REQUIRE(n == 7);
        }
    }
    SECTION("overflow")
    {
        REQUIRE_FALSE(totpc::parseUnsigned(n, "18446744073709551616", UINT64_MAX));
        REQUIRE_FALSE(totpc::parseUnsigned(n, "99999999999999999999999", UINT64_MAX));
        REQUIRE(n == 7);
    }
}

TEST_CASE("Setting ranges", "[util]" )
{
    REQUIRE(totpc::checkRange("digits", 6, 1, 10));
    REQUIRE(totpc::checkRange("digits", 10, 1, 10));
    REQUIRE_FALSE(totpc::checkRange("digits", 0, 1, 10));
    REQUIRE_FALSE(totpc::checkRange("digits", 11, 1, 10));
    REQUIRE_FALSE(totpc::checkRange("digits", 4294967302LL, 1, 10));

    REQUIRE(totpc::checkRange("timeStep", UINT_MAX, 1, UINT_MAX));
    REQUIRE_FALSE(totpc::checkRange("timeStep", 4294967296LL, 1, UINT_MAX));
    REQUIRE_FALSE(totpc::checkRange("timeStep", -30, 1, UINT_MAX));

    auto s = totpc::checkRange("digits", 11, 1, 10);
    REQUIRE(s.message() == "digits must be between 1 and 10");
}

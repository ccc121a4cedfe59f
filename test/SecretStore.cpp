/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../totpc/store/SecretStore.hpp"
#include <catch2/catch.hpp>

TEST_CASE("Secret store lookups", "[store]")
{
    totpc::JsonSecretStore store;
    REQUIRE(store.decode(
        "{"
        "  \"carol\": \"MZXW6YTB\","
        "  \"alice@example.com\": \"JBSWY3DPEHPK3PXP\","
        "  \"broken\": 42"
        "}"));

    std::string secret;
    SECTION("present")
    {
        REQUIRE(store.lookup(secret, "alice@example.com"));
        REQUIRE(secret == "JBSWY3DPEHPK3PXP");
    }
    SECTION("missing")
    {
        auto s = store.lookup(secret, "dave");
        REQUIRE_FALSE(s);
        REQUIRE(s.value() == totpc::TOTPC_CC_NotFound);
        REQUIRE(secret.empty());
    }
    SECTION("wrong type")
    {
        auto s = store.lookup(secret, "broken");
        REQUIRE_FALSE(s);
        REQUIRE(s.value() == totpc::TOTPC_CC_JSONError);
    }
    SECTION("account list")
    {
        auto accounts = store.accounts();
        REQUIRE(accounts.size() == 2);
        REQUIRE(accounts.front() == "alice@example.com");
        REQUIRE(accounts.back() == "carol");
    }
}

TEST_CASE("Bad secret stores", "[store]")
{
    totpc::JsonSecretStore store;
    REQUIRE_FALSE(store.decode("[\"JBSWY3DPEHPK3PXP\"]"));
    REQUIRE_FALSE(store.decode("{ \"alice\": "));
    REQUIRE_FALSE(store.load("/nonexistent/totpc/secrets.json"));

    std::string secret;
    REQUIRE(store.lookup(secret, "alice").value() == totpc::TOTPC_CC_NotFound);
    REQUIRE(store.accounts().empty());
}

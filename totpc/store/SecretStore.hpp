/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TOTPC_STORE_SECRET_STORE_HPP
#define TOTPC_STORE_SECRET_STORE_HPP

#include "../json/JsonObject.hpp"
#include <list>

namespace totpc {

/**
 * Finds the base32 shared secret for an account.
 */
class SecretLookup
{
public:
    virtual ~SecretLookup();

    /**
     * Fails with TOTPC_CC_NotFound if the account has no secret.
     */
    virtual Status
    lookup(std::string &result, const std::string &account) const = 0;
};

/**
 * A read-only credential store kept in a JSON file,
 * mapping account names to base32 secrets:
 *
 *   { "alice@example.com": "JBSWY3DPEHPK3PXP" }
 */
class JsonSecretStore:
    public SecretLookup,
    public JsonObject
{
public:
    TOTPC_JSON_CONSTRUCTORS(JsonSecretStore, JsonObject)

    /**
     * Reads the store from disk.
     */
    Status
    load(const std::string &filename);

    /**
     * Reads the store from an in-memory string.
     */
    Status
    decode(const std::string &data);

    Status
    lookup(std::string &result, const std::string &account) const override;

    /**
     * Lists the stored account names, in sorted order.
     */
    std::list<std::string>
    accounts() const;

private:
    Status
    checkRoot();
};

} // namespace totpc

#endif

/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "SecretStore.hpp"
#include "../util/Debug.hpp"

namespace totpc {

SecretLookup::~SecretLookup()
{
}

Status
JsonSecretStore::load(const std::string &filename)
{
    TOTPC_CHECK(JsonObject::load(filename));
    TOTPC_CHECK(checkRoot());
    return Status();
}

Status
JsonSecretStore::decode(const std::string &data)
{
    TOTPC_CHECK(JsonObject::decode(data));
    TOTPC_CHECK(checkRoot());
    return Status();
}

Status
JsonSecretStore::lookup(std::string &result, const std::string &account) const
{
    json_t *value = json_object_get(root_, account.c_str());
    if (!value)
        return TOTPC_ERROR(TOTPC_CC_NotFound, "No secret for " + account);
    if (!json_is_string(value))
        return TOTPC_ERROR(TOTPC_CC_JSONError, "Bad secret for " + account);

    TOTPC_DebugLevel(1, "Found secret for %s", account.c_str());
    result = json_string_value(value);
    return Status();
}

std::list<std::string>
JsonSecretStore::accounts() const
{
    std::list<std::string> out;

    const char *key;
    json_t *value;
    json_object_foreach(root_, key, value)
    {
        if (json_is_string(value))
            out.push_back(key);
    }
    out.sort();
    return out;
}

Status
JsonSecretStore::checkRoot()
{
    if (!json_is_object(root_))
    {
        reset();
        return TOTPC_ERROR(TOTPC_CC_JSONError,
            "The secret store must hold a JSON object");
    }
    return Status();
}

} // namespace totpc

/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Command.hpp"
#include "../totpc/crypto/OtpKey.hpp"
#include "../totpc/json/JsonObject.hpp"
#include "../totpc/store/SecretStore.hpp"
#include "../totpc/util/Debug.hpp"
#include "../totpc/util/FileIO.hpp"
#include "../totpc/util/Util.hpp"
#include <iostream>
#include <getopt.h>
#include <limits.h>

using namespace totpc;

struct ConfigJson:
    public JsonObject
{
    TOTPC_JSON_STRING(secretsFile, "secretsFile", nullptr)
    TOTPC_JSON_STRING(logFile, "logFile", nullptr)
    TOTPC_JSON_INTEGER(timeStep, "timeStep", 30)
    TOTPC_JSON_INTEGER(digits, "digits", 6)
    TOTPC_JSON_BOOLEAN(verbose, "verbose", false)
};

static std::string
configPath()
{
    return fileConfigDir() + "totpc.conf";
}

static std::string
secretsPath()
{
    return fileConfigDir() + "secrets.json";
}

/**
 * The main program body.
 */
static Status run(int argc, char *argv[])
{
    // Parse out the command-line options:
    std::string config = configPath();
    std::string secrets;
    bool verbose = false;
    bool wantHelp = false;

    static const struct option long_options[] =
    {
        {"config",  required_argument, nullptr, 'c'},
        {"secrets", required_argument, nullptr, 's'},
        {"verbose", no_argument,       nullptr, 'v'},
        {"help",    no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };
    opterr = 0;
    int c;
    while (-1 != (c = getopt_long(argc, argv, "+c:s:vh", long_options, nullptr)))
    {
        switch (c)
        {
        case 'c':
            config = optarg;
            break;
        case 's':
            secrets = optarg;
            break;
        case 'v':
            verbose = true;
            break;
        case 'h':
            wantHelp = true;
            break;
        case '?':
            if (optopt == 'c')
                return TOTPC_ERROR(TOTPC_CC_Error, "-c requires a config file");
            else if (optopt == 's')
                return TOTPC_ERROR(TOTPC_CC_Error, "-s requires a secrets file");
            else
                return TOTPC_ERROR(TOTPC_CC_Error,
                    std::string("Unknown option '-") + char(optopt) + "'.");
        default:
            return TOTPC_ERROR(TOTPC_CC_Error, "Cannot parse options");
        }
    }

    // At this point, all non-option arguments should be out of the list:
    argc -= optind;
    argv += optind;

    // The config file is optional:
    ConfigJson json;
    if (fileExists(config))
        TOTPC_CHECK(json.load(config));
    if (json.verbose())
        verbose = true;
    TOTPC_CHECK(debugInitialize(json.logFile() ? json.logFile() : "", verbose));

    Session session;
    TOTPC_CHECK(checkRange("timeStep", json.timeStep(), 1, UINT_MAX));
    TOTPC_CHECK(checkRange("digits", json.digits(), 1, otpMaxDigits));
    session.timeStep = json.timeStep();
    session.digits = json.digits();

    // Find the command:
    if (argc < 1)
    {
        CommandRegistry::print();
        return Status();
    }
    const auto commandName = argv[0];
    --argc;
    ++argv;

    Command *command = CommandRegistry::find(commandName);
    if (!command)
        return TOTPC_ERROR(TOTPC_CC_Error,
                           "unknown command " + std::string(commandName));

    // If the user wants help, just print the string and return:
    if (wantHelp)
    {
        std::cout << helpString(*command) << std::endl;
        return Status();
    }

    // Populate the session up to the required level:
    if (InitLevel::store <= command->level())
    {
        if (secrets.empty())
            secrets = json.secretsFile() ? json.secretsFile() : secretsPath();

        session.store.reset(new JsonSecretStore());
        TOTPC_CHECK(session.store->load(secrets));
    }

    // Invoke the command:
    TOTPC_CHECK((*command)(session, argc, argv));

    return Status();
}

int main(int argc, char *argv[])
{
    Status s = run(argc, argv);
    if (!s)
    {
        s.log();
        std::cerr << s << std::endl;
    }
    debugTerminate();
    return s ? 0 : 1;
}

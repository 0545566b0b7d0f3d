/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Command.hpp"
#include "../otpkit/json/JsonObject.hpp"
#include "../otpkit/token/Token.hpp"
#include "../otpkit/util/Debug.hpp"
#include <iostream>
#include <getopt.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

using namespace otpkit;

/**
 * Named key URI's, selected with the --token option.
 */
struct TokensJson:
    public JsonObject
{
    OTPKIT_JSON_CONSTRUCTORS(TokensJson, JsonObject)
    TokensJson(json_t *root): JsonObject(root) {}

    Status
    uri(std::string &result, const std::string &name) const
    {
        if (!hasString(name.c_str()))
            return OTPKIT_ERROR(OTPKIT_CC_Error,
                                "No token named " + name + " in the config");
        result = getString(name.c_str(), "");
        return Status();
    }
};

struct ConfigJson:
    public JsonObject
{
    OTPKIT_JSON_STRING(logFile, "logFile", nullptr)
    OTPKIT_JSON_STRING(uri, "uri", nullptr)
    OTPKIT_JSON_VALUE(tokens, "tokens", TokensJson)
};

static std::string
configPath()
{
    // Mac: ~/Library/Application Support/OtpKit/otpkit.conf
    // Unix: ~/.config/otpkit/otpkit.conf
    const char *home = getenv("HOME");
    if (!home || !strlen(home))
        home = "/";

#ifdef MAC_OSX
    return std::string(home) + "/Library/Application Support/OtpKit/otpkit.conf";
#else
    return std::string(home) + "/.config/otpkit/otpkit.conf";
#endif
}

/**
 * The main program body.
 */
static Status run(int argc, char *argv[])
{
    // Parse out the command-line options:
    std::string config;
    std::string tokenName;
    Session session;
    bool wantHelp = false;

    static const struct option long_options[] =
    {
        {"config",      required_argument, nullptr, 'c'},
        {"uri",         required_argument, nullptr, 'u'},
        {"token",       required_argument, nullptr, 't'},
        {"help",        no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };
    opterr = 0;
    int c;
    while (-1 != (c = getopt_long(argc, argv, "c:hu:t:", long_options, nullptr)))
    {
        switch (c)
        {
        case 'c':
            config = optarg;
            break;
        case 'h':
            wantHelp = true;
            break;
        case 'u':
            session.uri = optarg;
            break;
        case 't':
            tokenName = optarg;
            break;
        case '?':
            if (optopt == 'c')
                return OTPKIT_ERROR(OTPKIT_CC_Error, std::string("-c requires a config file"));
            else if (optopt == 'u')
                return OTPKIT_ERROR(OTPKIT_CC_Error, std::string("-u requires a key URI"));
            else if (optopt == 't')
                return OTPKIT_ERROR(OTPKIT_CC_Error, std::string("-t requires a token name"));
            else
                return OTPKIT_ERROR(OTPKIT_CC_Error, "Unknown option '-" +
                                    std::string(1, optopt) + "'.");
        default:
            return OTPKIT_ERROR(OTPKIT_CC_Error, "Cannot parse options");
        }
    }

    // The default config file is optional, but an explicit one is not:
    ConfigJson json;
    if (config.empty() && 0 == access(configPath().c_str(), F_OK))
        config = configPath();
    if (!config.empty())
        OTPKIT_CHECK(json.load(config));

    OTPKIT_CHECK_OLD(OTPKIT_Initialize(json.logFile(), &error));

    // At this point, all non-option arguments should be out of the list:
    argc -= optind;
    argv += optind;

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
        return OTPKIT_ERROR(OTPKIT_CC_Error,
                            "unknown command " + std::string(commandName));

    // If the user wants help, just print the string and return:
    if (wantHelp)
    {
        std::cout << helpString(*command) << std::endl;
        return Status();
    }

    // Populate the session up to the required level:
    if (InitLevel::token <= command->level())
    {
        if (session.uri.empty())
        {
            if (!tokenName.empty())
                OTPKIT_CHECK(json.tokens().uri(session.uri, tokenName));
            else if (json.uriOk())
                session.uri = json.uri();
            else
                return OTPKIT_ERROR(OTPKIT_CC_Error, "No key URI given, " +
                                    helpString(*command));
        }

        OTPKIT_CHECK(Token::create(session.token, session.uri));
    }

    // Invoke the command:
    OTPKIT_CHECK((*command)(session, argc, argv));

    // Clean up:
    OTPKIT_Terminate();
    return Status();
}

int main(int argc, char *argv[])
{
    Status s = run(argc, argv);
    if (!s)
        std::cerr << s.log() << std::endl;
    return s ? 0 : 1;
}

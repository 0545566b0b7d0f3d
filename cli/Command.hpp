/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef CLI_COMMAND_HPP
#define CLI_COMMAND_HPP

#include "../otpkit/util/Status.hpp"
#include <memory>

namespace otpkit {
class Token;
}

/**
 * Different levels of information that can be populated in the session.
 */
enum class InitLevel
{
    none = 0,   // Nothing loaded
    token       // Key URI parsed into a token
};

/**
 * The main function fills this in as needed,
 * giving the commands access to the objects they need.
 */
struct Session
{
    std::shared_ptr<otpkit::Token> token;
    std::string uri;
};

/**
 * The function prototype for commands.
 */
#define COMMAND_PROTO \
    operator ()(Session &session, int argc, char *argv[])

/**
 * Abstract base class for commands.
 */
class Command
{
public:
    virtual ~Command();
    virtual otpkit::Status COMMAND_PROTO = 0;
    virtual InitLevel level() const = 0;
    virtual const char *name() const = 0;
    virtual const char *help() const = 0;
    virtual const char *about() const = 0;
};

/**
 * Inserts a new command in to the global command list.
 */
class CommandRegistry
{
public:
    CommandRegistry(const char *name, Command *c);

    /**
     * Finds a command in the global list.
     */
    static Command *
    find(const std::string &name);

    /**
     * Prints the list of commands, with a line about each one.
     */
    static void
    print();
};

/**
 * Registers and defines new command.
 * Should be followed by the command implementation in curly braces.
 */
#define COMMAND(LEVEL, NAME, TEXT, HELP, ABOUT) \
    class NAME: public Command { \
        otpkit::Status COMMAND_PROTO override; \
        InitLevel level() const override { return LEVEL; } \
        const char *name() const override { return TEXT; } \
        const char *help() const override { return HELP; } \
        const char *about() const override { return ABOUT; } \
    } implement##NAME; \
    CommandRegistry register##NAME(TEXT, &implement##NAME); \
    otpkit::Status NAME::COMMAND_PROTO

/**
 * Builds a documentation string for a command.
 */
std::string
helpString(const Command &command);

#endif

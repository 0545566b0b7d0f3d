/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Command.hpp"
#include <iomanip>
#include <iostream>
#include <map>

Command::~Command()
{
}

typedef std::map<std::string, Command *> CommandMap;

/**
 * The registrations run during static initialization,
 * so the map is built on first use.
 */
static CommandMap &
commandMap()
{
    static CommandMap map;
    return map;
}

CommandRegistry::CommandRegistry(const char *name, Command *c)
{
    auto &map = commandMap();
    if (!map.insert(CommandMap::value_type(name, c)).second)
        std::cerr << "warning: Duplicate command " << name << std::endl;
}

Command *
CommandRegistry::find(const std::string &name)
{
    const auto &map = commandMap();
    auto i = map.find(name);
    return map.end() == i ? nullptr : i->second;
}

void
CommandRegistry::print()
{
    std::cout << "commands:" << std::endl;
    for (const auto &i: commandMap())
        std::cout << "  " << std::left << std::setw(14) << i.first <<
            i.second->about() << std::endl;
}

std::string
helpString(const Command &command)
{
    std::string out = "usage: otpkit-cli ";
    if (InitLevel::token <= command.level())
        out += "[-u <uri> | -t <token-name>] ";
    return out + command.name() + command.help();
}

#pragma once
// Copyright (c) 2014, PG, All rights reserved.
#include "BaseEnvironment.h"

#include <string_view>

class Console {
   public:
    // "name value" sets a convar, "name" alone executes a command (or prints the convar)
    // multiple commands can be separated with ';'
    // returns false if the (last) command could not be processed
    static bool processCommand(std::string_view command, bool fromFile = false);

    // runs every line of a .cfg file through processCommand
    // relative names are looked up in the cfg/ directory, the extension is optional
    static void execConfigFile(std::string_view filename);
};

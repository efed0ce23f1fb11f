#ifndef CONVARDEFS_H
#define CONVARDEFS_H

// DO NOT put spinner/gameplay convars in this file (put them in SpintrackConVarDefs.h)

// NOLINTBEGIN(misc-definitions-in-headers)

#define _CV(name) name

// defined and included at the end of ConVarHandler.cpp
#if defined(DEFINE_CONVARS)
#undef CONVAR
#define CONVAR(name, ...) ConVar _CV(name)(#name __VA_OPT__(, ) __VA_ARGS__)

#include "BaseEnvironment.h"

#include "ConVarHandler.h"
#include "Console.h"

#else
#define CONVAR(name, ...) extern ConVar _CV(name)
#endif

class ConVar;
namespace cv {
namespace cmd {

// Generic commands
CONVAR(exec, CLIENT | NOLOAD, Console::execConfigFile);
CONVAR(find, CLIENT, ConVarHandler::ConVarBuiltins::find);
CONVAR(help, CLIENT, ConVarHandler::ConVarBuiltins::help);
CONVAR(listcommands, CLIENT, ConVarHandler::ConVarBuiltins::listcommands);
CONVAR(echo, CLIENT, ConVarHandler::ConVarBuiltins::echo);

}  // namespace cmd

// Console
CONVAR(console_logging, true, CLIENT, "log the result of every processed console command");

// Debug
CONVAR(debug_cv, false, CLIENT, "log every convar value change");

// Logging
CONVAR(log_to_file, true, CLIENT | NOLOAD, "also write all log output to logs/ (launch arg only)");

}  // namespace cv

// NOLINTEND(misc-definitions-in-headers)

#endif

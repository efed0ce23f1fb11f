// Copyright (c) 2014, PG, All rights reserved.
#include "Console.h"

#include "SString.h"
#include "ConVar.h"
#include "ConVarHandler.h"
#include "Logging.h"

#include <fstream>
#include <string>
#include <vector>

bool Console::processCommand(std::string_view command, bool fromFile) {
    // remove whitespace from beginning/end of string
    SString::trim_inplace(command);
    if(command.length() < 1) return false;

    // handle multiple commands separated by semicolons
    // avoid reading semicolon-separated commands from files as separate commands
    if(!fromFile && command.find(';') != std::string::npos && !command.starts_with("echo")) {
        bool allProcessed = true;

        const auto commands = SString::split(command, ';');
        for(const auto &subCommand : commands) {
            if(SString::is_comment(subCommand) || subCommand.find_first_not_of(" \t\r\n") == std::string::npos) {
                continue;
            }
            allProcessed &= processCommand(subCommand);
        }
        return allProcessed;
    }

    // separate convar name and value
    std::string_view commandName = command;
    std::string_view commandValue;
    if(const size_t space = command.find_first_of(" \t"); space != std::string_view::npos) {
        commandName = command.substr(0, space);
        commandValue = command.substr(space + 1);
        SString::trim_inplace(commandValue);
    }

    // get convar
    ConVar *var = cvars().getConVarByName(commandName, false);
    if(!var) {
        debugLog("Unknown command: {:s}", commandName);
        return false;
    }

    if(fromFile && var->isFlagSet(cv::NOLOAD)) {
        return false;
    }

    // set new value (this handles all callbacks internally)
    if(commandValue.length() > 0) {
        if(!var->setValue(commandValue)) return false;
    } else {
        var->exec();
        var->execArgs("");
    }

    // log
    if(cv::console_logging.getBool() && !var->isFlagSet(cv::HIDDEN) && var->canHaveValue()) {
        std::string logMessage{commandName};

        if(commandValue.length() < 1) {
            logMessage.append(fmt::format(" = {:s} ( def. \"{:s}\" , ", var->getString(), var->getDefaultString()));
            logMessage.append(ConVar::typeToString(var->getType()));
            logMessage.append(", ");
            logMessage.append(ConVarHandler::flagsToString(var->getFlags()));
            logMessage.append(" )");

            if(!var->getHelpstring().empty()) {
                logMessage.append(" - ");
                logMessage.append(var->getHelpstring());
            }
        } else {
            logMessage.append(" : ");
            logMessage.append(var->getString());
        }

        debugLog("{:s}", logMessage);
    }

    return true;
}

void Console::execConfigFile(std::string_view filename_view) {
    SString::trim_inplace(filename_view);
    if(filename_view.empty()) return;
    std::string filename{filename_view};

    if(!filename.contains('/'))  // allow absolute paths
        filename = fmt::format(SPINTRACK_CFG_PATH "/{}", filename_view);

    // handle extension
    if(!filename.ends_with(".cfg")) filename.append(".cfg");

    std::ifstream configFile(filename);
    if(!configFile.good()) {
        debugLog("NOTICE: file \"{:s}\" not found!", filename);
        return;
    }

    // collect commands first
    std::vector<std::string> cmds;
    for(std::string line; std::getline(configFile, line);) {
        // handle comments - find "//" and remove everything after
        const auto commentIndex = line.find("//");
        if(commentIndex != std::string::npos) line.erase(commentIndex, line.length() - commentIndex);

        SString::trim_inplace(line);
        if(!line.empty()) cmds.push_back(std::move(line));
    }

    // process the collected commands
    int numFailed = 0;
    for(const auto &cmd : cmds) {
        if(!processCommand(cmd, true)) numFailed++;
    }
    logIf(numFailed > 0, "{:d}/{:d} commands in \"{:s}\" were not applied", numFailed, cmds.size(), filename);
}

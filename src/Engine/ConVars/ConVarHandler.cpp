// Copyright (c) 2011, PG & 2025, WH & 2025, kiwec, All rights reserved.
#include "ConVarHandler.h"
#include "ConVar.h"

#include "Logging.h"
#include "SString.h"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <unordered_set>

// singleton init
ConVarHandler &cvars() {
    static ConVarHandler instance;
    return instance;
}

ConVarHandler::ConVarHandler() {
    this->vConVarArray.reserve(128);
    this->vConVarMap.reserve(128);
}

void ConVarHandler::addConVar(ConVar *c) {
    const std::string_view name{c->getName()};
    if(this->vConVarMap.contains(name)) {
        // static init, the logger isn't up yet
        printf("WARNING: duplicate ConVar name (\"%s\"), ignoring the second one\n", c->getName());
        return;
    }

    this->vConVarArray.push_back(c);
    this->vConVarMap.emplace(name, c);
}

ConVar *ConVarHandler::getConVar_int(std::string_view name) const {
    auto it = this->vConVarMap.find(name);
    if(it != this->vConVarMap.end()) return it->second;
    return nullptr;
}

ConVar *ConVarHandler::getConVarByName(std::string_view name, bool warnIfNotFound) const {
    ConVar *found = this->getConVar_int(name);
    if(found) return found;

    if(warnIfNotFound) {
        warnLog("ConVar \"{:s}\" does not exist...", name);
    }

    return nullptr;
}

std::vector<ConVar *> ConVarHandler::getConVarByLetter(std::string_view letters) const {
    std::unordered_set<std::string_view> matchingConVarNames;
    std::vector<ConVar *> matchingConVars;
    {
        if(letters.length() < 1) return matchingConVars;

        const std::vector<ConVar *> &convars = this->vConVarArray;

        // first try matching the start
        for(auto convar : convars) {
            if(convar->isFlagSet(cv::HIDDEN)) continue;

            const std::string_view name = convar->getName();
            if(name.starts_with(letters)) {
                matchingConVarNames.insert(name);
                matchingConVars.push_back(convar);
            }
        }

        // then try matching substrings
        if(letters.length() > 1) {
            for(auto convar : convars) {
                if(convar->isFlagSet(cv::HIDDEN)) continue;
                const std::string_view name = convar->getName();

                if(name.find(letters) != std::string::npos) {
                    if(!matchingConVarNames.contains(name)) {
                        matchingConVarNames.insert(name);
                        matchingConVars.push_back(convar);
                    }
                }
            }
        }

        // (results should be displayed in vector order)
    }
    return matchingConVars;
}

std::string ConVarHandler::flagsToString(u8 flags) {
    if(flags == 0) {
        return "no flags";
    }

    static constexpr const auto flagStringPairArray = std::array{
        std::pair{cv::CLIENT, "client"}, std::pair{cv::GAMEPLAY, "gameplay"}, std::pair{cv::HIDDEN, "hidden"},
        std::pair{cv::NOSAVE, "nosave"}, std::pair{cv::NOLOAD, "noload"}};

    std::string string;
    for(bool first = true; const auto &[flag, str] : flagStringPairArray) {
        if((flags & flag) == flag) {
            if(!first) {
                string.push_back(' ');
            }
            first = false;
            string.append(str);
        }
    }

    return string;
}

std::vector<ConVar *> ConVarHandler::getNonDefaultCvars(u8 flag) const {
    std::vector<ConVar *> list;

    for(auto *cv : this->vConVarArray) {
        if(!cv->isFlagSet(flag) || !cv->canHaveValue() || cv->isDefault()) continue;

        list.push_back(cv);
    }

    return list;
}

//*****************************//
//	ConVarHandler ConCommands  //
//*****************************//

namespace {
std::string describeConVar(const ConVar *var) {
    std::string tstring{var->getName()};
    if(var->canHaveValue()) {
        tstring.append(fmt::format(" = {:s} ( def. \"{:s}\" , ", var->getString(), var->getDefaultString()));
        tstring.append(ConVar::typeToString(var->getType()));
        tstring.append(", ");
        tstring.append(ConVarHandler::flagsToString(var->getFlags()));
        tstring.append(" )");
    }

    if(!var->getHelpstring().empty()) {
        tstring.append(" - ");
        tstring.append(var->getHelpstring());
    }
    return tstring;
}

void sortByName(std::vector<ConVar *> &convars) {
    std::ranges::sort(
        convars, [](const char *s1, const char *s2) -> bool { return strcmp(s1, s2) < 0; },
        [](const ConVar *v) { return v->getName(); });
}
}  // namespace

void ConVarHandler::ConVarBuiltins::find(std::string_view args) {
    SString::trim_inplace(args);
    if(args.length() < 1) {
        logRaw("Usage:  find <string>");
        return;
    }

    const std::vector<ConVar *> &convars = cvars().getConVarArray();

    std::vector<ConVar *> matchingConVars;
    for(auto convar : convars) {
        if(convar->isFlagSet(cv::HIDDEN)) continue;

        const std::string_view name = convar->getName();
        if(name.find(args) != std::string::npos) matchingConVars.push_back(convar);
    }

    if(matchingConVars.size() < 1) {
        logRaw("No commands found containing {:s}.", args);
        return;
    }

    sortByName(matchingConVars);

    logRaw("----------------------------------------------");
    logRaw("[ find : {:s} ]", args);
    for(auto &matchingConVar : matchingConVars) {
        logRaw("{:s}", matchingConVar->getName());
    }
    logRaw("----------------------------------------------");
}

void ConVarHandler::ConVarBuiltins::help(std::string_view args) {
    SString::trim_inplace(args);

    if(args.length() < 1) {
        logRaw("Usage:  help <cvarname>");
        logRaw("To get a list of all available commands, type \"listcommands\".");
        return;
    }

    const std::vector<ConVar *> matches = cvars().getConVarByLetter(args);

    if(matches.size() < 1) {
        logRaw("ConVar {:s} does not exist.", args);
        return;
    }

    // use closest match
    size_t index = 0;
    for(size_t i = 0; i < matches.size(); i++) {
        if(matches[i]->getName() == args) {
            index = i;
            break;
        }
    }
    ConVar *match = matches[index];

    if(match->getHelpstring().empty()) {
        logRaw("ConVar {:s} does not have a helpstring.", match->getName());
        return;
    }

    logRaw("{:s}", describeConVar(match));
}

void ConVarHandler::ConVarBuiltins::listcommands() {
    logRaw("----------------------------------------------");
    {
        std::vector<ConVar *> convars = cvars().getConVarArray();
        sortByName(convars);

        for(auto *convar : convars) {
            if(convar->isFlagSet(cv::HIDDEN)) continue;
            logRaw("{:s}", describeConVar(convar));
        }
    }
    logRaw("----------------------------------------------");
}

void ConVarHandler::ConVarBuiltins::echo(std::string_view args) {
    if(args.length() > 0) {
        logRaw(args);
    }
}

#undef CONVARDEFS_H
#define DEFINE_CONVARS

#include "ConVarDefs.h"

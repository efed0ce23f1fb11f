#pragma once
// Copyright (c) 2011, PG & 2025, WH, All rights reserved.
#include "BaseEnvironment.h"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

class ConVar;

class ConVarHandler {
    NOCOPY_NOMOVE(ConVarHandler)
   public:
    static std::string flagsToString(u8 flags);

    ConVarHandler();
    ~ConVarHandler() = default;

    [[nodiscard]] inline const std::vector<ConVar *> &getConVarArray() const { return this->vConVarArray; }

    // returns nullptr if not found (logs a warning if warnIfNotFound)
    [[nodiscard]] ConVar *getConVarByName(std::string_view name, bool warnIfNotFound = true) const;
    [[nodiscard]] std::vector<ConVar *> getConVarByLetter(std::string_view letters) const;

    // all non-default convars with the given flag set
    [[nodiscard]] std::vector<ConVar *> getNonDefaultCvars(u8 flag) const;

    // only called from the ConVar constructor
    void addConVar(ConVar *c);

    struct ConVarBuiltins {
        static void find(std::string_view args);
        static void help(std::string_view args);
        static void listcommands();
        static void echo(std::string_view args);
    };

   private:
    [[nodiscard]] ConVar *getConVar_int(std::string_view name) const;

    std::vector<ConVar *> vConVarArray;
    std::unordered_map<std::string_view, ConVar *> vConVarMap;
};

// singleton accessor
ConVarHandler &cvars();

// Copyright (c) 2025, WH, All rights reserved.
#include "BaseEnvironment.h"
#include "Logging.h"

#include "App.h"
#include "AppDescriptor.h"
#include "ConVar.h"
#include "ConVarHandler.h"
#include "Console.h"
#include "SString.h"

#include <clocale>
#include <cstdlib>
#include <locale>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace {
using ArgMap = std::unordered_map<std::string, std::optional<std::string>>;

// "-name value" for every name that is a convar
// returns the number of args that couldn't be applied
int applyConVarArgs(const ArgMap &args) {
    int numFailed = 0;
    for(const auto &[arg, value] : args) {
        if(!arg.starts_with('-') || !value.has_value()) continue;

        const std::string_view name = std::string_view{arg}.substr(1);
        if(name == "testapp" || name == "exec") continue;

        ConVar *var = cvars().getConVarByName(name, false);
        if(!var) continue;

        if(!Console::processCommand(fmt::format("{:s} {:s}", name, value.value()))) numFailed++;
    }
    return numFailed;
}
}  // namespace

int main(int argc, char *argv[]) {
    // set locale for e.g. fmt::format("{:L}") to work as expected without explicitly setting it
    if(!!std::setlocale(LC_ALL, "")) {
        std::locale::global(std::locale{""});
    }

    // more easily queryable representation of the args as a map
    const ArgMap arg_map = [&]() -> ArgMap {
        // example usages:
        // args.contains("-testapp")
        // auto name = args["-testapp"].value_or("SpinnerSimulator");
        ArgMap args;
        for(int i = 1; i < argc; ++i) {
            std::string_view arg{argv[i]};
            if(arg.starts_with('-'))
                if(i + 1 < argc && !(argv[i + 1][0] == '-' && !SString::to_double(argv[i + 1]).has_value())) {
                    args[std::string(arg)] = argv[i + 1];
                    ++i;
                } else
                    args[std::string(arg)] = std::nullopt;
            else
                args[std::string(arg)] = std::nullopt;
        }
        return args;
    }();

    // now set up spdlog logging (log_to_file can only be changed from the command line)
    bool withFile = cv::log_to_file.getBool();
    if(const auto it = arg_map.find("-log_to_file"); it != arg_map.end() && it->second.has_value()) {
        withFile = SString::to_bool(it->second.value()).value_or(withFile);
    }
    Logger::init(withFile);
    atexit(Logger::shutdown);

    const Spintrack::AppDescriptor *appDesc{nullptr};
    if(const auto it = arg_map.find("-testapp"); it != arg_map.end() && it->second.has_value()) {
        const auto &testappName = it->second.value();
        for(const auto &entry : Spintrack::getAllAppDescriptors()) {
            if(testappName == entry.name) {
                appDesc = &entry;
                break;
            }
        }
        if(!appDesc) {
            debugLog("ERROR: unknown app \"{:s}\"", testappName);
            return 1;
        }
    }
    if(!appDesc) {
        appDesc = &Spintrack::getDefaultAppDescriptor();
    }

    // config file first, so that the command line wins
    if(const auto it = arg_map.find("-exec"); it != arg_map.end() && it->second.has_value()) {
        Console::execConfigFile(it->second.value());
    }
    if(const int numFailed = applyConVarArgs(arg_map); numFailed > 0) {
        debugLog("WARNING: {:d} command line value(s) were not applied", numFailed);
    }

    debugLog("{:s} {:s} ({:s}): running {:s}", PACKAGE_NAME, PACKAGE_VERSION, OS_NAME, appDesc->name);

    std::unique_ptr<App> app{appDesc->create()};
    while(!app->isShuttingDown()) {
        app->update();
    }

    const int exitCode = app->getExitCode();
    app.reset();

    Logger::flush();
    return exitCode;
}

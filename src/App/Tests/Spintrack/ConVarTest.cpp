// Copyright (c) 2026, WH, All rights reserved.
#include "ConVarTest.h"

#include "SpintrackTestMacros.h"
#include "ConVar.h"
#include "ConVarHandler.h"
#include "Console.h"
#include "SpinnerRules.h"
#include "SpintrackConVars.h"
#include "SString.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>

namespace Spintrack::Tests {

namespace {
int s_numFloatChanges = 0;
float s_lastFloatChange = 0.0f;
std::string s_lastArgs;

ConVar test_bool("test_bool", false, cv::CLIENT | cv::HIDDEN, "boolean test convar");
ConVar test_int("test_int", 5, cv::CLIENT | cv::HIDDEN, "integer test convar");
ConVar test_float("test_float", 0.25f, cv::CLIENT | cv::HIDDEN, "float test convar", [](float newValue) {
    s_numFloatChanges++;
    s_lastFloatChange = newValue;
});
ConVar test_string("test_string", "default", cv::CLIENT | cv::HIDDEN, "string test convar");
ConVar test_noload("test_noload", 0, cv::CLIENT | cv::HIDDEN | cv::NOLOAD, "can't be set from config files");
ConVar test_cmd("test_cmd", cv::CLIENT | cv::HIDDEN, [](std::string_view args) { s_lastArgs = args; });
}  // namespace

ConVarTest::ConVarTest() { logRaw("ConVarTest created"); }

void ConVarTest::update() {
    if(!m_ran) {
        m_ran = true;
        runTests();

        TEST_PRINT_RESULTS("ConVarTest");

        this->shutdown(m_failures > 0 ? 1 : 0);
    }
}

void ConVarTest::runTests() {
    TEST_SECTION("defaults");
    {
        TEST_ASSERT_EQ(test_bool.getBool(), false, "bool default");
        TEST_ASSERT_EQ(test_int.getInt(), 5, "int default");
        TEST_ASSERT_EQ(test_int.getString(), "5", "int default as string");
        TEST_ASSERT_EQ(test_float.getFloat(), 0.25f, "float default");
        TEST_ASSERT_EQ(test_string.getString(), "default", "string default");
        TEST_ASSERT(test_int.isDefault(), "untouched convar is default");
        TEST_ASSERT(test_int.canHaveValue(), "variables have values");
        TEST_ASSERT(!test_cmd.canHaveValue(), "commands don't");
        TEST_ASSERT(test_int.getType() == CONVAR_TYPE::INT, "int type");
        TEST_ASSERT(test_bool.getType() == CONVAR_TYPE::BOOL, "bool type");
        TEST_ASSERT(test_float.getType() == CONVAR_TYPE::FLOAT, "float type");
        TEST_ASSERT(test_string.getType() == CONVAR_TYPE::STRING, "string type");
    }

    TEST_SECTION("setValue");
    {
        TEST_ASSERT(test_int.setValue("12"), "int accepts an integer");
        TEST_ASSERT_EQ(test_int.getInt(), 12, "int value");
        TEST_ASSERT(!test_int.isDefault(), "changed convar isn't default");
        TEST_ASSERT(test_int.setValue("3.7"), "int accepts a decimal");
        TEST_ASSERT_EQ(test_int.getInt(), 3, "decimals are truncated");
        TEST_ASSERT_EQ(test_int.getString(), "3", "int string has no decimals");
        TEST_ASSERT(!test_int.setValue("twelve"), "int rejects garbage");
        TEST_ASSERT_EQ(test_int.getInt(), 3, "rejected value leaves the old one");

        TEST_ASSERT(test_bool.setValue("on"), "bool accepts on");
        TEST_ASSERT_EQ(test_bool.getBool(), true, "on is true");
        TEST_ASSERT(test_bool.setValue("FALSE"), "bool accepts FALSE");
        TEST_ASSERT_EQ(test_bool.getBool(), false, "FALSE is false");
        TEST_ASSERT(test_bool.setValue("2"), "bool accepts numbers");
        TEST_ASSERT_EQ(test_bool.getString(), "1", "numbers are normalized to 1");
        TEST_ASSERT(!test_bool.setValue("maybe"), "bool rejects garbage");

        TEST_ASSERT(test_float.setValue(" 1.5 "), "float accepts surrounding whitespace");
        TEST_ASSERT_EQ(test_float.getFloat(), 1.5f, "float value");
        TEST_ASSERT(!test_float.setValue("inf"), "float rejects infinity");
        TEST_ASSERT(!test_float.setValue(""), "float rejects nothing");

        TEST_ASSERT(test_string.setValue("anything goes"), "string accepts anything");
        TEST_ASSERT_EQ(test_string.getString(), "anything goes", "string value");

        test_int.setValue(-4.9);
        TEST_ASSERT_EQ(test_int.getInt(), -4, "numeric int set truncates");

        TEST_ASSERT(!test_int.setValue("99999999999"), "int rejects values past the int range");
        TEST_ASSERT(!test_int.setValue("-99999999999"), "int rejects values below the int range");
        TEST_ASSERT(!test_int.setValue("1e20"), "int rejects huge decimals");
        TEST_ASSERT(!test_int.setValue("nan"), "int rejects nan");
        TEST_ASSERT_EQ(test_int.getInt(), -4, "out of range values leave the old one");
        TEST_ASSERT(test_int.setValue("2147483647"), "int accepts the largest int");
        TEST_ASSERT_EQ(test_int.getInt(), 2147483647, "largest int value");

        test_int.setValue(1e20);
        TEST_ASSERT_EQ(test_int.getInt(), 2147483647, "numeric int set saturates");
        test_int.setValue(-1e20);
        TEST_ASSERT_EQ(test_int.getInt(), (-2147483647 - 1), "numeric int set saturates downwards");
        test_int.setValue(std::nan(""));
        TEST_ASSERT_EQ(test_int.getInt(), (-2147483647 - 1), "numeric int set ignores nan");

        TEST_ASSERT(!SString::to_int("1e30").has_value(), "to_int rejects values past i64");
        TEST_ASSERT(SString::to_int("3.0").value_or(0) == 3, "to_int accepts whole decimals");

        test_int.resetDefaults();
        test_bool.resetDefaults();
        test_float.resetDefaults();
        test_string.resetDefaults();
        TEST_ASSERT(test_int.isDefault() && test_bool.isDefault() && test_float.isDefault() && test_string.isDefault(),
                    "resetDefaults restores defaults");
    }

    TEST_SECTION("change callbacks");
    {
        s_numFloatChanges = 0;
        (void)test_float.setValue("2.5");
        TEST_ASSERT_EQ(s_numFloatChanges, 1, "callback fires on change");
        TEST_ASSERT_EQ(s_lastFloatChange, 2.5f, "callback gets the new value");
        (void)test_float.setValue("2.5");
        TEST_ASSERT_EQ(s_numFloatChanges, 1, "callback doesn't fire without a change");
        (void)test_float.setValue("nope");
        TEST_ASSERT_EQ(s_numFloatChanges, 1, "callback doesn't fire on a rejected value");
        test_float.resetDefaults();
        TEST_ASSERT_EQ(s_numFloatChanges, 2, "callback fires on reset");
    }

    TEST_SECTION("ConVarHandler");
    {
        TEST_ASSERT(cvars().getConVarByName("test_int") == &test_int, "lookup by name");
        TEST_ASSERT(cvars().getConVarByName("spinner_max_rpm") == &cv::spinner_max_rpm, "gameplay convars registered");
        TEST_ASSERT(cvars().getConVarByName("exec") == &cv::cmd::exec, "builtin commands registered");
        TEST_ASSERT(cvars().getConVarByName("does_not_exist", false) == nullptr, "unknown name is nullptr");

        // hidden convars don't show up in searches
        const auto matches = cvars().getConVarByLetter("spinner_");
        TEST_ASSERT(std::ranges::find(matches, &cv::spinner_tick_score) != matches.end(), "prefix search");
        TEST_ASSERT(cvars().getConVarByLetter("test_").empty(), "hidden convars aren't listed");

        (void)test_int.setValue("99");
        const auto nonDefault = cvars().getNonDefaultCvars(cv::CLIENT);
        TEST_ASSERT(std::ranges::find(nonDefault, &test_int) != nonDefault.end(), "changed convar is non-default");
        TEST_ASSERT(std::ranges::find(nonDefault, &test_bool) == nonDefault.end(), "untouched convar is default");
        test_int.resetDefaults();

        TEST_ASSERT_EQ(ConVarHandler::flagsToString(cv::CLIENT | cv::NOLOAD), "client noload", "flag names");
        TEST_ASSERT_EQ(ConVarHandler::flagsToString(0), "no flags", "no flags");
    }

    TEST_SECTION("Console::processCommand");
    {
        TEST_ASSERT(Console::processCommand("test_int 7"), "set a value");
        TEST_ASSERT_EQ(test_int.getInt(), 7, "value applied");
        TEST_ASSERT(!Console::processCommand("no_such_convar 1"), "unknown convar fails");
        TEST_ASSERT(!Console::processCommand("   "), "empty command fails");
        TEST_ASSERT(!Console::processCommand("test_int seven"), "bad value fails");
        TEST_ASSERT_EQ(test_int.getInt(), 7, "bad value is ignored");

        TEST_ASSERT(Console::processCommand("test_int 8; test_bool 1"), "multiple commands");
        TEST_ASSERT(test_int.getInt() == 8 && test_bool.getBool(), "both applied");

        TEST_ASSERT(Console::processCommand("test_cmd hello world"), "command with arguments");
        TEST_ASSERT_EQ(s_lastArgs, "hello world", "arguments passed through");

        TEST_ASSERT(!Console::processCommand("test_noload 1", true), "noload convar can't be set from files");
        TEST_ASSERT_EQ(test_noload.getInt(), 0, "noload value untouched");
        TEST_ASSERT(Console::processCommand("test_noload 1"), "noload convar can be set directly");
        TEST_ASSERT_EQ(test_noload.getInt(), 1, "noload value set");

        test_int.resetDefaults();
        test_bool.resetDefaults();
        test_noload.resetDefaults();
    }

    TEST_SECTION("Console::execConfigFile");
    {
        namespace fs = std::filesystem;
        std::error_code ec;
        const fs::path cfgPath = fs::temp_directory_path(ec) / "spintrack_convartest.cfg";
        TEST_ASSERT(!ec, "temp directory available");
        {
            std::ofstream cfg(cfgPath);
            cfg << "// test config\n"
                << "test_int 42 // trailing comment\n"
                << "\n"
                << "   test_string   from file  \n"
                << "test_noload 5\n"
                << "no_such_convar 1\n"
                << "test_float 0.5\n";
        }

        Console::execConfigFile(cfgPath.string());
        TEST_ASSERT_EQ(test_int.getInt(), 42, "value read from file");
        TEST_ASSERT_EQ(test_string.getString(), "from file", "whitespace around values is trimmed");
        TEST_ASSERT_EQ(test_float.getFloat(), 0.5f, "later lines still applied after a bad one");
        TEST_ASSERT_EQ(test_noload.getInt(), 0, "noload convar skipped");

        test_int.resetDefaults();
        test_string.resetDefaults();
        test_float.resetDefaults();

        // same thing without the extension
        std::string withoutExtension = cfgPath.string();
        withoutExtension.resize(withoutExtension.size() - 4);
        Console::execConfigFile(withoutExtension);
        TEST_ASSERT_EQ(test_int.getInt(), 42, ".cfg is appended");

        test_int.resetDefaults();
        test_string.resetDefaults();
        test_float.resetDefaults();
        fs::remove(cfgPath, ec);

        Console::execConfigFile(cfgPath.string());
        TEST_ASSERT(test_int.isDefault(), "missing file changes nothing");

        // through the exec command, like from the command line
        TEST_ASSERT(Console::processCommand("exec spintrack_convartest_missing"), "exec command runs");
    }

    TEST_SECTION("gameplay convars");
    {
        TEST_ASSERT(Console::processCommand("spinner_tick_score 150"), "set tick score");
        TEST_ASSERT_EQ(SpinnerRules::getTickScore(SpinnerTickKind::NORMAL), 150, "tick score follows the convar");
        cv::spinner_tick_score.resetDefaults();

        TEST_ASSERT(Console::processCommand("spinner_min_rps_fudge 1.2"), "set spin rate");
        TEST_ASSERT_EQ(SpinnerRules::getSpinnerSpinsRequired(2500, 5.0f), 15, "spins required follows the convar");
        cv::spinner_min_rps_fudge.resetDefaults();
        TEST_ASSERT_EQ(SpinnerRules::getSpinnerSpinsRequired(2500, 5.0f), 7, "back to default");

        TEST_ASSERT(Console::processCommand("spinner_max_rotations_per_second 2"), "lower the max spin rate");
        TEST_ASSERT_EQ(SpinnerRules::getSpinnerMaximumBonusSpins(2500, 5.0f), 0, "bonus spins never go negative");
        cv::spinner_max_rotations_per_second.resetDefaults();
    }
}

}  // namespace Spintrack::Tests

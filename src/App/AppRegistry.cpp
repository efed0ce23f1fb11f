// Copyright (c) 2026, WH, All rights reserved.
#include "AppDescriptor.h"

#include "SpinnerSimulator.h"
#include "SpinTrackerTest.h"
#include "SpinnerTest.h"
#include "ConVarTest.h"

#include <array>

namespace Spintrack {

static constexpr std::array sDescriptors{
    AppDescriptor{"SpinnerSimulator", [] -> App * { return new SpinnerSimulator(); }},
    AppDescriptor{"SpinTrackerTest", [] -> App * { return new Spintrack::Tests::SpinTrackerTest(); }},
    AppDescriptor{"SpinnerTest", [] -> App * { return new Spintrack::Tests::SpinnerTest(); }},
    AppDescriptor{"ConVarTest", [] -> App * { return new Spintrack::Tests::ConVarTest(); }},
};

std::span<const AppDescriptor> getAllAppDescriptors() { return sDescriptors; }
const AppDescriptor &getDefaultAppDescriptor() { return sDescriptors[0]; }

}  // namespace Spintrack

#pragma once
// Copyright (c) 2026, WH, All rights reserved.
#include "BaseEnvironment.h"

#include <span>

class App;

namespace Spintrack {

struct AppDescriptor {
    const char *name;
    App *(*create)();
};

// every app that can be selected with -testapp <name>
std::span<const AppDescriptor> getAllAppDescriptors();

// used when no (or an unknown) -testapp is given
const AppDescriptor &getDefaultAppDescriptor();

}  // namespace Spintrack

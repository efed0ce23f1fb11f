#pragma once
// Copyright (c) 2026, WH, All rights reserved.
#include "BaseEnvironment.h"

// base class for everything main() can run (the simulator and the test apps)
// update() is called in a loop until the app shuts itself down
class App {
    NOCOPY_NOMOVE(App)
   public:
    App() = default;
    virtual ~App() = default;

    virtual void update() = 0;

    [[nodiscard]] inline bool isShuttingDown() const { return this->bShuttingDown; }
    [[nodiscard]] inline int getExitCode() const { return this->iExitCode; }

   protected:
    inline void shutdown(int exitCode = 0) {
        this->bShuttingDown = true;
        this->iExitCode = exitCode;
    }

   private:
    int iExitCode{0};
    bool bShuttingDown{false};
};

// Copyright (c) 2026, WH, All rights reserved.
#pragma once
#include "App.h"

namespace Spintrack::Tests {

class SpinTrackerTest : public App {
    NOCOPY_NOMOVE(SpinTrackerTest)
   public:
    SpinTrackerTest();
    ~SpinTrackerTest() override = default;

    void update() override;

   private:
    void runTests();

    int m_passes = 0;
    int m_failures = 0;
    bool m_ran = false;
};

}  // namespace Spintrack::Tests

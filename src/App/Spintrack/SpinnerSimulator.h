#pragma once
// Copyright (c) 2026, WH, All rights reserved.
#include "App.h"
#include "Spinner.h"
#include "SpinnerScore.h"

#include <memory>

// plays a single spinner frame by frame (configured through the sim_* convars)
// and logs every event and the final result
class SpinnerSimulator final : public App {
    NOCOPY_NOMOVE(SpinnerSimulator)
   public:
    SpinnerSimulator();
    ~SpinnerSimulator() override = default;

    void update() override;

   private:
    [[nodiscard]] SpinnerInput getInput(i32 curPos) const;
    void printResults();

    std::unique_ptr<Spinner> spinner;
    SpinnerScore score;

    f64 dFrameTime;
    f64 dCurTime;
    i32 iLastStatusTime;
    bool bRewound{false};
};

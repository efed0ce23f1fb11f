#pragma once
// Copyright (c) 2016, PG, All rights reserved.

#include "BaseEnvironment.h"
#include "SpinnerTicks.h"

#include <type_traits>

class SpinnerRules {
   public:
    // OD 5 -> mid, linear towards min (OD 0) and max (OD 10)
    template <typename T>
    static forceinline T mapDifficultyRange(T scaledDiff, T min, T mid, T max)
        requires(std::is_same_v<T, float> || std::is_same_v<T, double>)
    {
        if(scaledDiff == (T)5.)
            return mid;
        else if(scaledDiff > (T)5.)
            return mid + (max - mid) * (scaledDiff - (T)5.) / (T)5.;
        else
            return mid - (mid - min) * ((T)5. - scaledDiff) / (T)5.;
    }

    //*******************//
    //	Spinner Timing   //
    //*******************//

    // minimum spins per second the player has to keep up to clear a spinner
    static float getSpinnerSpinsPerSecond(float OD);

    // whole spins needed for a full clear, at least 1
    static i32 getSpinnerSpinsRequired(i32 spinnerDuration, float OD);

    // whole spins possible above the requirement at the max allowed spin rate
    static i32 getSpinnerMaximumBonusSpins(i32 spinnerDuration, float OD);

    // spinsRequired normal ticks followed by maximumBonusSpins bonus ticks
    static SpinnerTicks createSpinnerTicks(i32 spinsRequired, i32 maximumBonusSpins);

    //*****************//
    //	Score Values   //
    //*****************//

    static i32 getTickScore(SpinnerTickKind kind);
    static i32 getJudgementScore(SpinnerJudgement judgement);

    // same weighting as regular hitobjects (300 = 1, 100 = 1/3, 50 = 1/6)
    static float calculateAccuracy(int num300s, int num100s, int num50s, int numMisses);
};

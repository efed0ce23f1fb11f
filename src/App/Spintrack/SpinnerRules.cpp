// Copyright (c) 2016, PG, All rights reserved.

#include "SpinnerRules.h"

#include "SpintrackConVars.h"

#include <algorithm>
#include <cmath>

float SpinnerRules::getSpinnerSpinsPerSecond(float OD) {
    return cv::spinner_min_rps_fudge.getFloat() * mapDifficultyRange(OD, 3.0f, 5.0f, 7.5f);
}

i32 SpinnerRules::getSpinnerSpinsRequired(i32 spinnerDuration, float OD) {
    const float secondsDuration = (float)spinnerDuration / 1000.0f;
    return std::max(1, (i32)(secondsDuration * getSpinnerSpinsPerSecond(OD)));
}

i32 SpinnerRules::getSpinnerMaximumBonusSpins(i32 spinnerDuration, float OD) {
    const float secondsDuration = (float)spinnerDuration / 1000.0f;
    const float maxRotationsPerSecond = cv::spinner_max_rotations_per_second.getFloat();
    return std::max(0, (i32)((maxRotationsPerSecond - getSpinnerSpinsPerSecond(OD)) * secondsDuration));
}

SpinnerTicks SpinnerRules::createSpinnerTicks(i32 spinsRequired, i32 maximumBonusSpins) {
    SpinnerTicks ticks;
    ticks.reserve(std::max(0, spinsRequired) + std::max(0, maximumBonusSpins));

    for(i32 i = 0; i < spinsRequired; i++) {
        ticks.push_back(SpinnerTick{.kind = SpinnerTickKind::NORMAL});
    }
    for(i32 i = 0; i < maximumBonusSpins; i++) {
        ticks.push_back(SpinnerTick{.kind = SpinnerTickKind::BONUS});
    }

    return ticks;
}

i32 SpinnerRules::getTickScore(SpinnerTickKind kind) {
    switch(kind) {
        case SpinnerTickKind::NORMAL:
            return cv::spinner_tick_score.getInt();
        case SpinnerTickKind::BONUS:
            return cv::spinner_bonus_tick_score.getInt();
    }
    return 0;
}

i32 SpinnerRules::getJudgementScore(SpinnerJudgement judgement) {
    switch(judgement) {
        case SpinnerJudgement::GREAT:
            return 300;
        case SpinnerJudgement::GOOD:
            return 100;
        case SpinnerJudgement::MEH:
            return 50;
        case SpinnerJudgement::MISS:
        case SpinnerJudgement::PENDING:
            return 0;
    }
    return 0;
}

float SpinnerRules::calculateAccuracy(int num300s, int num100s, int num50s, int numMisses) {
    const float totalHitPoints = num50s * (1.0f / 6.0f) + num100s * (2.0f / 6.0f) + num300s;
    const float totalNumHits = numMisses + num50s + num100s + num300s;

    if(totalNumHits > 0.0f) return (totalHitPoints / totalNumHits);

    return 0.0f;
}

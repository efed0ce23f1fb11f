#pragma once
// Copyright (c) 2026, WH, All rights reserved.
#include "SpinnerTicks.h"

#include <string>
#include <vector>

enum class SpinnerEventType : u8 {
    TICK_HIT,     // a whole spin consumed a tick
    TICK_MISS,    // a tick was left over when the spinner ended
    BONUS_COUNT,  // a bonus tick was hit, bonusCount is the new display value
    COMPLETE,     // progress reached 100% (at most once per spinner)
    JUDGEMENT,    // final result, always the last event of a spinner
};

struct SpinnerEvent {
    SpinnerEventType type;
    i32 time{0};

    // TICK_HIT, TICK_MISS, BONUS_COUNT
    i32 tickIndex{-1};
    SpinnerTickKind tickKind{SpinnerTickKind::NORMAL};

    // BONUS_COUNT
    i32 bonusCount{0};

    // JUDGEMENT
    SpinnerJudgement judgement{SpinnerJudgement::PENDING};
};

// everything that happened during one update, in order
using SpinnerEvents = std::vector<SpinnerEvent>;

[[nodiscard]] std::string_view eventTypeToString(SpinnerEventType type);
[[nodiscard]] std::string eventToString(const SpinnerEvent &event);

#pragma once
// Copyright (c) 2026, WH, All rights reserved.
#include "BaseEnvironment.h"

#include <string_view>
#include <vector>

// one tick per whole spin; the first spinsRequired ticks are normal ones,
// every spin beyond that lands on a bonus tick
enum class SpinnerTickKind : u8 {
    NORMAL,
    BONUS,
};

struct SpinnerTick {
    SpinnerTickKind kind{SpinnerTickKind::NORMAL};

    // consumed ticks are never handed out again, hit says how they were consumed
    bool consumed{false};
    bool hit{false};

    [[nodiscard]] inline bool isBonus() const { return this->kind == SpinnerTickKind::BONUS; }
};

// created once per spinner, never resized afterwards
using SpinnerTicks = std::vector<SpinnerTick>;

enum class SpinnerJudgement : u8 {
    PENDING,
    MISS,
    MEH,
    GOOD,
    GREAT,
};

[[nodiscard]] constexpr std::string_view judgementToString(SpinnerJudgement judgement) {
    switch(judgement) {
        case SpinnerJudgement::PENDING:
            return "pending";
        case SpinnerJudgement::MISS:
            return "miss";
        case SpinnerJudgement::MEH:
            return "meh";
        case SpinnerJudgement::GOOD:
            return "good";
        case SpinnerJudgement::GREAT:
            return "great";
    }
    return "?";
}

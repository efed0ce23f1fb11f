// Copyright (c) 2026, WH, All rights reserved.
#include "SpinnerEvents.h"

#include "fmt/format.h"

std::string_view eventTypeToString(SpinnerEventType type) {
    switch(type) {
        case SpinnerEventType::TICK_HIT:
            return "tick_hit";
        case SpinnerEventType::TICK_MISS:
            return "tick_miss";
        case SpinnerEventType::BONUS_COUNT:
            return "bonus_count";
        case SpinnerEventType::COMPLETE:
            return "complete";
        case SpinnerEventType::JUDGEMENT:
            return "judgement";
    }
    return "?";
}

std::string eventToString(const SpinnerEvent &event) {
    switch(event.type) {
        case SpinnerEventType::TICK_HIT:
        case SpinnerEventType::TICK_MISS:
            return fmt::format("[{:d}] {:s} #{:d} ({:s})", event.time, eventTypeToString(event.type), event.tickIndex,
                               event.tickKind == SpinnerTickKind::BONUS ? "bonus" : "normal");
        case SpinnerEventType::BONUS_COUNT:
            return fmt::format("[{:d}] {:s} {:d} (tick #{:d})", event.time, eventTypeToString(event.type),
                               event.bonusCount, event.tickIndex);
        case SpinnerEventType::COMPLETE:
            return fmt::format("[{:d}] {:s}", event.time, eventTypeToString(event.type));
        case SpinnerEventType::JUDGEMENT:
            return fmt::format("[{:d}] {:s} {:s}", event.time, eventTypeToString(event.type),
                               judgementToString(event.judgement));
    }
    return {};
}

// Copyright (c) 2026, WH, All rights reserved.
#include "SpinProgressTracker.h"

#include "Logging.h"
#include "SpintrackConVars.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>

std::optional<SpinProgressTracker> SpinProgressTracker::create(SpinnerTicks *ticks, i32 spinsRequired, i32 startTime,
                                                               i32 endTime) {
    if(ticks == nullptr) {
        debugLog("ERROR: no tick list for spinner at {:d}", startTime);
        return std::nullopt;
    }
    if(spinsRequired < 1) {
        debugLog("ERROR: spinner at {:d} requires {:d} spins (must be at least 1)", startTime, spinsRequired);
        return std::nullopt;
    }
    if(endTime < startTime) {
        debugLog("ERROR: spinner ends before it starts ({:d} < {:d})", endTime, startTime);
        return std::nullopt;
    }

    return SpinProgressTracker(ticks, spinsRequired, startTime, endTime);
}

SpinProgressTracker::SpinProgressTracker(SpinnerTicks *ticks, i32 spinsRequired, i32 startTime, i32 endTime)
    : ticks(ticks), iSpinsRequired(spinsRequired), iStartTime(startTime), iEndTime(endTime) {}

f32 SpinProgressTracker::getProgress() const {
    return std::clamp(this->fCumulativeRotation / 360.0f / (f32)this->iSpinsRequired, 0.0f, 1.0f);
}

SpinnerEvents SpinProgressTracker::update(i32 curPos, f32 cumulativeRotation, bool userTriggered) {
    SpinnerEvents events;
    this->fCumulativeRotation = cumulativeRotation;

    this->updateBonusScore(curPos, events);
    this->checkForResult(curPos, userTriggered, events);

    return events;
}

void SpinProgressTracker::updateBonusScore(i32 curPos, SpinnerEvents &events) {
    if(this->ticks->empty()) return;

    // negative rotation can't undo more than everything, huge rotation saturates
    const f64 wholeSpins = std::floor((f64)this->fCumulativeRotation / 360.0);
    const i32 spins = (i32)std::clamp(wholeSpins, 0.0, (f64)std::numeric_limits<i32>::max());

    if(spins < this->iWholeSpins) {
        // rewound: only move the counter back, ticks that were already hit stay hit
        logIfCV(debug_spinner, "spinner at {:d}: rewound from {:d} to {:d} whole spins", this->iStartTime,
                this->iWholeSpins, spins);
        this->iWholeSpins = spins;
        return;
    }

    while(this->iWholeSpins != spins) {
        auto tick = std::ranges::find_if(*this->ticks, [](const SpinnerTick &t) { return !t.consumed; });
        if(tick == this->ticks->end()) {
            logIfCV(debug_spinner, "spinner at {:d}: out of ticks at {:d}/{:d} whole spins", this->iStartTime,
                    this->iWholeSpins, spins);
            break;
        }

        tick->consumed = true;
        tick->hit = true;

        const i32 tickIndex = (i32)std::distance(this->ticks->begin(), tick);
        events.push_back(SpinnerEvent{
            .type = SpinnerEventType::TICK_HIT, .time = curPos, .tickIndex = tickIndex, .tickKind = tick->kind});

        if(tick->isBonus()) {
            events.push_back(SpinnerEvent{.type = SpinnerEventType::BONUS_COUNT,
                                          .time = curPos,
                                          .tickIndex = tickIndex,
                                          .tickKind = tick->kind,
                                          .bonusCount = spins - this->iSpinsRequired});
        }

        logIfCV(debug_spinner, "spinner at {:d}: hit {:s} tick #{:d} (spin {:d})", this->iStartTime,
                tick->isBonus() ? "bonus" : "normal", tickIndex, this->iWholeSpins + 1);

        this->iWholeSpins++;
    }
}

void SpinProgressTracker::checkForResult(i32 curPos, bool userTriggered, SpinnerEvents &events) {
    if(this->isJudged() || curPos < this->iStartTime) return;

    if(this->getProgress() >= 1.0f && !this->bComplete) {
        this->bComplete = true;
        events.push_back(SpinnerEvent{.type = SpinnerEventType::COMPLETE, .time = curPos});
        logIfCV(debug_spinner, "spinner at {:d}: complete at {:d}", this->iStartTime, curPos);
    }

    if(userTriggered || curPos < this->iEndTime) return;

    // nothing may stay unresolved once the spinner is over
    for(i32 i = 0; i < (i32)this->ticks->size(); i++) {
        SpinnerTick &tick = (*this->ticks)[i];
        if(tick.consumed) continue;

        tick.consumed = true;
        tick.hit = false;
        events.push_back(
            SpinnerEvent{.type = SpinnerEventType::TICK_MISS, .time = curPos, .tickIndex = i, .tickKind = tick.kind});
    }

    this->judgement = this->classify(curPos);
    events.push_back(SpinnerEvent{.type = SpinnerEventType::JUDGEMENT, .time = curPos, .judgement = this->judgement});

    logIfCV(debug_spinner, "spinner at {:d}: judged {:s} at {:d} (progress {:.3f}, {:d}/{:d} spins)", this->iStartTime,
            judgementToString(this->judgement), curPos, this->getProgress(), this->iWholeSpins, this->iSpinsRequired);
}

SpinnerJudgement SpinProgressTracker::classify(i32 curPos) const {
    const f32 progress = this->getProgress();

    if(progress >= 1.0f) return SpinnerJudgement::GREAT;
    if(progress > 0.9f) return SpinnerJudgement::GOOD;
    if(progress > 0.75f) return SpinnerJudgement::MEH;

    // only ever called at or after the end, so this always applies
    if(curPos >= this->iEndTime) return SpinnerJudgement::MISS;

    return SpinnerJudgement::PENDING;
}

void SpinProgressTracker::reset() {
    this->fCumulativeRotation = 0.0f;
    this->iWholeSpins = 0;
    this->bComplete = false;
    this->judgement = SpinnerJudgement::PENDING;
}

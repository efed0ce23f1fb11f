// Copyright (c) 2015, PG, All rights reserved.
#include "Spinner.h"

#include "Logging.h"
#include "SpinnerRules.h"
#include "SpintrackConVars.h"

#include <algorithm>
#include <utility>

std::unique_ptr<Spinner> Spinner::create(i32 startTime, i32 endTime, f32 OD, vec2 rawPos) {
    const i32 duration = endTime - startTime;
    if(duration <= 0) {
        debugLog("ERROR: invalid spinner {:d} -> {:d} (duration {:d})", startTime, endTime, duration);
        return nullptr;
    }

    const i32 spinsRequired = SpinnerRules::getSpinnerSpinsRequired(duration, OD);
    const i32 maxBonusSpins = SpinnerRules::getSpinnerMaximumBonusSpins(duration, OD);

    std::unique_ptr<Spinner> spinner{
        new Spinner(startTime, duration, OD, rawPos, SpinnerRules::createSpinnerTicks(spinsRequired, maxBonusSpins))};

    // the tracker points into spinner->ticks, so only create it once the spinner is in its final place
    spinner->tracker = SpinProgressTracker::create(&spinner->ticks, spinsRequired, startTime, endTime);
    if(!spinner->tracker.has_value()) return nullptr;

    logIfCV(debug_spinner, "spinner at {:d}: {:d}ms, OD {:.1f}, {:d} spins required, {:d} bonus ticks", startTime,
            duration, OD, spinsRequired, maxBonusSpins);

    return spinner;
}

Spinner::Spinner(i32 startTime, i32 duration, f32 OD, vec2 rawPos, SpinnerTicks ticks)
    : ticks(std::move(ticks)),
      disc(std::make_unique<SpinnerDisc>(duration, rawPos)),
      iStartTime(startTime),
      iDuration(duration),
      fOD(OD),
      vRawPos(rawPos) {}

SpinnerEvents Spinner::update(i32 curPos, f64 frame_time, const SpinnerInput &input, bool userTriggered) {
    if(this->isFinished()) return {};

    if(curPos < this->getEndTime()) {
        this->disc->update(curPos, this->iStartTime, frame_time, input, this->bAutoplay, this->fSpeedMultiplier);
    }

    return this->tracker->update(curPos, this->disc->getCumulativeRotation(), userTriggered);
}

void Spinner::onReset(i32 curPos) {
    this->disc->reset();

    if(curPos < this->iStartTime || (this->isFinished() && curPos < this->getEndTime())) {
        // back to how create() left it
        for(auto &tick : this->ticks) {
            tick.consumed = false;
            tick.hit = false;
        }
        this->tracker->reset();

        logIfCV(debug_spinner, "spinner at {:d}: rebuilt (seek to {:d})", this->iStartTime, curPos);
        return;
    }

    // the tracker sees the rotation drop on the next update and snaps back by itself
    logIfCV(debug_spinner, "spinner at {:d}: disc reset (seek to {:d})", this->iStartTime, curPos);
}

void Spinner::seekRotation(f32 degrees) {
    degrees = std::max(degrees, 0.0f);
    this->disc->setCumulativeRotation(degrees);
    this->tracker->setCumulativeRotation(degrees);
}

f32 Spinner::getTargetScale(f32 relativeScale) const {
    return relativeScale + (1.0f - relativeScale) * this->getProgress();
}

vec2 Spinner::getAutoCursorPos(i32 curPos, f32 radius) const {
    return this->disc->getAutoCursorPos(std::min(curPos, this->getEndTime()), this->iStartTime, radius);
}

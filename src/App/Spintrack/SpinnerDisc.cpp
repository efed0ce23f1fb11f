// Copyright (c) 2015, PG, All rights reserved.
#include "SpinnerDisc.h"

#include "SpintrackConVars.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr f32 AUTO_MULTIPLIER = (1.0f / 20.0f);
}

SpinnerDisc::SpinnerDisc(i32 duration, vec2 center) : vCenter(center) {
    int minVel = 12;
    int maxVel = 48;
    int minTime = 2000;
    int maxTime = 5000;
    this->iMaxStoredDeltaAngles = std::clamp<int>(
        (int)((duration - minTime) * (maxVel - minVel) / (maxTime - minTime) + minVel), minVel, maxVel);
    this->storedDeltaAngles = std::make_unique<f32[]>(this->iMaxStoredDeltaAngles);
}

void SpinnerDisc::update(i32 curPos, i32 startTime, f64 frame_time, const SpinnerInput &input, bool autoplay,
                         f32 speedMultiplier) {
    // Skip calculations
    if(frame_time <= 0.0) return;

    const f32 DELTA_UPDATE_TIME = (f32)(frame_time * 1000.0);

    // handle auto, mouse spinning movement
    f32 angleDiff = 0;
    if(autoplay) {
        angleDiff = (f32)(frame_time * 1000.0) * AUTO_MULTIPLIER * speedMultiplier;
    } else {
        const vec2 mouseDelta = input.cursorPos - this->vCenter;
        const auto currentMouseAngle = (f32)std::atan2(mouseDelta.y, mouseDelta.x);

        // nothing to compare against on the very first sample
        if(!this->bHasLastMouseAngle) {
            this->fLastMouseAngle = currentMouseAngle;
            this->bHasLastMouseAngle = true;
        }

        angleDiff = (currentMouseAngle - this->fLastMouseAngle);

        if(std::abs(angleDiff) > 0.001f)
            this->fLastMouseAngle = currentMouseAngle;
        else
            angleDiff = 0;
    }

    if(curPos < startTime) return;

    const bool isSpinning = input.held || autoplay;

    this->fDeltaOverflow += DELTA_UPDATE_TIME;

    // always take the short way round
    if(angleDiff < -PI)
        angleDiff += 2 * PI;
    else if(angleDiff > PI)
        angleDiff -= 2 * PI;

    if(isSpinning) this->fDeltaAngleOverflow += angleDiff;

    const f32 maxRPM = cv::spinner_max_rpm.getFloat();

    while(this->fDeltaOverflow >= DELTA_UPDATE_TIME) {
        // spin caused by the cursor
        f32 deltaAngle = 0;
        if(isSpinning) {
            deltaAngle = this->fDeltaAngleOverflow * DELTA_UPDATE_TIME / this->fDeltaOverflow;
            this->fDeltaAngleOverflow -= deltaAngle;
        }

        this->fDeltaOverflow -= DELTA_UPDATE_TIME;

        this->fSumDeltaAngle -= this->storedDeltaAngles[this->iDeltaAngleIndex];
        this->fSumDeltaAngle += deltaAngle;
        this->storedDeltaAngles[this->iDeltaAngleIndex++] = deltaAngle;
        this->iDeltaAngleIndex %= this->iMaxStoredDeltaAngles;

        const f32 rotationAngle = this->fSumDeltaAngle / (f32)this->iMaxStoredDeltaAngles;
        const f32 rotationPerSec = rotationAngle * (1000.0f / DELTA_UPDATE_TIME) / (2.0f * PI);

        const f32 decay = std::pow(0.01f, (f32)frame_time);
        this->fRPM = this->fRPM * decay + (1.0f - decay) * std::abs(rotationPerSec) * 60.0f;
        this->fRPM = std::min(this->fRPM, maxRPM);

        if(std::abs(rotationAngle) > 0.0001f) this->rotate(rotationAngle);
    }
}

void SpinnerDisc::rotate(f32 rad) {
    this->fDrawRot += glm::degrees(rad);
    this->fRotations += glm::degrees(std::abs(rad));
}

void SpinnerDisc::reset() {
    this->fRPM = 0.0f;
    this->fDrawRot = 0.0f;
    this->fRotations = 0.0f;
    this->fDeltaOverflow = 0.0f;
    this->fSumDeltaAngle = 0.0f;
    this->iDeltaAngleIndex = 0;
    this->fDeltaAngleOverflow = 0.0f;
    this->fLastMouseAngle = 0.0f;
    this->bHasLastMouseAngle = false;

    for(int i = 0; i < this->iMaxStoredDeltaAngles; i++) {
        this->storedDeltaAngles[i] = 0.0f;
    }
}

vec2 SpinnerDisc::getAutoCursorPos(i32 curPos, i32 startTime, f32 radius) const {
    const f32 delta = (f32)std::max(0, curPos - startTime);
    const f32 angle = (delta * AUTO_MULTIPLIER) - PI / 2.0f;
    return vec2(this->vCenter.x + radius * std::cos(angle), this->vCenter.y + radius * std::sin(angle));
}

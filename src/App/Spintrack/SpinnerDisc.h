#pragma once
// Copyright (c) 2015, PG, All rights reserved.
#include "BaseEnvironment.h"
#include "Vectors.h"

#include <memory>

// what the player is doing this frame
struct SpinnerInput {
    vec2 cursorPos{0.f, 0.f};
    bool held{false};
};

// the spinning disc itself: turns cursor movement around the center into rotation
class SpinnerDisc {
    NOCOPY_NOMOVE(SpinnerDisc)
   public:
    SpinnerDisc(i32 duration, vec2 center);
    ~SpinnerDisc() = default;

    // autoplay: spin on its own at a fixed rate (scaled by speedMultiplier), cursor is ignored
    void update(i32 curPos, i32 startTime, f64 frame_time, const SpinnerInput &input, bool autoplay = false,
                f32 speedMultiplier = 1.0f);
    void reset();

    // where an automatic cursor would be, circling the center at radius
    [[nodiscard]] vec2 getAutoCursorPos(i32 curPos, i32 startTime, f32 radius) const;

    // seeking restores the total, the smoothing window starts over
    inline void setCumulativeRotation(f32 degrees) { this->fRotations = degrees; }

    // total |rotation| in degrees, never decreases while playing
    [[nodiscard]] inline f32 getCumulativeRotation() const { return this->fRotations; }

    // signed, in degrees (for drawing)
    [[nodiscard]] inline f32 getDrawRotation() const { return this->fDrawRot; }

    [[nodiscard]] inline f32 getRPM() const { return this->fRPM; }
    [[nodiscard]] inline i32 getMaxStoredDeltaAngles() const { return this->iMaxStoredDeltaAngles; }
    [[nodiscard]] inline vec2 getCenter() const { return this->vCenter; }

   private:
    void rotate(f32 rad);

    vec2 vCenter;

    f32 fRPM{0.f};
    f32 fDrawRot{0.f};
    f32 fRotations{0.f};

    // moving average of the last few angle steps
    std::unique_ptr<f32[]> storedDeltaAngles;
    i32 iMaxStoredDeltaAngles;
    i32 iDeltaAngleIndex{0};
    f32 fSumDeltaAngle{0.f};

    f32 fDeltaOverflow{0.f};
    f32 fDeltaAngleOverflow{0.f};

    f32 fLastMouseAngle{0.f};
    bool bHasLastMouseAngle{false};
};

#pragma once
// Copyright (c) 2015, PG, All rights reserved.
#include "SpinProgressTracker.h"
#include "SpinnerDisc.h"

#include <memory>
#include <optional>

// a spinner hitobject: owns its ticks, the disc and the progress tracker
class Spinner final {
    NOCOPY_NOMOVE(Spinner)
   public:
    Spinner() = delete;
    ~Spinner() = default;

    // nullptr (and a log message) if endTime <= startTime
    [[nodiscard]] static std::unique_ptr<Spinner> create(i32 startTime, i32 endTime, f32 OD,
                                                         vec2 rawPos = vec2(256.f, 192.f));

    // disc first, then tick accrual, then the judgement
    // userTriggered: don't judge this frame even if the spinner is over
    SpinnerEvents update(i32 curPos, f64 frame_time, const SpinnerInput &input, bool userTriggered = false);

    // seeking
    // before the start (or back into an already judged spinner) everything is rebuilt,
    // otherwise only the disc starts over and already hit ticks stay hit
    void onReset(i32 curPos);

    // for replays/state correction: jump the disc to a known total rotation
    void seekRotation(f32 degrees);

    inline void setAutoplay(bool autoplay) { this->bAutoplay = autoplay; }
    inline void setSpeedMultiplier(f32 speedMultiplier) { this->fSpeedMultiplier = speedMultiplier; }

    [[nodiscard]] inline i32 getStartTime() const { return this->iStartTime; }
    [[nodiscard]] inline i32 getEndTime() const { return this->iStartTime + this->iDuration; }
    [[nodiscard]] inline i32 getDuration() const { return this->iDuration; }
    [[nodiscard]] inline f32 getOD() const { return this->fOD; }
    [[nodiscard]] inline vec2 getRawPos() const { return this->vRawPos; }

    [[nodiscard]] inline f32 getProgress() const { return this->tracker->getProgress(); }
    [[nodiscard]] inline SpinnerJudgement getJudgement() const { return this->tracker->getJudgement(); }
    [[nodiscard]] inline bool isComplete() const { return this->tracker->isComplete(); }
    [[nodiscard]] inline bool isFinished() const { return this->tracker->isJudged(); }
    [[nodiscard]] inline i32 getSpinsRequired() const { return this->tracker->getSpinsRequired(); }
    [[nodiscard]] inline i32 getWholeSpins() const { return this->tracker->getWholeSpins(); }

    [[nodiscard]] inline f32 getRPM() const { return this->disc->getRPM(); }
    [[nodiscard]] inline f32 getCumulativeRotation() const { return this->disc->getCumulativeRotation(); }
    [[nodiscard]] inline f32 getDrawRotation() const { return this->disc->getDrawRotation(); }

    // grows from relativeScale to 1 as progress goes from 0 to 1
    [[nodiscard]] f32 getTargetScale(f32 relativeScale) const;

    [[nodiscard]] vec2 getAutoCursorPos(i32 curPos, f32 radius) const;

    [[nodiscard]] inline const SpinnerTicks &getTicks() const { return this->ticks; }
    [[nodiscard]] inline const SpinnerDisc &getDisc() const { return *this->disc; }

   private:
    Spinner(i32 startTime, i32 duration, f32 OD, vec2 rawPos, SpinnerTicks ticks);

    SpinnerTicks ticks;
    std::unique_ptr<SpinnerDisc> disc;
    std::optional<SpinProgressTracker> tracker;

    i32 iStartTime;
    i32 iDuration;
    f32 fOD;
    vec2 vRawPos;

    f32 fSpeedMultiplier{1.f};
    bool bAutoplay{false};
};

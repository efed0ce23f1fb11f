#pragma once
// Copyright (c) 2026, WH, All rights reserved.
#include "SpinnerEvents.h"

#include <optional>

// Turns cumulative disc rotation into spinner progress, tick hits and the final judgement.
// Ticks belong to the owning spinner and must outlive the tracker; the tracker only ever
// marks them consumed, it never adds, removes or "unconsumes" them.
class SpinProgressTracker {
   public:
    // nullopt (and a log message) if ticks is null, spinsRequired < 1 or endTime < startTime
    [[nodiscard]] static std::optional<SpinProgressTracker> create(SpinnerTicks *ticks, i32 spinsRequired,
                                                                   i32 startTime, i32 endTime);

    SpinProgressTracker() = delete;

    // runs tick accrual, then judgement classification, for one frame
    // userTriggered: the judgement was requested early (it stays pending, see checkForResult())
    SpinnerEvents update(i32 curPos, f32 cumulativeRotation, bool userTriggered = false);

    // one step of whole-spin tick accrual for the current rotation
    void updateBonusScore(i32 curPos, SpinnerEvents &events);

    // completion flag and, once the spinner has ended, the final judgement
    void checkForResult(i32 curPos, bool userTriggered, SpinnerEvents &events);

    // back to the just-constructed state (ticks are left to the owner)
    void reset();

    inline void setCumulativeRotation(f32 degrees) { this->fCumulativeRotation = degrees; }

    // clamp(rotation / 360 / spinsRequired, 0, 1)
    [[nodiscard]] f32 getProgress() const;

    [[nodiscard]] inline f32 getCumulativeRotation() const { return this->fCumulativeRotation; }
    [[nodiscard]] inline i32 getSpinsRequired() const { return this->iSpinsRequired; }
    [[nodiscard]] inline i32 getWholeSpins() const { return this->iWholeSpins; }
    [[nodiscard]] inline i32 getStartTime() const { return this->iStartTime; }
    [[nodiscard]] inline i32 getEndTime() const { return this->iEndTime; }

    [[nodiscard]] inline bool isComplete() const { return this->bComplete; }
    [[nodiscard]] inline bool isJudged() const { return this->judgement != SpinnerJudgement::PENDING; }
    [[nodiscard]] inline SpinnerJudgement getJudgement() const { return this->judgement; }

   private:
    SpinProgressTracker(SpinnerTicks *ticks, i32 spinsRequired, i32 startTime, i32 endTime);

    [[nodiscard]] SpinnerJudgement classify(i32 curPos) const;

    SpinnerTicks *ticks;

    f32 fCumulativeRotation{0.f};
    i32 iSpinsRequired;
    i32 iStartTime;
    i32 iEndTime;

    // whole spins already turned into tick hits
    i32 iWholeSpins{0};

    bool bComplete{false};
    SpinnerJudgement judgement{SpinnerJudgement::PENDING};
};

#pragma once
// Copyright (c) 2026, WH, All rights reserved.
#include "SpinnerEvents.h"

// tallies spinner events into score points and judgement counts
class SpinnerScore {
   public:
    SpinnerScore() = default;

    void reset();

    void addEvent(const SpinnerEvent &event);
    void addEvents(const SpinnerEvents &events);

    [[nodiscard]] inline u64 getScore() const { return this->iScore; }
    [[nodiscard]] inline u64 getBonusPoints() const { return this->iBonusPoints; }

    [[nodiscard]] inline int getNumTickHits() const { return this->iNumTickHits; }
    [[nodiscard]] inline int getNumBonusHits() const { return this->iNumBonusHits; }
    [[nodiscard]] inline int getNumTickMisses() const { return this->iNumTickMisses; }

    // last "bonus count updated" value, for the bonus counter on screen
    [[nodiscard]] inline int getBonusCount() const { return this->iBonusCount; }

    [[nodiscard]] inline int getNumCompleted() const { return this->iNumCompleted; }

    [[nodiscard]] inline int getNumMisses() const { return this->iNumMisses; }
    [[nodiscard]] inline int getNum50s() const { return this->iNum50s; }
    [[nodiscard]] inline int getNum100s() const { return this->iNum100s; }
    [[nodiscard]] inline int getNum300s() const { return this->iNum300s; }
    [[nodiscard]] inline int getNumJudged() const {
        return this->iNumMisses + this->iNum50s + this->iNum100s + this->iNum300s;
    }

    // 1.0 until something was judged
    [[nodiscard]] float getAccuracy() const;

   private:
    void addJudgement(SpinnerJudgement judgement);

    u64 iScore{0};
    u64 iBonusPoints{0};

    int iNumTickHits{0};
    int iNumBonusHits{0};
    int iNumTickMisses{0};
    int iBonusCount{0};
    int iNumCompleted{0};

    int iNumMisses{0};
    int iNum50s{0};
    int iNum100s{0};
    int iNum300s{0};
};

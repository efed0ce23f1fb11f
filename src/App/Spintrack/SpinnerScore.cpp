// Copyright (c) 2026, WH, All rights reserved.
#include "SpinnerScore.h"

#include "SpinnerRules.h"

void SpinnerScore::reset() {
    this->iScore = 0;
    this->iBonusPoints = 0;

    this->iNumTickHits = 0;
    this->iNumBonusHits = 0;
    this->iNumTickMisses = 0;
    this->iBonusCount = 0;
    this->iNumCompleted = 0;

    this->iNumMisses = 0;
    this->iNum50s = 0;
    this->iNum100s = 0;
    this->iNum300s = 0;
}

void SpinnerScore::addEvents(const SpinnerEvents &events) {
    for(const auto &event : events) {
        this->addEvent(event);
    }
}

void SpinnerScore::addEvent(const SpinnerEvent &event) {
    switch(event.type) {
        case SpinnerEventType::TICK_HIT: {
            const i32 points = SpinnerRules::getTickScore(event.tickKind);
            this->iScore += (u64)points;
            if(event.tickKind == SpinnerTickKind::BONUS) {
                this->iNumBonusHits++;
                this->iBonusPoints += (u64)points;
            } else {
                this->iNumTickHits++;
            }
            break;
        }

        case SpinnerEventType::TICK_MISS:
            this->iNumTickMisses++;
            break;

        case SpinnerEventType::BONUS_COUNT:
            this->iBonusCount = event.bonusCount;
            break;

        case SpinnerEventType::COMPLETE:
            this->iNumCompleted++;
            break;

        case SpinnerEventType::JUDGEMENT:
            this->addJudgement(event.judgement);
            break;
    }
}

void SpinnerScore::addJudgement(SpinnerJudgement judgement) {
    switch(judgement) {
        case SpinnerJudgement::GREAT:
            this->iNum300s++;
            break;
        case SpinnerJudgement::GOOD:
            this->iNum100s++;
            break;
        case SpinnerJudgement::MEH:
            this->iNum50s++;
            break;
        case SpinnerJudgement::MISS:
            this->iNumMisses++;
            break;
        case SpinnerJudgement::PENDING:
            return;
    }

    this->iScore += (u64)SpinnerRules::getJudgementScore(judgement);
}

float SpinnerScore::getAccuracy() const {
    if(this->getNumJudged() == 0) return 1.0f;
    return SpinnerRules::calculateAccuracy(this->iNum300s, this->iNum100s, this->iNum50s, this->iNumMisses);
}

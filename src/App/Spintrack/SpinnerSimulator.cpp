// Copyright (c) 2026, WH, All rights reserved.
#include "SpinnerSimulator.h"

#include "Logging.h"
#include "SpintrackConVars.h"

#include <algorithm>
#include <cmath>

namespace {
// how far the simulated cursor is from the spinner center (osu!pixels)
constexpr f32 CURSOR_RADIUS = 38.4f;

// lead-in before the spinner starts
constexpr i32 PREROLL = 500;

constexpr i32 STATUS_INTERVAL = 500;
}  // namespace

SpinnerSimulator::SpinnerSimulator() {
    const i32 start = cv::sim_spinner_start.getInt();
    const i32 end = start + cv::sim_spinner_duration.getInt();

    this->dFrameTime = std::max(cv::sim_frame_time.getDouble(), 0.001);
    this->dCurTime = (f64)(start - PREROLL);
    this->iLastStatusTime = start - PREROLL;

    this->spinner = Spinner::create(start, end, cv::sim_spinner_od.getFloat());
    if(!this->spinner) {
        debugLog("ERROR: couldn't create the simulated spinner, check sim_spinner_start/sim_spinner_duration");
        this->shutdown(1);
        return;
    }

    this->spinner->setAutoplay(cv::sim_autoplay.getBool());
    this->spinner->setSpeedMultiplier(cv::sim_speed_multiplier.getFloat());

    logRaw("spinner {:d} -> {:d} ms, OD {:.1f}: {:d} spins required, {:d} ticks ({:s}, {:.0f} fps)", start, end,
           this->spinner->getOD(), this->spinner->getSpinsRequired(), this->spinner->getTicks().size(),
           cv::sim_autoplay.getBool() ? "autoplay" : fmt::format("cursor at {:.0f} rpm", cv::sim_spinner_rpm.getFloat()),
           1.0 / this->dFrameTime);
}

SpinnerInput SpinnerSimulator::getInput(i32 curPos) const {
    const i32 releaseAt = cv::sim_release_at.getInt();

    // the cursor keeps circling the whole time, only the keys decide whether that counts
    const f64 seconds = (f64)(curPos - this->spinner->getStartTime() + PREROLL) / 1000.0;
    const f64 angle = seconds * (f64)cv::sim_spinner_rpm.getFloat() / 60.0 * 2.0 * (f64)PI;

    const vec2 center = this->spinner->getRawPos();
    return SpinnerInput{
        .cursorPos = vec2(center.x + CURSOR_RADIUS * (f32)std::cos(angle),
                          center.y + CURSOR_RADIUS * (f32)std::sin(angle)),
        .held = releaseAt < 0 || curPos < releaseAt,
    };
}

void SpinnerSimulator::update() {
    if(this->isShuttingDown()) return;

    this->dCurTime += this->dFrameTime * 1000.0;
    i32 curPos = (i32)this->dCurTime;

    const i32 rewindAt = cv::sim_rewind_at.getInt();
    if(!this->bRewound && rewindAt >= 0 && curPos >= rewindAt) {
        this->bRewound = true;

        curPos = this->spinner->getStartTime();
        this->dCurTime = (f64)curPos;
        logRaw("[{:d}] seeking back to {:d}", rewindAt, curPos);

        // ticks hit before the seek stay hit, so the score is kept as well
        this->spinner->onReset(curPos);
    }

    const SpinnerEvents events = this->spinner->update(curPos, this->dFrameTime, this->getInput(curPos));
    this->score.addEvents(events);
    for(const auto &event : events) {
        logRaw("{:s}", eventToString(event));
    }

    if(curPos - this->iLastStatusTime >= STATUS_INTERVAL && !this->spinner->isFinished()) {
        this->iLastStatusTime = curPos;
        logRaw("[{:d}] progress {:.1f}% ({:d}/{:d} spins), {:.0f} rpm, score {:d}", curPos,
               this->spinner->getProgress() * 100.0f, this->spinner->getWholeSpins(),
               this->spinner->getSpinsRequired(), this->spinner->getRPM(), this->score.getScore());
    }

    if(this->spinner->isFinished()) {
        this->printResults();
        this->shutdown(0);
    }
}

void SpinnerSimulator::printResults() {
    logRaw("");
    logRaw("=== {:s} ===", judgementToString(this->spinner->getJudgement()));
    logRaw("progress: {:.1f}%, {:.0f} degrees", this->spinner->getProgress() * 100.0f,
           this->spinner->getCumulativeRotation());
    logRaw("ticks: {:d} hit, {:d} bonus (x{:d}), {:d} missed", this->score.getNumTickHits(),
           this->score.getNumBonusHits(), this->score.getBonusCount(), this->score.getNumTickMisses());
    logRaw("score: {:d} ({:d} bonus), accuracy {:.2f}%", this->score.getScore(), this->score.getBonusPoints(),
           this->score.getAccuracy() * 100.0f);
}

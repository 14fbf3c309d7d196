// ============================================================================
// step_clock.h — fixed-step simulation clock with render interpolation
//
// Frame time is accumulated and spent in whole simulation steps.  What is
// left over, as a fraction of one step, is the factor the renderer uses
// to blend the last two water states.
// ============================================================================
#pragma once

#include <algorithm>
#include <cmath>

class FixedStepClock {
public:
    FixedStepClock(float step, int maxSteps)
        : step_(step), maxSteps_(std::max(maxSteps, 1)) {}

    // Returns the number of simulation steps to run for this frame.  Time
    // beyond maxSteps is dropped so a slow frame cannot snowball.
    int advance(float dt) {
        if (step_ <= 0.f) return 0;
        accumulated_ += std::max(dt, 0.f);

        int steps = 0;
        while (accumulated_ >= step_ && steps < maxSteps_) {
            accumulated_ -= step_;
            ++steps;
        }
        if (accumulated_ >= step_)
            accumulated_ = std::fmod(accumulated_, step_);
        return steps;
    }

    // Interpolation factor in [0, 1]
    float alpha() const {
        if (step_ <= 0.f) return 1.f;
        return std::clamp(accumulated_ / step_, 0.f, 1.f);
    }

    float step() const { return step_; }

    void reset() { accumulated_ = 0.f; }

private:
    float step_;
    int   maxSteps_;
    float accumulated_ = 0.f;
};

// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#include "animation.h"

#include <algorithm>

namespace bpocv
{

    const char* to_string(AnimationState s)
    {
        switch (s)
        {
        case AnimationState::Idle:      return "idle";
        case AnimationState::Animating: return "animating";
        case AnimationState::Settled:   return "settled";
        }
        return "idle";
    }

    AnimationTimeline::AnimationTimeline(double begin_ms, double duration_ms)
        : begin_ms_(std::max(0.0, begin_ms)), duration_ms_(duration_ms)
    {}

    void AnimationTimeline::advance(double dt_ms)
    {
        if (state_ == AnimationState::Settled || dt_ms <= 0.0) return;
        elapsed_ms_ += dt_ms;

        if (elapsed_ms_ >= begin_ms_ + std::max(0.0, duration_ms_)) finish();
        else if (elapsed_ms_ >= begin_ms_) state_ = AnimationState::Animating;
    }

    void AnimationTimeline::start()
    {
        if (state_ == AnimationState::Idle)
        {
            state_ = AnimationState::Animating;
            elapsed_ms_ = std::max(elapsed_ms_, begin_ms_);
        }
    }

    void AnimationTimeline::finish()
    {
        state_ = AnimationState::Settled;
        elapsed_ms_ = begin_ms_ + std::max(0.0, duration_ms_);
    }

    void AnimationTimeline::restart()
    {
        state_ = AnimationState::Idle;
        elapsed_ms_ = 0.0;
    }

    double AnimationTimeline::progress() const
    {
        if (state_ == AnimationState::Settled) return 1.0;
        if (state_ == AnimationState::Idle || duration_ms_ <= 0.0) return 0.0;

        const double t = std::clamp((elapsed_ms_ - begin_ms_) / duration_ms_, 0.0, 1.0);
        return t < 0.5 ? 4 * t * t * t : 1 - (-2 * t + 2) * (-2 * t + 2) * (-2 * t + 2) / 2;
    }

} // namespace bpocv

// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#pragma once

namespace bpocv
{

    /**
     * @enum AnimationState
     * @brief Lifecycle of a series' enter animation.
     */
    enum class AnimationState
    {
        Idle,       ///< Not started (or before animation_begin)
        Animating,  ///< Geometry is moving towards its final position
        Settled     ///< Final geometry is stable
    };

    const char* to_string(AnimationState s);

    /**
     * @brief Whether labels may be emitted for a series.
     *
     * With animation disabled labels are always shown; otherwise only once
     * the animation has settled.
     */
    constexpr bool labels_visible(bool is_animation_active, AnimationState s)
    {
        return !is_animation_active || s == AnimationState::Settled;
    }

    /**
     * @class AnimationTimeline
     * @brief Idle -> Animating -> Settled state machine for one series.
     *
     * Driven either by elapsed time (advance()) or by the explicit
     * start() / finish() hooks handed to render callbacks. restart()
     * returns to Idle, e.g. when the data changes.
     */
    class AnimationTimeline
    {
    public:
        /**
         * @param begin_ms    Delay before the animation starts.
         * @param duration_ms Length of the animation; <= 0 settles at begin.
         */
        AnimationTimeline(double begin_ms = 0.0, double duration_ms = 400.0);

        /// @brief Advance the clock by @p dt_ms milliseconds.
        void advance(double dt_ms);

        void start();
        void finish();
        void restart();

        AnimationState state() const { return state_; }
        bool settled() const { return state_ == AnimationState::Settled; }

        /**
         * @brief Eased completion in [0, 1] (ease-in-out, cubic).
         *
         * 0 while idle, 1 once settled.
         */
        double progress() const;

    private:
        double begin_ms_;
        double duration_ms_;
        double elapsed_ms_{ 0.0 };
        AnimationState state_{ AnimationState::Idle };
    };

} // namespace bpocv

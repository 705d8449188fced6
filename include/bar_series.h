// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "animation.h"
#include "background_renderer.h"
#include "chart_kind.h"
#include "geometry.h"
#include "label_renderer.h"
#include "legend.h"
#include "render_node.h"

namespace bpocv
{

    /**
     * @struct BarProps
     * @brief Configuration of one Bar series.
     */
    struct BarProps
    {
        Layout layout{ Layout::Horizontal };    ///< Value-axis orientation
        std::vector<DataItem> data;             ///< Records, already scaled
        std::string data_key{ "value" };        ///< Key of the plotted value
        std::string name;                       ///< Legend text; empty uses data_key
        std::string fill{ "#3182bd" };          ///< Bar and legend icon color
        BackgroundSpec background;              ///< Background decoration
        LabelSpec label;                        ///< Label decoration
        LegendType legend_type{ LegendType::Rect };
        bool is_animation_active{ true };       ///< Labels wait for the animation to settle
        double animation_begin{ 0.0 };          ///< ms
        double animation_duration{ 400.0 };     ///< ms
    };

    /**
     * @struct SeriesOutput
     * @brief Everything one render pass of a series produced.
     */
    struct SeriesOutput
    {
        RenderNode layer{ make_group("recharts-layer recharts-bar") };  ///< Scene subtree
        std::vector<Geometry> geometries;    ///< Final (not animated) bar rectangles
        std::optional<LegendEntry> legend;   ///< Legend registration, if any
    };

    /// Class of bar rectangles.
    constexpr const char* kBarRectClass = "recharts-bar-rectangle";

    /**
     * @class BarSeries
     * @brief A data-bound set of rectangles rendered under one configuration.
     *
     * render() is a pure function of the configuration, the animation
     * state sampled at the start of the pass and the plot area. The only state a series keeps between passes
     * is its AnimationTimeline, shared with the start / end hooks handed to
     * background render functions so they stay valid after the series is
     * gone.
     */
    class BarSeries
    {
    public:
        explicit BarSeries(BarProps props);

        const BarProps& props() const { return props_; }

        /// @brief Replace the records; restarts the enter animation.
        void set_data(std::vector<DataItem> data);

        /// @brief Replace the label configuration.
        void set_label(LabelSpec label) { props_.label = std::move(label); }

        /// @brief Replace the background configuration.
        void set_background(BackgroundSpec background) { props_.background = std::move(background); }

        /// @brief Advance the animation clock by @p dt_ms.
        void tick(double dt_ms);

        AnimationState animation_state() const { return timeline_->state(); }

        /**
         * @brief Render the series for a parent chart.
         *
         * Returns an empty output when @p parent does not host Bar series.
         *
         * @param parent Kind of the containing chart.
         * @param area   Plot area, used for full-extent backgrounds.
         */
        SeriesOutput render(ChartKind parent, const PlotArea& area) const;

    private:
        BarProps props_;
        std::shared_ptr<AnimationTimeline> timeline_;

        /// @brief Bar rectangle at enter-animation @p progress, given state @p s.
        Geometry animated(const Geometry& g, AnimationState s, double progress) const;
    };

} // namespace bpocv

// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#pragma once

#include <opencv2/core.hpp>

#include <memory>
#include <string>
#include <vector>

#include "bar_series.h"
#include "chart_kind.h"
#include "legend.h"
#include "render_node.h"

namespace bpocv
{

    /**
     * @struct Margins
     * @brief Space between the canvas border and the plot area (pixels).
     */
    struct Margins
    {
        int left{ 5 };
        int right{ 5 };
        int top{ 5 };
        int bottom{ 5 };
    };

    /**
     * @class Chart
     * @brief A composable chart container hosting Bar series.
     *
     * The Chart keeps the series configurations and turns them into a scene
     * tree and pixels only when render(), show() or save() is called. Each
     * render pass:
     *   - evaluates, per series, whether the chart kind hosts Bar series,
     *   - renders every admitted series into the scene,
     *   - collects the legend registrations and, when enabled, the legend,
     *   - paints the scene into an OpenCV canvas.
     *
     * Thread safety: concurrent access to a single Chart must be guarded by
     * the caller. Separate Chart instances can be used from different threads
     * without locking.
     */
    class Chart
    {
    public:
        /**
         * @brief Construct a new Chart.
         *
         * @param kind Kind of chart; decides which series it can host.
         * @param w    Canvas width in pixels. Defaults to 500.
         * @param h    Canvas height in pixels. Defaults to 500.
         */
        Chart(ChartKind kind, int w = 500, int h = 500);

        /**
         * @brief Add a Bar series.
         *
         * @param props Series configuration.
         * @return The series, owned by the chart and valid for its lifetime.
         */
        BarSeries& bar(BarProps props);

        /**
         * @brief Enable / disable the legend.
         *
         * When enabled, a row of legend items is placed under the plot area.
         */
        void legend(bool on = true);

        /// @brief Set the margins around the plot area.
        void margins(const Margins& m);

        /// @brief Advance the animation clock of every series by @p dt_ms.
        void tick(double dt_ms);

        /// @brief Rebuild the scene and repaint the canvas.
        void render();

        /**
         * @brief Render and display the chart in an OpenCV window.
         *
         * @param window_name Name of the OpenCV window. Defaults to "Chart".
         */
        void show(const std::string& window_name = "Chart");

        /**
         * @brief Render and save the chart to disk.
         *
         * The image format is inferred from the file extension.
         *
         * @param filename Output file path.
         * @return false if OpenCV could not encode or write the file.
         */
        bool save(const std::string& filename);

        ChartKind kind() const { return kind_; }

        /// @brief Plot area for the current size, margins and legend setting.
        PlotArea plot_area() const;

        /// @brief Scene of the last render pass.
        const RenderNode& scene() const { return scene_; }

        /// @brief Pixels of the last render pass.
        const cv::Mat& canvas() const { return canvas_; }

        /// @brief Legend registrations of the last render pass.
        const std::vector<LegendEntry>& legend_entries() const { return registry_.entries(); }

        std::size_t series_count() const { return series_.size(); }

    private:
        static constexpr int kLegendHeight = 24;  ///< Row reserved for the legend

        ChartKind                               kind_;
        int                                     width_, height_;
        Margins                                 margins_;
        bool                                    legend_on_{ false };
        std::vector<std::unique_ptr<BarSeries>> series_;

        RenderNode                              scene_;
        LegendRegistry                          registry_;
        cv::Mat                                 canvas_;
    };

} // namespace bpocv

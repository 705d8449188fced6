// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#pragma once
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <string>
#include <vector>

#include "color.h"
#include "render_node.h"

namespace bpocv
{

    /**
     * @class Painter
     * @brief Rasterizes a RenderNode tree into an OpenCV image.
     *
     * Understands rect, text and legend-icon nodes; groups and custom
     * elements contribute their children. Custom elements whose tag is
     * "rect" or "text" are painted like the built-in variants. Coordinates
     * are pixels with the origin at the top-left corner of the canvas.
     */
    class Painter
    {
    public:
        /// @param canvas 8-bit, 3-channel BGR target; painted in place.
        explicit Painter(cv::Mat& canvas);

        void paint(const RenderNode& root);

        /// @brief Number of primitives drawn since construction.
        int primitives() const { return primitives_; }

    private:
        cv::Mat& canvas_;
        int primitives_{ 0 };

        static constexpr double kFontScale = 0.4;
        static constexpr int    kFont = cv::FONT_HERSHEY_SIMPLEX;

        void paint_rect(const RenderNode& n);
        void paint_text(const RenderNode& n);
        void paint_legend_icon(const RenderNode& n);

        /// @brief Fill a polygon, honoring an opacity in [0, 1].
        void fill_poly(const std::vector<cv::Point>& pts, const cv::Scalar& col, double opacity);

        static cv::Scalar cv_color(const Color& c);
    };

} // namespace bpocv

// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#include "chart.h"
#include "log.h"
#include "painter.h"

#include <opencv2/highgui.hpp>
#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <utility>

namespace bpocv
{

    // ---------------------------------------------------------------------------
    // Construction & basic settings
    // ---------------------------------------------------------------------------
    Chart::Chart(ChartKind kind, int w, int h)
        : kind_(kind), width_(std::max(1, w)), height_(std::max(1, h)),
        canvas_(height_, width_, CV_8UC3, cv::Scalar(255, 255, 255))
    {}

    BarSeries& Chart::bar(BarProps props)
    {
        series_.push_back(std::make_unique<BarSeries>(std::move(props)));
        return *series_.back();
    }

    void Chart::legend(bool on) { legend_on_ = on; }
    void Chart::margins(const Margins& m) { margins_ = m; }

    void Chart::tick(double dt_ms)
    {
        for (auto& s : series_) s->tick(dt_ms);
    }

    PlotArea Chart::plot_area() const
    {
        PlotArea a;
        a.left = margins_.left;
        a.top = margins_.top;
        a.width = std::max(0, width_ - margins_.left - margins_.right);
        a.height = std::max(0, height_ - margins_.top - margins_.bottom - (legend_on_ ? kLegendHeight : 0));
        return a;
    }

    // ---------------------------------------------------------------------------
    // Rendering & I/O
    // ---------------------------------------------------------------------------
    void Chart::render()
    {
        const PlotArea area = plot_area();

        /* 1) series ----------------------------------------------------------- */
        RenderNode surface = make_group("recharts-surface");
        surface.set_attr("width", width_);
        surface.set_attr("height", height_);

        registry_.clear();
        for (const auto& s : series_)
        {
            SeriesOutput out = s->render(kind_, area);
            if (out.legend) registry_.add(std::move(*out.legend));
            surface.children.push_back(std::move(out.layer));
        }

        scene_ = make_group("recharts-wrapper");
        scene_.set_attr("data-chart", to_string(kind_));
        scene_.children.push_back(std::move(surface));

        /* 2) legend ----------------------------------------------------------- */
        if (legend_on_)
        {
            const double top = area.top + area.height + (kLegendHeight - kLegendIconSize) / 2.0;
            scene_.children.push_back(build_legend(registry_, width_ / 2.0, top));
        }

        /* 3) paint ------------------------------------------------------------ */
        canvas_.setTo(cv::Scalar(255, 255, 255));
        Painter painter(canvas_);
        painter.paint(scene_);

        logger()->debug("[Chart] {} rendered: {} series, {} legend entr{}, {} primitive(s)",
            to_string(kind_), series_.size(), registry_.size(),
            registry_.size() == 1 ? "y" : "ies", painter.primitives());
    }

    void Chart::show(const std::string& window_name)
    {
        render();
        cv::imshow(window_name, canvas_);
        cv::waitKey(1);
    }

    bool Chart::save(const std::string& filename)
    {
        render();
        try
        {
            if (cv::imwrite(filename, canvas_)) return true;
            logger()->error("[Chart] Could not write '{}'", filename);
        }
        catch (const cv::Exception& e)
        {
            logger()->error("[Chart] Could not write '{}': {}", filename, e.what());
        }
        return false;
    }

} // namespace bpocv

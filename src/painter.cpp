// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#include "painter.h"
#include "log.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

namespace bpocv
{

    Painter::Painter(cv::Mat& canvas)
        : canvas_(canvas)
    {}

    cv::Scalar Painter::cv_color(const Color& c)
    {
        return cv::Scalar(c.b, c.g, c.r);
    }

    void Painter::paint(const RenderNode& root)
    {
        const bool is_rect = root.type == NodeType::Rect
            || (root.type == NodeType::Custom && root.tag == "rect");
        const bool is_text = root.type == NodeType::Text
            || (root.type == NodeType::Custom && root.tag == "text");

        if (is_rect)                                paint_rect(root);
        else if (is_text)                           paint_text(root);
        else if (root.type == NodeType::LegendIcon) paint_legend_icon(root);

        for (const auto& child : root.children) paint(child);
    }

    void Painter::fill_poly(const std::vector<cv::Point>& pts, const cv::Scalar& col, double opacity)
    {
        if (opacity <= 0.0 || pts.size() < 3) return;
        if (opacity < 1.0)
        {
            cv::Mat tmp = canvas_.clone();
            cv::fillPoly(tmp, std::vector<std::vector<cv::Point>>{ pts }, col, cv::LINE_AA);
            cv::addWeighted(tmp, opacity, canvas_, 1.0 - opacity, 0.0, canvas_);
        }
        else
        {
            cv::fillPoly(canvas_, std::vector<std::vector<cv::Point>>{ pts }, col, cv::LINE_AA);
        }
    }

    void Painter::paint_rect(const RenderNode& n)
    {
        const double x = n.num_attr("x"), y = n.num_attr("y");
        const double w = n.num_attr("width"), h = n.num_attr("height");
        if (!(w > 0.0) || !(h > 0.0)) return;

        const cv::Point p0(static_cast<int>(std::lround(x)), static_cast<int>(std::lround(y)));
        const cv::Point p1(static_cast<int>(std::lround(x + w)), static_cast<int>(std::lround(y + h)));

        const std::string fill = n.attr("fill");
        if (fill != "none")
        {
            const double opacity = std::clamp(n.num_attr("fill-opacity", n.num_attr("opacity", 1.0)), 0.0, 1.0);
            const Color c = color_or(fill, Color::Black());
            fill_poly({ p0, { p1.x, p0.y }, p1, { p0.x, p1.y } }, cv_color(c), opacity);
        }

        if (n.has_attr("stroke") && n.attr("stroke") != "none")
        {
            const int sw = std::max(1, static_cast<int>(n.num_attr("stroke-width", 1.0)));
            cv::rectangle(canvas_, p0, p1, cv_color(color_or(n.attr("stroke"), Color::Black())), sw, cv::LINE_AA);
        }
        ++primitives_;
    }

    void Painter::paint_text(const RenderNode& n)
    {
        if (n.text.empty()) return;

        int bl = 0;
        const cv::Size sz = cv::getTextSize(n.text, kFont, kFontScale, 1, &bl);
        double x = n.num_attr("x"), y = n.num_attr("y");

        const std::string anchor = n.attr("text-anchor");
        if (anchor == "middle")   x -= sz.width / 2.0;
        else if (anchor == "end") x -= sz.width;
        y += sz.height / 2.0;  // vertically centered on y

        const Color c = color_or(n.attr("fill"), Color::Black());
        cv::putText(canvas_, n.text, { static_cast<int>(std::lround(x)), static_cast<int>(std::lround(y)) },
            kFont, kFontScale, cv_color(c), 1, cv::LINE_AA);
        ++primitives_;
    }

    void Painter::paint_legend_icon(const RenderNode& n)
    {
        const double x = n.num_attr("x"), y = n.num_attr("y");
        const double s = n.num_attr("width", 14.0);
        const double cx = x + s / 2, cy = y + s / 2, r = s / 2;
        const cv::Scalar col = cv_color(color_or(n.attr("fill"), Color::Black()));
        const std::string type = n.attr("data-type");

        auto pt = [](double px, double py) {
            return cv::Point(static_cast<int>(std::lround(px)), static_cast<int>(std::lround(py)));
        };
        auto regular = [&](int count, double radius, double start_deg) {
            std::vector<cv::Point> pts;
            for (int i = 0; i < count; ++i)
            {
                const double a = (start_deg + 360.0 * i / count) * CV_PI / 180.0;
                pts.push_back(pt(cx + radius * std::cos(a), cy + radius * std::sin(a)));
            }
            return pts;
        };

        if (type == "circle")
        {
            cv::circle(canvas_, pt(cx, cy), static_cast<int>(r), col, cv::FILLED, cv::LINE_AA);
        }
        else if (type == "line" || type == "plainline")
        {
            cv::line(canvas_, pt(x, cy), pt(x + s, cy), col, 2, cv::LINE_AA);
            if (type == "line")
                cv::circle(canvas_, pt(cx, cy), static_cast<int>(r / 2), col, 1, cv::LINE_AA);
        }
        else if (type == "square")
        {
            fill_poly({ pt(x, y), pt(x + s, y), pt(x + s, y + s), pt(x, y + s) }, col, 1.0);
        }
        else if (type == "rect")
        {
            /* flat bar, the height of a legend line of text */
            fill_poly({ pt(x, y + s / 8), pt(x + s, y + s / 8), pt(x + s, y + s * 7 / 8), pt(x, y + s * 7 / 8) }, col, 1.0);
        }
        else if (type == "diamond")
        {
            fill_poly(regular(4, r, -90.0), col, 1.0);
        }
        else if (type == "triangle")
        {
            fill_poly(regular(3, r, -90.0), col, 1.0);
        }
        else if (type == "star")
        {
            std::vector<cv::Point> pts;
            for (int i = 0; i < 10; ++i)
            {
                const double rad = (i % 2 == 0) ? r : r * 0.4;
                const double a = (-90.0 + 36.0 * i) * CV_PI / 180.0;
                pts.push_back(pt(cx + rad * std::cos(a), cy + rad * std::sin(a)));
            }
            fill_poly(pts, col, 1.0);
        }
        else if (type == "cross")
        {
            const double t = s / 6;
            fill_poly({ pt(cx - t, y), pt(cx + t, y), pt(cx + t, y + s), pt(cx - t, y + s) }, col, 1.0);
            fill_poly({ pt(x, cy - t), pt(x + s, cy - t), pt(x + s, cy + t), pt(x, cy + t) }, col, 1.0);
        }
        else if (type == "wye")
        {
            for (const cv::Point& tip : regular(3, r, -90.0))
                cv::line(canvas_, pt(cx, cy), tip, col, 2, cv::LINE_AA);
        }
        else
        {
            logger()->warn("[Painter] Unknown legend icon type '{}'", type);
            return;
        }
        ++primitives_;
    }

} // namespace bpocv

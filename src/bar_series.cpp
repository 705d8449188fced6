// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#include "bar_series.h"
#include "log.h"

#include <utility>

namespace bpocv
{

    BarSeries::BarSeries(BarProps props)
        : props_(std::move(props)),
        timeline_(std::make_shared<AnimationTimeline>(props_.animation_begin, props_.animation_duration))
    {
        if (!props_.is_animation_active) timeline_->finish();
    }

    void BarSeries::set_data(std::vector<DataItem> data)
    {
        props_.data = std::move(data);
        timeline_->restart();
        if (!props_.is_animation_active) timeline_->finish();
    }

    void BarSeries::tick(double dt_ms)
    {
        const AnimationState before = timeline_->state();
        timeline_->advance(dt_ms);
        if (timeline_->state() != before)
        {
            logger()->debug("[Bar] '{}' animation {} -> {}", props_.data_key,
                to_string(before), to_string(timeline_->state()));
        }
    }

    Geometry BarSeries::animated(const Geometry& g, AnimationState s, double progress) const
    {
        if (!props_.is_animation_active || s == AnimationState::Settled) return g;

        /* grow from the bar's base: bottom edge (horizontal) or left edge (vertical) */
        const double t = progress;
        Geometry a = g;
        if (value_axis_is_vertical(props_.layout))
        {
            a.height = g.height * t;
            a.y = g.y + g.height - a.height;
        }
        else
        {
            a.width = g.width * t;
        }
        return a;
    }

    SeriesOutput BarSeries::render(ChartKind parent, const PlotArea& area) const
    {
        SeriesOutput out;
        if (!admits_bar_series(parent))
        {
            logger()->debug("[Bar] '{}' not rendered: {} does not host Bar series",
                props_.data_key, to_string(parent));
            return out;
        }

        /* hooks fired during this pass only take effect on the next one */
        const AnimationState state = timeline_->state();
        const double progress = timeline_->progress();

        out.geometries = resolve_geometry(props_.data, props_.layout);
        out.legend = legend_descriptor(props_.legend_type, props_.name, props_.data_key, props_.fill);

        /* 1) backgrounds -------------------------------------------------- */
        BackgroundContext bg;
        bg.layout = props_.layout;
        bg.area = area;
        bg.data_key = props_.data_key;
        {
            std::weak_ptr<AnimationTimeline> weak = timeline_;
            bg.on_animation_start = [weak] { if (auto t = weak.lock()) t->start(); };
            bg.on_animation_end = [weak] { if (auto t = weak.lock()) t->finish(); };
        }
        std::vector<RenderNode> backgrounds =
            render_backgrounds(out.geometries, props_.data, props_.background, bg);
        if (!backgrounds.empty())
        {
            RenderNode layer = make_group("recharts-layer recharts-bar-background");
            layer.children = std::move(backgrounds);
            out.layer.children.push_back(std::move(layer));
        }

        /* 2) rectangles --------------------------------------------------- */
        if (!out.geometries.empty())
        {
            RenderNode layer = make_group("recharts-layer recharts-bar-rectangles");
            for (const Geometry& g : out.geometries)
            {
                const Geometry a = animated(g, state, progress);
                RenderNode n = make_node(NodeType::Rect, "rect", kBarRectClass);
                n.set_attr("x", a.x);
                n.set_attr("y", a.y);
                n.set_attr("width", a.width);
                n.set_attr("height", a.height);
                n.set_attr("fill", props_.fill);
                n.set_attr("index", static_cast<double>(g.index));
                layer.children.push_back(std::move(n));
            }
            out.layer.children.push_back(std::move(layer));
        }

        /* 3) labels ------------------------------------------------------- */
        const bool visible = labels_visible(props_.is_animation_active, state);
        std::vector<RenderNode> labels = render_labels(out.geometries, props_.data, props_.label, visible);
        if (!labels.empty())
        {
            RenderNode layer = make_group("recharts-layer recharts-label-list");
            layer.children = std::move(labels);
            out.layer.children.push_back(std::move(layer));
        }

        logger()->trace("[Bar] '{}' rendered {} bar(s) in {}", props_.data_key,
            out.geometries.size(), to_string(parent));
        return out;
    }

} // namespace bpocv

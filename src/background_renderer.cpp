// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#include "background_renderer.h"
#include "log.h"

#include <utility>

namespace bpocv
{

    BackgroundSpec BackgroundSpec::enabled(bool on)
    {
        BackgroundSpec s;
        s.kind = on ? BackgroundKind::Default : BackgroundKind::None;
        return s;
    }

    BackgroundSpec BackgroundSpec::from_style(StyleMap style)
    {
        BackgroundSpec s;
        s.kind = BackgroundKind::Style;
        s.style = std::move(style);
        return s;
    }

    BackgroundSpec BackgroundSpec::from_function(BackgroundFn fn)
    {
        BackgroundSpec s;
        s.kind = fn ? BackgroundKind::Function : BackgroundKind::None;
        s.fn = std::move(fn);
        return s;
    }

    Geometry background_rect(const Geometry& bar, const DataItem* item,
        Layout layout, const PlotArea& area)
    {
        if (item && item->background)
        {
            Geometry g = *item->background;
            g.index = bar.index;
            if (is_well_formed(g)) return g;
            logger()->debug("[Bar] Malformed background on item {}, using full extent", bar.index);
        }

        Geometry g;
        g.index = bar.index;
        if (value_axis_is_vertical(layout))
        {
            g.x = bar.x;  g.width = bar.width;
            g.y = area.top; g.height = area.height;
        }
        else
        {
            g.x = area.left; g.width = area.width;
            g.y = bar.y;  g.height = bar.height;
        }
        return g;
    }

    std::vector<RenderNode> render_backgrounds(const std::vector<Geometry>& geoms,
        const std::vector<DataItem>& items,
        const BackgroundSpec& spec,
        const BackgroundContext& ctx)
    {
        std::vector<RenderNode> out;
        if (spec.kind == BackgroundKind::None) return out;
        if (spec.kind == BackgroundKind::Function && !spec.fn) return out;

        out.reserve(geoms.size());
        for (const Geometry& bar : geoms)
        {
            const DataItem* item = bar.index < items.size() ? &items[bar.index] : nullptr;
            const Geometry r = background_rect(bar, item, ctx.layout, ctx.area);

            if (spec.kind == BackgroundKind::Function)
            {
                BackgroundProps p;
                p.class_name = kBackgroundClass;
                p.data_key = ctx.data_key;
                p.fill = kBackgroundFill;
                p.height = r.height;
                p.index = bar.index;
                p.label = item ? item->label : std::string();
                p.on_animation_start = ctx.on_animation_start;
                p.on_animation_end = ctx.on_animation_end;
                p.width = r.width;
                p.x = r.x;
                p.y = r.y;

                std::optional<RenderNode> n = spec.fn(p);
                if (n) out.push_back(std::move(*n));
                continue;
            }

            /* default fill < style object < per-call geometry */
            RenderNode n = make_node(NodeType::Rect, "rect", kBackgroundClass);
            n.set_attr("fill", kBackgroundFill);
            for (const auto& kv : spec.style)
            {
                if (kv.first == "className") continue;
                n.set_attr(kv.first, kv.second);
            }
            n.set_attr("x", r.x);
            n.set_attr("y", r.y);
            n.set_attr("width", r.width);
            n.set_attr("height", r.height);
            n.set_attr("index", static_cast<double>(bar.index));
            out.push_back(std::move(n));
        }
        return out;
    }

} // namespace bpocv

// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#include "label_renderer.h"
#include "log.h"

#include <utility>

namespace bpocv
{

    /* --------------------------------------------------------------------------
     *  LabelSpec factories
     * ------------------------------------------------------------------------*/
    LabelSpec LabelSpec::enabled(bool on)
    {
        LabelSpec s;
        s.kind = on ? LabelKind::Default : LabelKind::None;
        return s;
    }

    LabelSpec LabelSpec::from_style(StyleMap style)
    {
        LabelSpec s;
        s.kind = LabelKind::Style;
        s.style = std::move(style);
        return s;
    }

    LabelSpec LabelSpec::from_function(LabelFn fn)
    {
        LabelSpec s;
        s.kind = fn ? LabelKind::Function : LabelKind::None;
        s.fn = std::move(fn);
        return s;
    }

    LabelSpec LabelSpec::from_element(RenderNode element)
    {
        LabelSpec s;
        s.kind = LabelKind::Element;
        s.element = std::move(element);
        return s;
    }

    /* --------------------------------------------------------------------------
     *  Per-variant node builders
     * ------------------------------------------------------------------------*/
    namespace
    {
        double item_value(const std::vector<DataItem>& items, const Geometry& g)
        {
            return g.index < items.size() ? items[g.index].value : 0.0;
        }

        /* label = true: centered in the bar */
        RenderNode default_label(const Geometry& g, double value)
        {
            RenderNode n = make_node(NodeType::Text, "text", "recharts-text recharts-label");
            n.set_attr("x", g.x + g.width / 2);
            n.set_attr("y", g.y + g.height / 2);
            n.set_attr("height", g.height);
            n.set_attr("offset", kLabelOffset);
            n.set_attr("text-anchor", "middle");
            n.set_attr("width", g.width);
            n.set_attr("fill", kLabelFill);
            n.text = format_number(value);
            return n;
        }

        /* label = {...}: className swaps the recharts-label token only */
        RenderNode styled_label(const Geometry& g, double value, const StyleMap& style)
        {
            RenderNode n = default_label(g, value);
            for (const auto& kv : style)
            {
                if (kv.first == "className")
                {
                    n.set_class("recharts-text");
                    for (const auto& tok : split_classes(kv.second)) n.add_class(tok);
                }
                else
                {
                    n.set_attr(kv.first, kv.second);
                }
            }
            return n;
        }

        LabelProps function_props(const Geometry& g, double value, const LabelFn& fn)
        {
            LabelProps p;
            p.content = fn;
            p.height = g.height;
            p.index = g.index;
            p.offset = kLabelOffset;
            p.value = value;
            p.view_box = { g.x, g.y, g.width, g.height };
            p.width = g.width;
            p.x = g.x;
            p.y = g.y;
            return p;
        }

        /* label = <el/>: positional subset only, y at the near edge */
        RenderNode cloned_label(const Geometry& g, const RenderNode& tmpl)
        {
            RenderNode n = tmpl;
            n.set_attr("x", g.x);
            n.set_attr("y", g.y);
            n.set_attr("height", g.height);
            n.set_attr("offset", kLabelOffset);
            n.set_attr("width", g.width);
            return n;
        }
    } // namespace

    std::vector<RenderNode> render_labels(const std::vector<Geometry>& geoms,
        const std::vector<DataItem>& items,
        const LabelSpec& spec,
        bool visible)
    {
        std::vector<RenderNode> out;
        if (spec.kind == LabelKind::None || !visible) return out;

        const LabelContext ctx;
        out.reserve(geoms.size());
        for (const Geometry& g : geoms)
        {
            const double value = item_value(items, g);
            switch (spec.kind)
            {
            case LabelKind::Default:
                out.push_back(default_label(g, value));
                break;
            case LabelKind::Style:
                out.push_back(styled_label(g, value, spec.style));
                break;
            case LabelKind::Function:
            {
                if (!spec.fn) break;
                std::optional<RenderNode> n = spec.fn(function_props(g, value, spec.fn), ctx);
                if (n) out.push_back(std::move(*n));
                break;
            }
            case LabelKind::Element:
                out.push_back(cloned_label(g, spec.element));
                break;
            case LabelKind::None:
                break;
            }
        }

        logger()->trace("[Bar] {} label(s) for {} bar(s)", out.size(), geoms.size());
        return out;
    }

} // namespace bpocv

// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#include "legend.h"
#include "log.h"

#include <opencv2/imgproc.hpp>

namespace bpocv
{

    namespace
    {
        struct NamedType
        {
            const char* name;
            LegendType  type;
        };

        constexpr NamedType kLegendNames[] = {
            { "circle",    LegendType::Circle },
            { "cross",     LegendType::Cross },
            { "diamond",   LegendType::Diamond },
            { "line",      LegendType::Line },
            { "plainline", LegendType::PlainLine },
            { "rect",      LegendType::Rect },
            { "square",    LegendType::Square },
            { "star",      LegendType::Star },
            { "triangle",  LegendType::Triangle },
            { "wye",       LegendType::Wye },
            { "none",      LegendType::None },
        };

        constexpr int    kItemGap = 10;   ///< Horizontal space between items
        constexpr int    kIconGap = 4;    ///< Space between icon and text
        constexpr double kFontScale = 0.4;
    } // namespace

    const char* to_string(LegendType t)
    {
        for (const auto& n : kLegendNames)
            if (n.type == t) return n.name;
        return "none";
    }

    std::optional<LegendType> parse_legend_type(const std::string& s)
    {
        for (const auto& n : kLegendNames)
            if (s == n.name) return n.type;
        return std::nullopt;
    }

    std::optional<LegendEntry> legend_descriptor(LegendType type, const std::string& name,
        const std::string& data_key, const std::string& color)
    {
        if (type == LegendType::None) return std::nullopt;

        LegendEntry e;
        e.value = name.empty() ? data_key : name;
        e.type = type;
        e.color = color;
        e.data_key = data_key;
        return e;
    }

    RenderNode build_legend(const LegendRegistry& reg, double center_x, double top)
    {
        RenderNode wrapper = make_group("recharts-legend-wrapper");
        if (reg.empty()) return wrapper;

        /* measure first so the row can be centered */
        std::vector<int> text_w;
        int total = 0;
        for (const auto& e : reg.entries())
        {
            int bl = 0;
            const cv::Size sz = cv::getTextSize(e.value, cv::FONT_HERSHEY_SIMPLEX, kFontScale, 1, &bl);
            text_w.push_back(sz.width);
            total += kLegendIconSize + kIconGap + sz.width;
        }
        total += kItemGap * static_cast<int>(reg.size() - 1);

        double x = center_x - total / 2.0;
        for (std::size_t i = 0; i < reg.size(); ++i)
        {
            const LegendEntry& e = reg.entries()[i];

            RenderNode item = make_group("recharts-legend-item legend-item-" + std::to_string(i));

            RenderNode icon = make_node(NodeType::LegendIcon, "path", "recharts-legend-icon");
            icon.set_attr("data-type", to_string(e.type));
            icon.set_attr("x", x);
            icon.set_attr("y", top);
            icon.set_attr("width", kLegendIconSize);
            icon.set_attr("height", kLegendIconSize);
            icon.set_attr("fill", e.color);
            item.children.push_back(std::move(icon));

            RenderNode text = make_node(NodeType::Text, "span", "recharts-legend-item-text");
            text.text = e.value;
            text.set_attr("x", x + kLegendIconSize + kIconGap);
            text.set_attr("y", top + kLegendIconSize / 2.0);
            text.set_attr("fill", e.color);
            item.children.push_back(std::move(text));

            wrapper.children.push_back(std::move(item));
            x += kLegendIconSize + kIconGap + text_w[i] + kItemGap;
        }

        logger()->debug("[Legend] Built {} item(s)", reg.size());
        return wrapper;
    }

} // namespace bpocv

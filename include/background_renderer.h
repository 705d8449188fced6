// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "geometry.h"
#include "render_node.h"

namespace bpocv
{

    /**
     * @enum BackgroundKind
     * @brief Active variant of a BackgroundSpec.
     */
    enum class BackgroundKind
    {
        None,      ///< No background
        Default,   ///< background = true
        Style,     ///< background = {...}
        Function   ///< background = fn
    };

    /**
     * @struct BackgroundProps
     * @brief Prop bag passed to a background render function.
     */
    struct BackgroundProps
    {
        std::string class_name;               ///< Always "recharts-bar-background-rectangle"
        std::string data_key;
        std::string fill;
        double height{ 0 };
        std::size_t index{ 0 };
        std::string label;                    ///< Label field of the source record
        std::function<void()> on_animation_start;
        std::function<void()> on_animation_end;
        double width{ 0 };
        double x{ 0 }, y{ 0 };
    };

    /// Background render function. Returning std::nullopt renders nothing.
    using BackgroundFn = std::function<std::optional<RenderNode>(const BackgroundProps&)>;

    /**
     * @struct BackgroundSpec
     * @brief Union-like background configuration of a series.
     */
    struct BackgroundSpec
    {
        BackgroundKind kind{ BackgroundKind::None };  ///< Active variant
        StyleMap       style;                         ///< Style: attribute overrides
        BackgroundFn   fn;                            ///< Function: per-item renderer

        static BackgroundSpec enabled(bool on);
        static BackgroundSpec from_style(StyleMap style);
        static BackgroundSpec from_function(BackgroundFn fn);
    };

    /// Default background fill.
    constexpr const char* kBackgroundFill = "#eee";

    /// Class of background rectangles.
    constexpr const char* kBackgroundClass = "recharts-bar-background-rectangle";

    /**
     * @struct BackgroundContext
     * @brief Series-level inputs of the background pass.
     */
    struct BackgroundContext
    {
        Layout layout{ Layout::Horizontal };
        PlotArea area;
        std::string data_key;
        std::function<void()> on_animation_start;
        std::function<void()> on_animation_end;
    };

    /**
     * @brief Companion rectangle of one bar.
     *
     * The record's own background descriptor when well formed, otherwise a
     * rectangle covering the whole value-axis extent of @p area.
     */
    Geometry background_rect(const Geometry& bar, const DataItem* item,
        Layout layout, const PlotArea& area);

    /**
     * @brief Render the background rectangles of one series.
     *
     * @return One node per geometry for the Default / Style forms; for the
     *         Function form whatever the function returned.
     */
    std::vector<RenderNode> render_backgrounds(const std::vector<Geometry>& geoms,
        const std::vector<DataItem>& items,
        const BackgroundSpec& spec,
        const BackgroundContext& ctx);

} // namespace bpocv

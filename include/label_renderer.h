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
#include <vector>

#include "geometry.h"
#include "render_node.h"

namespace bpocv
{

    /**
     * @enum LabelKind
     * @brief Active variant of a LabelSpec.
     */
    enum class LabelKind
    {
        None,      ///< label = false / absent: no labels
        Default,   ///< label = true: value text with fixed styling
        Style,     ///< label = {...}: default text plus attribute overrides
        Function,  ///< label = fn: caller renders each label
        Element    ///< label = <el/>: template cloned per item
    };

    /// @brief Reserved second argument of a label render function (unused).
    struct LabelContext
    {
    };

    struct LabelProps;

    /// Label render function. Returning std::nullopt renders nothing.
    using LabelFn = std::function<std::optional<RenderNode>(const LabelProps&, const LabelContext&)>;

    /**
     * @struct ViewBox
     * @brief Rectangle a label is positioned in.
     */
    struct ViewBox
    {
        double x{ 0 }, y{ 0 };
        double width{ 0 }, height{ 0 };

        bool operator==(const ViewBox& o) const
        {
            return x == o.x && y == o.y && width == o.width && height == o.height;
        }
    };

    /**
     * @struct LabelProps
     * @brief Prop bag passed to a label render function, one call per item.
     */
    struct LabelProps
    {
        LabelFn content;                        ///< The render function itself
        double height{ 0 };
        std::size_t index{ 0 };
        double offset{ 5 };
        std::optional<ViewBox> parent_view_box; ///< Never set by Bar series
        std::optional<bool> text_break_all;     ///< Never set by Bar series
        double value{ 0 };
        ViewBox view_box;
        double width{ 0 };
        double x{ 0 }, y{ 0 };
    };

    /**
     * @struct LabelSpec
     * @brief Union-like label configuration of a series.
     *
     * The field used depends on `kind`; build with the factory helpers.
     */
    struct LabelSpec
    {
        LabelKind  kind{ LabelKind::None };  ///< Active variant
        StyleMap   style;                    ///< Style: attribute overrides
        LabelFn    fn;                       ///< Function: per-item renderer
        RenderNode element;                  ///< Element: template node

        static LabelSpec enabled(bool on);
        static LabelSpec from_style(StyleMap style);
        static LabelSpec from_function(LabelFn fn);
        static LabelSpec from_element(RenderNode element);
    };

    /// Distance between a label and its anchor rectangle.
    constexpr double kLabelOffset = 5.0;

    /// Fill of default labels.
    constexpr const char* kLabelFill = "#808080";

    /**
     * @brief Render the labels of one series.
     *
     * One node per geometry at most; none at all when @p visible is false
     * (animation not yet settled) or the spec is LabelKind::None.
     *
     * @param geoms   Resolved bar rectangles.
     * @param items   Source records (for the label value), indexed by Geometry::index.
     * @param spec    Series label configuration.
     * @param visible Result of labels_visible() for the series.
     */
    std::vector<RenderNode> render_labels(const std::vector<Geometry>& geoms,
        const std::vector<DataItem>& items,
        const LabelSpec& spec,
        bool visible);

} // namespace bpocv

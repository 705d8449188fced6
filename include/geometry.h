// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#pragma once
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace bpocv
{

    /**
     * @enum Layout
     * @brief Bar orientation.
     *
     * Horizontal layout places categories along x, so bars grow vertically
     * and the value axis is the y axis. Vertical layout is the transpose.
     */
    enum class Layout
    {
        Horizontal,
        Vertical
    };

    /**
     * @struct Geometry
     * @brief Rectangle in target (pixel) space, origin at the top-left corner.
     */
    struct Geometry
    {
        double x{ 0 }, y{ 0 };           ///< Top-left corner
        double width{ 0 }, height{ 0 };  ///< Extents, never negative once resolved
        std::size_t index{ 0 };          ///< Index of the source item (stable key)
    };

    /**
     * @struct DataItem
     * @brief One record of a Bar series, positional fields already scaled.
     *
     * A NaN in a numeric field means the field is missing.
     */
    struct DataItem
    {
        double x{ std::numeric_limits<double>::quiet_NaN() };
        double y{ std::numeric_limits<double>::quiet_NaN() };
        double width{ std::numeric_limits<double>::quiet_NaN() };
        double height{ std::numeric_limits<double>::quiet_NaN() };
        double value{ std::numeric_limits<double>::quiet_NaN() };
        std::string label;                     ///< Category label carried by the record
        std::optional<Geometry> background;    ///< Source-supplied background rectangle
    };

    /**
     * @struct PlotArea
     * @brief Offset of the plotting region inside the chart canvas.
     */
    struct PlotArea
    {
        double left{ 0 }, top{ 0 };
        double width{ 0 }, height{ 0 };
    };

    /// @brief True when the value axis of @p layout is the vertical axis.
    constexpr bool value_axis_is_vertical(Layout layout) { return layout == Layout::Horizontal; }

    /// @brief "horizontal" / "vertical".
    const char* to_string(Layout layout);

    /// @brief True for finite coordinates and finite, non-negative extents.
    bool is_well_formed(const Geometry& g);

    /**
     * @brief Convert data records into bar rectangles.
     *
     * Produces one Geometry per usable record, in input order. Records with a
     * missing x or y are skipped; a missing extent is treated as zero and a
     * negative extent is flipped so the rectangle covers the same area with
     * positive width and height. The layout does not alter the rectangles.
     *
     * @param items  Records of the series.
     * @param layout Bar orientation (logged only).
     * @return Rectangles, empty for an empty series.
     */
    std::vector<Geometry> resolve_geometry(const std::vector<DataItem>& items, Layout layout);

} // namespace bpocv

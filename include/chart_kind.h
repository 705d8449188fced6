// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#pragma once

namespace bpocv
{

    /**
     * @enum ChartKind
     * @brief Closed set of parent chart containers.
     */
    enum class ChartKind
    {
        Composed,
        Bar,
        Area,
        Line,
        Scatter,
        Pie,
        Radar,
        RadialBar,
        Funnel,
        Treemap,
        Sankey
    };

    /// @brief Name of the chart container, e.g. "BarChart".
    const char* to_string(ChartKind kind);

    /**
     * @brief Whether a chart of this kind hosts Bar series at all.
     *
     * Only containers with a cartesian category axis can place discrete
     * rectangles. Bars under any other kind render nothing.
     */
    bool admits_bar_series(ChartKind kind);

} // namespace bpocv

// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#include "chart_kind.h"

#include <algorithm>
#include <iterator>

namespace bpocv
{

    namespace
    {
        /* the single place deciding who can host a Bar series */
        constexpr ChartKind kBarHosts[] = { ChartKind::Composed, ChartKind::Bar };
    } // namespace

    const char* to_string(ChartKind kind)
    {
        switch (kind)
        {
        case ChartKind::Composed:  return "ComposedChart";
        case ChartKind::Bar:       return "BarChart";
        case ChartKind::Area:      return "AreaChart";
        case ChartKind::Line:      return "LineChart";
        case ChartKind::Scatter:   return "ScatterChart";
        case ChartKind::Pie:       return "PieChart";
        case ChartKind::Radar:     return "RadarChart";
        case ChartKind::RadialBar: return "RadialBarChart";
        case ChartKind::Funnel:    return "FunnelChart";
        case ChartKind::Treemap:   return "Treemap";
        case ChartKind::Sankey:    return "Sankey";
        }
        return "UnknownChart";
    }

    bool admits_bar_series(ChartKind kind)
    {
        return std::find(std::begin(kBarHosts), std::end(kBarHosts), kind) != std::end(kBarHosts);
    }

} // namespace bpocv

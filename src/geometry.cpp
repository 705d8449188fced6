// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#include "geometry.h"
#include "log.h"

#include <cmath>

namespace bpocv
{

    const char* to_string(Layout layout)
    {
        return layout == Layout::Horizontal ? "horizontal" : "vertical";
    }

    bool is_well_formed(const Geometry& g)
    {
        return std::isfinite(g.x) && std::isfinite(g.y)
            && std::isfinite(g.width) && std::isfinite(g.height)
            && g.width >= 0.0 && g.height >= 0.0;
    }

    std::vector<Geometry> resolve_geometry(const std::vector<DataItem>& items, Layout layout)
    {
        std::vector<Geometry> out;
        out.reserve(items.size());

        for (std::size_t i = 0; i < items.size(); ++i)
        {
            const DataItem& d = items[i];
            if (!std::isfinite(d.x) || !std::isfinite(d.y))
            {
                logger()->debug("[Bar] Skipping item {}: missing position", i);
                continue;
            }

            Geometry g;
            g.index = i;
            g.x = d.x;
            g.y = d.y;
            g.width = std::isfinite(d.width) ? d.width : 0.0;
            g.height = std::isfinite(d.height) ? d.height : 0.0;

            /* negative extents: move origin to the opposite edge */
            if (g.width < 0) { g.x += g.width;  g.width = -g.width; }
            if (g.height < 0) { g.y += g.height; g.height = -g.height; }

            out.push_back(g);
        }

        logger()->trace("[Bar] Resolved {} of {} items ({} layout)",
            out.size(), items.size(), to_string(layout));
        return out;
    }

} // namespace bpocv

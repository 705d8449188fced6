// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#pragma once
#include <optional>
#include <string>
#include <vector>

#include "render_node.h"

namespace bpocv
{

    /**
     * @enum LegendType
     * @brief Legend glyph of a series; None suppresses the legend entry.
     */
    enum class LegendType
    {
        Circle,
        Cross,
        Diamond,
        Line,
        PlainLine,
        Rect,
        Square,
        Star,
        Triangle,
        Wye,
        None
    };

    /// @brief Symbol name as used in configuration ("circle", "plainline", ...).
    const char* to_string(LegendType t);

    /// @brief Inverse of to_string(); std::nullopt for unknown names.
    std::optional<LegendType> parse_legend_type(const std::string& s);

    /**
     * @struct LegendEntry
     * @brief One legend registration made by a series.
     */
    struct LegendEntry
    {
        std::string value;     ///< Text shown next to the icon
        LegendType  type{ LegendType::Rect };
        std::string color;     ///< Icon fill, CSS color string
        std::string data_key;
    };

    /**
     * @brief Legend registration for one series.
     *
     * @param type     Series legend type.
     * @param name     Series display name; empty falls back to @p data_key.
     * @param data_key Key of the plotted value.
     * @param color    Series fill.
     * @return Exactly one entry, or std::nullopt when @p type is None.
     */
    std::optional<LegendEntry> legend_descriptor(LegendType type, const std::string& name,
        const std::string& data_key, const std::string& color);

    /**
     * @class LegendRegistry
     * @brief Collects the legend entries registered during one render pass.
     */
    class LegendRegistry
    {
    public:
        void add(LegendEntry e) { entries_.push_back(std::move(e)); }
        void clear() { entries_.clear(); }

        const std::vector<LegendEntry>& entries() const { return entries_; }
        std::size_t size() const { return entries_.size(); }
        bool empty() const { return entries_.empty(); }

    private:
        std::vector<LegendEntry> entries_;
    };

    /**
     * @brief Build the legend node tree for the registered entries.
     *
     * Items are laid out in one row centered horizontally at @p center_x,
     * with their top edge at @p top. Each item holds a legend icon
     * (class "recharts-legend-icon") and a text node
     * (class "recharts-legend-item-text").
     *
     * @return A "recharts-legend-wrapper" group, without children when the
     *         registry is empty.
     */
    RenderNode build_legend(const LegendRegistry& reg, double center_x, double top);

    /// @brief Side length of a legend icon in pixels.
    constexpr int kLegendIconSize = 14;

} // namespace bpocv

// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#pragma once
#include <map>
#include <string>
#include <vector>

namespace bpocv
{

    /// Attribute overrides supplied as a style object, applied in key order.
    using StyleMap = std::map<std::string, std::string>;

    /**
     * @enum NodeType
     * @brief Type-safe discriminator for RenderNode variants.
     */
    enum class NodeType
    {
        Group,       ///< Container, paints its children only
        Rect,        ///< Rectangle from x / y / width / height attributes
        Text,        ///< Text run anchored at x / y
        LegendIcon,  ///< Legend glyph, shape taken from "data-type"
        Custom       ///< Caller-built element (render functions, label templates)
    };

    /**
     * @struct RenderNode
     * @brief One node of the rendered scene handed to the painting layer.
     *
     * Class tokens and attribute names follow the SVG output of the web
     * charting library this series is compatible with, so a scene can be
     * inspected with the same selectors (".recharts-bar-rectangle", ...).
     * Attribute values are stored as strings exactly as they would be
     * written to markup.
     */
    struct RenderNode
    {
        NodeType type{ NodeType::Group };           ///< Active variant
        std::string tag{ "g" };                     ///< Element name ("g", "rect", "text", ...)
        std::vector<std::string> classes;           ///< Class tokens in document order
        std::map<std::string, std::string> attrs;   ///< Attributes (excluding "class")
        std::string text;                           ///< Text content (Text nodes)
        std::vector<RenderNode> children;           ///< Child nodes in paint order

        bool has_class(const std::string& token) const;
        void add_class(const std::string& token);

        /// @brief Replace the whole class list with the tokens of @p class_attr.
        void set_class(const std::string& class_attr);

        /// @brief Space-joined class tokens, as the "class" attribute would read.
        std::string class_attr() const;

        bool has_attr(const std::string& key) const;

        /// @brief Attribute value, or an empty string when absent.
        std::string attr(const std::string& key) const;

        void set_attr(const std::string& key, const std::string& value) { attrs[key] = value; }
        void set_attr(const std::string& key, const char* value) { attrs[key] = value; }
        void set_attr(const std::string& key, double value);

        /**
         * @brief Numeric attribute value.
         *
         * @return The parsed number, or @p fallback when the attribute is absent
         *         or not numeric.
         */
        double num_attr(const std::string& key, double fallback = 0.0) const;
    };

    /// @brief Build a node of the given type with space separated class tokens.
    RenderNode make_node(NodeType type, const std::string& tag, const std::string& class_attr = "");

    /// @brief Shorthand for a "g" group node.
    RenderNode make_group(const std::string& class_attr);

    /**
     * @brief Format a number the way it is written into markup.
     *
     * Integral values are written without a fractional part ("50"), other
     * values with up to 10 significant digits ("12.5").
     */
    std::string format_number(double v);

    /**
     * @brief Split a class attribute into tokens (whitespace separated).
     */
    std::vector<std::string> split_classes(const std::string& class_attr);

    /**
     * @brief Collect all nodes below (and including) @p root matching a selector.
     *
     * Supports compound class selectors only: ".a" matches nodes carrying
     * class a, ".a.b" nodes carrying both. Results are in document order.
     */
    std::vector<const RenderNode*> query_selector_all(const RenderNode& root,
        const std::string& selector);

} // namespace bpocv

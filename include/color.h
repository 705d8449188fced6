// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace bpocv
{

    struct Color
    {
        uint8_t r{ 0 }, g{ 0 }, b{ 0 };

        constexpr Color() = default;
        constexpr Color(uint8_t red, uint8_t green, uint8_t blue)
            : r(red), g(green), b(blue)
        {}

        /* named helpers */
        static constexpr Color Black() { return { 0, 0, 0 }; }
        static constexpr Color White() { return { 255, 255, 255 }; }
        static constexpr Color Red() { return { 255, 0, 0 }; }
        static constexpr Color Green() { return { 0, 128, 0 }; }
        static constexpr Color Blue() { return { 0, 0, 255 }; }
        static constexpr Color Gray() { return { 128, 128, 128 }; }

        constexpr bool operator==(const Color& o) const { return r == o.r && g == o.g && b == o.b; }
        constexpr bool operator!=(const Color& o) const { return !(*this == o); }
    };

    /**
     * @brief Parse a CSS-style color string.
     *
     * Accepts "#rgb", "#rrggbb" and a small set of named colors
     * ("black", "white", "red", "green", "blue", "gray"/"grey").
     *
     * @param s Color string, e.g. "#808080" or "red".
     * @return The color, or std::nullopt if @p s is not understood.
     */
    std::optional<Color> parse_color(const std::string& s);

    /**
     * @brief Parse a color, falling back to @p fallback when unparsable.
     *
     * An empty string or "none" silently yields the fallback; any other
     * unparsable value is logged at warn level.
     */
    Color color_or(const std::string& s, Color fallback);

    /// @brief Format as "#rrggbb" (lower case).
    std::string to_hex(const Color& c);

} // namespace bpocv

// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#include "color.h"
#include "log.h"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace bpocv
{

    namespace
    {
        int hex_digit(char c)
        {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }
    } // namespace

    std::optional<Color> parse_color(const std::string& s)
    {
        if (!s.empty() && s[0] == '#')
        {
            if (s.size() != 4 && s.size() != 7) return std::nullopt;
            const size_t step = (s.size() == 4) ? 1 : 2;
            uint8_t ch[3];
            for (size_t i = 0; i < 3; ++i)
            {
                const int hi = hex_digit(s[1 + i * step]);
                const int lo = hex_digit(s[1 + i * step + step - 1]);
                if (hi < 0 || lo < 0) return std::nullopt;
                ch[i] = static_cast<uint8_t>(hi * 16 + lo);
            }
            return Color(ch[0], ch[1], ch[2]);
        }

        std::string name(s);
        std::transform(name.begin(), name.end(), name.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (name == "black")                   return Color::Black();
        if (name == "white")                   return Color::White();
        if (name == "red")                     return Color::Red();
        if (name == "green")                   return Color::Green();
        if (name == "blue")                    return Color::Blue();
        if (name == "gray" || name == "grey")  return Color::Gray();
        return std::nullopt;
    }

    Color color_or(const std::string& s, Color fallback)
    {
        if (s.empty() || s == "none") return fallback;
        if (auto c = parse_color(s)) return *c;
        logger()->warn("[Color] Unrecognized color '{}', using {}", s, to_hex(fallback));
        return fallback;
    }

    std::string to_hex(const Color& c)
    {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", c.r, c.g, c.b);
        return buf;
    }

} // namespace bpocv

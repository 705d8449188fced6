#include <gtest/gtest.h>

#include "color.h"

using namespace bpocv;

TEST(ColorTest, ParsesHexForms)
{
    EXPECT_EQ(parse_color("#808080"), Color(128, 128, 128));
    EXPECT_EQ(parse_color("#eee"), Color(0xee, 0xee, 0xee));
    EXPECT_EQ(parse_color("#3182BD"), Color(0x31, 0x82, 0xbd));
}

TEST(ColorTest, ParsesNames)
{
    EXPECT_EQ(parse_color("red"), Color::Red());
    EXPECT_EQ(parse_color("Grey"), Color::Gray());
}

TEST(ColorTest, RejectsGarbage)
{
    EXPECT_FALSE(parse_color("").has_value());
    EXPECT_FALSE(parse_color("#12").has_value());
    EXPECT_FALSE(parse_color("#gggggg").has_value());
    EXPECT_FALSE(parse_color("chartreuse-ish").has_value());
    EXPECT_EQ(color_or("nope", Color::Blue()), Color::Blue());
    EXPECT_EQ(color_or("none", Color::White()), Color::White());
}

TEST(ColorTest, HexOutput)
{
    EXPECT_EQ(to_hex(Color(0x31, 0x82, 0xbd)), "#3182bd");
    EXPECT_EQ(to_hex(*parse_color("#eee")), "#eeeeee");
}

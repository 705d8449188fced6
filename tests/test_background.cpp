#include <gtest/gtest.h>

#include "background_renderer.h"
#include "bar_series.h"
#include "fixtures.h"

using namespace bpocv;

namespace
{
    const PlotArea kArea{ 5, 5, 490, 466 };
}

TEST(BackgroundRectTest, ItemDescriptorIsUsedVerbatim)
{
    const auto data = test::background_data();
    const auto geoms = resolve_geometry(data, Layout::Horizontal);

    const Geometry r = background_rect(geoms[0], &data[0], Layout::Horizontal, kArea);
    EXPECT_EQ(r.x, 10);
    EXPECT_EQ(r.y, 50);
    EXPECT_EQ(r.width, 20);
    EXPECT_EQ(r.height, 50);
}

TEST(BackgroundRectTest, SynthesizedAlongValueAxis)
{
    const Geometry bar{ 10, 50, 20, 30, 3 };

    const Geometry h = background_rect(bar, nullptr, Layout::Horizontal, kArea);
    EXPECT_EQ(h.x, 10);
    EXPECT_EQ(h.width, 20);
    EXPECT_EQ(h.y, 5);
    EXPECT_EQ(h.height, 466);
    EXPECT_EQ(h.index, 3u);

    const Geometry v = background_rect(bar, nullptr, Layout::Vertical, kArea);
    EXPECT_EQ(v.x, 5);
    EXPECT_EQ(v.width, 490);
    EXPECT_EQ(v.y, 50);
    EXPECT_EQ(v.height, 30);
}

TEST(BackgroundRectTest, MalformedDescriptorFallsBack)
{
    DataItem d{ 10, 50, 20, 30, 1, "bad", Geometry{ 0, 0, -4, 10 } };
    const Geometry bar{ 10, 50, 20, 30 };

    const Geometry r = background_rect(bar, &d, Layout::Horizontal, kArea);
    EXPECT_EQ(r.y, kArea.top);
    EXPECT_EQ(r.height, kArea.height);
}

TEST(BackgroundRendererTest, NoneRendersNothing)
{
    const auto data = test::reference_data();
    const auto geoms = resolve_geometry(data, Layout::Horizontal);
    EXPECT_TRUE(render_backgrounds(geoms, data, BackgroundSpec(), {}).empty());
    EXPECT_TRUE(render_backgrounds(geoms, data, BackgroundSpec::enabled(false), {}).empty());
}

TEST(BackgroundRendererTest, DefaultFillAndOnePerBar)
{
    const auto data = test::reference_data();
    const auto geoms = resolve_geometry(data, Layout::Horizontal);
    BackgroundContext ctx;
    ctx.area = kArea;

    const auto nodes = render_backgrounds(geoms, data, BackgroundSpec::enabled(true), ctx);
    ASSERT_EQ(nodes.size(), data.size());
    EXPECT_EQ(nodes[0].class_attr(), "recharts-bar-background-rectangle");
    EXPECT_EQ(nodes[0].attr("fill"), "#eee");
    EXPECT_EQ(nodes[0].attr("y"), "5");
    EXPECT_EQ(nodes[0].attr("height"), "466");
}

TEST(BackgroundRendererTest, ExplicitAttributesWinOverStyle)
{
    const auto data = test::background_data();
    const auto geoms = resolve_geometry(data, Layout::Horizontal);

    const auto nodes = render_backgrounds(geoms, data,
        BackgroundSpec::from_style({ { "fill", "#000" }, { "x", "999" }, { "stroke", "red" },
            { "className", "ignored" } }), {});
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes[1].attr("fill"), "#000");
    EXPECT_EQ(nodes[1].attr("stroke"), "red");
    EXPECT_EQ(nodes[1].attr("x"), "50");
    EXPECT_EQ(nodes[1].class_attr(), "recharts-bar-background-rectangle");
}

TEST(BackgroundRendererTest, AnimationEndHookSettlesSeries)
{
    BarProps p;
    p.data = test::background_data();
    p.label = LabelSpec::enabled(true);

    std::function<void()> end_hook;
    p.background = BackgroundSpec::from_function([&end_hook](const BackgroundProps& props) {
        end_hook = props.on_animation_end;
        return std::optional<RenderNode>();
    });
    BarSeries s(p);

    SeriesOutput first = s.render(ChartKind::Bar, kArea);
    EXPECT_TRUE(query_selector_all(first.layer, ".recharts-label").empty());
    ASSERT_TRUE(end_hook);

    end_hook();
    EXPECT_EQ(s.animation_state(), AnimationState::Settled);
    SeriesOutput second = s.render(ChartKind::Bar, kArea);
    EXPECT_EQ(query_selector_all(second.layer, ".recharts-label").size(), 2u);
}

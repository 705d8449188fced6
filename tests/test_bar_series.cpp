#include <gtest/gtest.h>

#include "bar_series.h"
#include "fixtures.h"

#include <string>
#include <vector>

using namespace bpocv;

namespace
{
    const PlotArea kArea{ 5, 5, 490, 466 };

    std::size_t count(const SeriesOutput& out, const std::string& selector)
    {
        return query_selector_all(out.layer, selector).size();
    }
}

/* --------------------------------------------------------------------------
 *  Replacing the configuration of a live series
 * ------------------------------------------------------------------------*/
class BarSeriesTest : public ::testing::Test
{
protected:
    const std::vector<DataItem> data = test::reference_data();

    BarProps labelled(bool animated) const
    {
        BarProps p;
        p.data = data;
        p.label = LabelSpec::enabled(true);
        p.is_animation_active = animated;
        return p;
    }
};

TEST_F(BarSeriesTest, SetDataRestartsTheEnterAnimation)
{
    BarSeries s(labelled(true));
    s.tick(500);
    ASSERT_EQ(s.animation_state(), AnimationState::Settled);
    ASSERT_EQ(count(s.render(ChartKind::Bar, kArea), ".recharts-label"), data.size());

    std::vector<DataItem> fewer(data.begin(), data.begin() + 3);
    s.set_data(fewer);
    EXPECT_EQ(s.animation_state(), AnimationState::Idle);
    EXPECT_EQ(s.props().data.size(), 3u);

    SeriesOutput out = s.render(ChartKind::Bar, kArea);
    EXPECT_EQ(count(out, ".recharts-label"), 0u);
    EXPECT_EQ(count(out, ".recharts-bar-rectangle"), 3u);
    EXPECT_EQ(out.geometries.size(), 3u);

    s.tick(500);
    EXPECT_EQ(count(s.render(ChartKind::Bar, kArea), ".recharts-label"), 3u);
}

TEST_F(BarSeriesTest, SetDataWithoutAnimationKeepsLabelsVisible)
{
    BarSeries s(labelled(false));
    EXPECT_EQ(s.animation_state(), AnimationState::Settled);
    ASSERT_EQ(count(s.render(ChartKind::Bar, kArea), ".recharts-label"), data.size());

    s.set_data(test::background_data());
    EXPECT_EQ(s.animation_state(), AnimationState::Settled);

    SeriesOutput out = s.render(ChartKind::Bar, kArea);
    EXPECT_EQ(count(out, ".recharts-label"), 2u);
    EXPECT_EQ(count(out, ".recharts-bar-rectangle"), 2u);
}

TEST_F(BarSeriesTest, SetLabelAndBackgroundApplyOnNextRender)
{
    BarProps p;
    p.data = data;
    p.is_animation_active = false;
    BarSeries s(p);

    SeriesOutput before = s.render(ChartKind::Bar, kArea);
    EXPECT_EQ(count(before, ".recharts-label"), 0u);
    EXPECT_EQ(count(before, ".recharts-bar-background-rectangle"), 0u);

    s.set_label(LabelSpec::from_style({ { "className", "bar-value" } }));
    s.set_background(BackgroundSpec::from_style({ { "fill", "#000" } }));
    EXPECT_EQ(s.props().label.kind, LabelKind::Style);
    EXPECT_EQ(s.props().background.kind, BackgroundKind::Style);

    SeriesOutput after = s.render(ChartKind::Bar, kArea);
    EXPECT_EQ(count(after, ".recharts-text.bar-value"), data.size());
    const auto bgs = query_selector_all(after.layer, ".recharts-bar-background-rectangle");
    ASSERT_EQ(bgs.size(), data.size());
    EXPECT_EQ(bgs[0]->attr("fill"), "#000");

    s.set_label(LabelSpec::enabled(false));
    s.set_background(BackgroundSpec::enabled(false));
    SeriesOutput cleared = s.render(ChartKind::Bar, kArea);
    EXPECT_EQ(count(cleared, ".recharts-text"), 0u);
    EXPECT_EQ(count(cleared, ".recharts-bar-background-rectangle"), 0u);
}

/* --------------------------------------------------------------------------
 *  One render pass sees one animation state
 * ------------------------------------------------------------------------*/
TEST_F(BarSeriesTest, AnimationEndDuringPassTakesEffectNextPass)
{
    BarProps p;
    p.data = test::background_data();
    p.label = LabelSpec::enabled(true);

    int calls = 0;
    p.background = BackgroundSpec::from_function([&calls](const BackgroundProps& props) {
        ++calls;
        props.on_animation_end();
        return std::optional<RenderNode>();
    });
    BarSeries s(p);
    ASSERT_EQ(s.animation_state(), AnimationState::Idle);

    SeriesOutput first = s.render(ChartKind::Bar, kArea);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(s.animation_state(), AnimationState::Settled);
    EXPECT_EQ(count(first, ".recharts-label"), 0u);

    /* both bars still at the start of the enter animation: collapsed onto their base */
    const auto collapsed = query_selector_all(first.layer, ".recharts-bar-rectangle");
    ASSERT_EQ(collapsed.size(), 2u);
    EXPECT_EQ(collapsed[0]->attr("height"), "0");
    EXPECT_EQ(collapsed[0]->attr("y"), "70");
    EXPECT_EQ(collapsed[1]->attr("height"), "0");
    EXPECT_EQ(collapsed[1]->attr("y"), "100");

    SeriesOutput second = s.render(ChartKind::Bar, kArea);
    EXPECT_EQ(count(second, ".recharts-label"), 2u);
    const auto rects = query_selector_all(second.layer, ".recharts-bar-rectangle");
    ASSERT_EQ(rects.size(), 2u);
    EXPECT_EQ(rects[1]->attr("height"), "50");
    EXPECT_EQ(rects[1]->attr("y"), "50");
}

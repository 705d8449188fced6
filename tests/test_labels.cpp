#include <gtest/gtest.h>

#include "fixtures.h"
#include "label_renderer.h"

using namespace bpocv;

class LabelRendererTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        data = test::reference_data();
        geoms = resolve_geometry(data, Layout::Horizontal);
    }

    std::vector<DataItem> data;
    std::vector<Geometry> geoms;
};

TEST_F(LabelRendererTest, NoneRendersNothing)
{
    EXPECT_TRUE(render_labels(geoms, data, LabelSpec(), true).empty());
    EXPECT_TRUE(render_labels(geoms, data, LabelSpec::enabled(false), true).empty());
}

TEST_F(LabelRendererTest, HiddenWhileNotVisible)
{
    EXPECT_TRUE(render_labels(geoms, data, LabelSpec::enabled(true), false).empty());
    EXPECT_TRUE(render_labels(geoms, data, LabelSpec::from_element(make_group("x")), false).empty());
}

TEST_F(LabelRendererTest, DefaultLabelShowsValueAtBarCenter)
{
    const auto labels = render_labels(geoms, data, LabelSpec::enabled(true), true);
    ASSERT_EQ(labels.size(), data.size());

    const RenderNode& l = labels[0];
    EXPECT_EQ(l.type, NodeType::Text);
    EXPECT_EQ(l.class_attr(), "recharts-text recharts-label");
    EXPECT_EQ(l.attr("x"), "20");
    EXPECT_EQ(l.attr("y"), "75");
    EXPECT_EQ(l.text, "100");
    EXPECT_EQ(labels[4].text, "500");
}

TEST_F(LabelRendererTest, StyleOverridesDefaults)
{
    const auto labels = render_labels(geoms, data,
        LabelSpec::from_style({ { "text-anchor", "start" }, { "className", "a b" } }), true);
    ASSERT_EQ(labels.size(), data.size());

    EXPECT_EQ(labels[0].attr("text-anchor"), "start");
    EXPECT_EQ(labels[0].attr("fill"), "#808080");
    EXPECT_EQ(labels[0].class_attr(), "recharts-text a b");
    EXPECT_FALSE(labels[0].has_attr("className"));
}

TEST_F(LabelRendererTest, FunctionReturningNothingRendersNothing)
{
    int calls = 0;
    const auto labels = render_labels(geoms, data,
        LabelSpec::from_function([&calls](const LabelProps&, const LabelContext&) {
            ++calls;
            return std::optional<RenderNode>();
        }), true);

    EXPECT_TRUE(labels.empty());
    EXPECT_EQ(calls, static_cast<int>(data.size()));
}

TEST_F(LabelRendererTest, FunctionOutputCarriesItsOwnContent)
{
    int with_content = 0;
    LabelFn fn = [&with_content](const LabelProps& p, const LabelContext&) -> std::optional<RenderNode> {
        if (p.content) ++with_content;
        RenderNode n = make_node(NodeType::Custom, "g", "v");
        n.text = format_number(p.value);
        return n;
    };
    const auto labels = render_labels(geoms, data, LabelSpec::from_function(fn), true);
    ASSERT_EQ(labels.size(), data.size());
    EXPECT_EQ(with_content, static_cast<int>(data.size()));
    EXPECT_EQ(labels[2].text, "300");
    EXPECT_EQ(labels[2].class_attr(), "v");
}

TEST_F(LabelRendererTest, ElementKeepsTemplateAndUsesNearEdge)
{
    RenderNode tmpl = make_node(NodeType::Custom, "g", "tmpl");
    tmpl.set_attr("data-kind", "custom");
    tmpl.children.push_back(make_node(NodeType::Custom, "circle", "dot"));

    const auto labels = render_labels(geoms, data, LabelSpec::from_element(tmpl), true);
    ASSERT_EQ(labels.size(), data.size());

    EXPECT_EQ(labels[1].attr("data-kind"), "custom");
    EXPECT_EQ(labels[1].children.size(), 1u);
    EXPECT_EQ(labels[1].attr("x"), "50");
    EXPECT_EQ(labels[1].attr("y"), "50");
    EXPECT_FALSE(labels[1].has_attr("text-anchor"));
    EXPECT_FALSE(tmpl.has_attr("x"));
}

TEST_F(LabelRendererTest, EmptyFunctionFallsBackToNone)
{
    EXPECT_EQ(LabelSpec::from_function(LabelFn()).kind, LabelKind::None);
}

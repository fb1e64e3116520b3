#include "test_support.hpp"

using namespace cppwid;
using namespace cppwid::test_support;

namespace {

    std::vector<std::shared_ptr<CountingButton>> make_buttons(int n) {
        std::vector<std::shared_ptr<CountingButton>> res;
        for (int i = 0; i < n; ++i) res.push_back(std::make_shared<CountingButton>("abc"));
        return res;
    }

    std::vector<std::shared_ptr<Widget>> as_widgets(const std::vector<std::shared_ptr<CountingButton>>& bs) {
        return std::vector<std::shared_ptr<Widget>>(bs.begin(), bs.end());
    }

    const std::string three_by_three =
        "  <abc> <abc> <abc> \n"
        "                    \n"
        "  <abc> <abc> <abc> \n"
        "                    \n"
        "  <abc> <abc> <abc> ";

}

TEST(Grid, LaysOutRows) {
    auto g = std::make_shared<Grid>(as_widgets(make_buttons(9)), 5, 1, 1, Alignment::Center);
    EXPECT_EQ(g->render(RenderSize::Box(20, 5), Focused).to_string(), three_by_three);
    EXPECT_EQ(g->render(RenderSize::FlowWith(20), Focused).to_string(), three_by_three);
    render_box_many_times(*g, 1, 22, 1, 6);
}

TEST(Grid, PartialLastRow) {
    auto g = std::make_shared<Grid>(as_widgets(make_buttons(4)), 5, 1, 0, Alignment::Left);
    EXPECT_EQ(g->render(RenderSize::FlowWith(19), Focused).to_string(),
              "<abc> <abc> <abc>  \n"
              "<abc>              ");
}

TEST(Grid, GeneratedStructure) {
    auto g = std::make_shared<Grid>(as_widgets(make_buttons(5)), 5, 1, 1, Alignment::Right);
    g->set_focus(4);
    Grid::Generated gen = g->generate_widgets(RenderSize::FlowWith(13));
    EXPECT_EQ(gen.items_per_row, 2);
    ASSERT_EQ(gen.rows.size(), 3u);
    EXPECT_EQ(gen.pile->child_count(), 5);
    EXPECT_EQ(gen.pile->focus(), 4);
    EXPECT_EQ(gen.rows[2]->focus(), 0);
    EXPECT_EQ(row_col_of(4, 2), std::make_pair(2, 0));
    EXPECT_EQ(flat_index(2, 0, 2), 4);
}

TEST(Grid, FlatIndexRoundTrip) {
    for (int k = 1; k <= 5; ++k) {
        for (int i = 0; i < 23; ++i) {
            auto rc = row_col_of(i, k);
            EXPECT_EQ(rc.first, i / k);
            EXPECT_LT(rc.second, k);
            EXPECT_EQ(flat_index(rc.first, rc.second, k), i) << "i=" << i << " k=" << k;
        }
    }
}

TEST(Grid, SetSubWidgetsReportsFocusChange) {
    auto g = std::make_shared<Grid>(as_widgets(make_buttons(3)), 5, 1, 1);
    g->set_focus(2);
    int calls = 0;
    g->on_focus_changed("test", [&](Grid&) { calls++; });

    g->set_sub_widgets(std::vector<std::shared_ptr<Widget>>{std::make_shared<CountingButton>("a")});
    EXPECT_EQ(g->focus(), 0);
    EXPECT_EQ(calls, 1);

    g->set_sub_widgets(std::vector<std::shared_ptr<Widget>>{text("x"), std::make_shared<CountingButton>("b")});
    EXPECT_EQ(g->focus(), 1);
    EXPECT_EQ(calls, 2);

    g->set_sub_widgets(std::vector<std::shared_ptr<Widget>>{text("x"), std::make_shared<CountingButton>("c")});
    EXPECT_EQ(g->focus(), 1);
    EXPECT_EQ(calls, 2);

    g->set_sub_widgets(std::vector<std::shared_ptr<Widget>>{text("x")});
    EXPECT_EQ(g->focus(), -1);
    EXPECT_EQ(calls, 3);
}

TEST(Grid, RejectsFixedAndBadWidth) {
    auto g = std::make_shared<Grid>(as_widgets(make_buttons(2)), 5, 1, 1);
    EXPECT_THROW(g->render(RenderSize::Fixed(), Focused), ConfigurationError);
    g->set_width(0);
    EXPECT_THROW(g->render(RenderSize::FlowWith(10), Focused), ConfigurationError);
}

TEST(Grid, TooNarrowRendersEmpty) {
    auto g = std::make_shared<Grid>(as_widgets(make_buttons(2)), 5, 1, 1);
    EXPECT_EQ(g->generate_widgets(RenderSize::FlowWith(4)).items_per_row, 0);
    EXPECT_EQ(g->render(RenderSize::Box(4, 1), Focused).to_string(), "    ");
    InputContext ctx;
    EXPECT_FALSE(g->on_event(cursor_down(), RenderSize::Box(4, 1), Focused, ctx));
}

TEST(Grid, Navigation) {
    auto buttons = make_buttons(9);
    auto g = std::make_shared<Grid>(as_widgets(buttons), 5, 1, 1, Alignment::Center);
    RenderSize size = RenderSize::FlowWith(20);
    InputContext ctx;

    int calls = 0;
    g->on_focus_changed("test", [&](Grid& w) {
        calls++;
        EXPECT_EQ(&w, g.get());
    });

    EXPECT_EQ(g->focus(), 0);
    EXPECT_TRUE(g->on_event(cursor_right(), size, Focused, ctx));
    EXPECT_EQ(g->focus(), 1);
    EXPECT_EQ(calls, 1);

    EXPECT_TRUE(g->on_event(key_event(keys::Space), size, Focused, ctx));
    EXPECT_EQ(g->focus(), 1);
    EXPECT_EQ(buttons[1]->clicks, 1);
    EXPECT_EQ(calls, 1);

    g->on_event(wheel_down(), size, Focused, ctx);
    EXPECT_EQ(g->focus(), 4);
    g->on_event(wheel_down(), size, Focused, ctx);
    EXPECT_EQ(g->focus(), 7);
    EXPECT_FALSE(g->on_event(wheel_down(), size, Focused, ctx));
    EXPECT_EQ(g->focus(), 7);
    EXPECT_EQ(calls, 3);

    g->on_event(wheel_up(), size, Focused, ctx);
    EXPECT_EQ(g->focus(), 4);
    g->on_event(wheel_up(), size, Focused, ctx);
    EXPECT_EQ(g->focus(), 1);
    g->on_event(wheel_up(), size, Focused, ctx);
    EXPECT_EQ(g->focus(), 1);

    g->on_event(wheel_right(), size, Focused, ctx);
    EXPECT_EQ(g->focus(), 2);
    g->on_event(wheel_right(), size, Focused, ctx);
    EXPECT_EQ(g->focus(), 2);

    g->on_event(cursor_down(), size, Focused, ctx);
    EXPECT_EQ(g->focus(), 5);

    g->on_event(wheel_left(), size, Focused, ctx);
    EXPECT_EQ(g->focus(), 4);
    g->on_event(wheel_left(), size, Focused, ctx);
    EXPECT_EQ(g->focus(), 3);
    g->on_event(wheel_left(), size, Focused, ctx);
    EXPECT_EQ(g->focus(), 3);

    g->on_event(cursor_left(), size, Focused, ctx);
    EXPECT_EQ(g->focus(), 2);
    g->on_event(cursor_left(), size, Focused, ctx);
    EXPECT_EQ(g->focus(), 1);
    g->on_event(cursor_left(), size, Focused, ctx);
    EXPECT_EQ(g->focus(), 0);
    EXPECT_FALSE(g->on_event(cursor_left(), size, Focused, ctx));
    EXPECT_EQ(g->focus(), 0);
}

TEST(Grid, KeysIgnoredWithoutFocus) {
    auto buttons = make_buttons(3);
    auto g = std::make_shared<Grid>(as_widgets(buttons), 5, 1, 1);
    InputContext ctx;
    g->on_event(key_event(keys::Enter), RenderSize::FlowWith(20), Selected, ctx);
    EXPECT_EQ(buttons[0]->clicks, 0);
}

TEST(Grid, ClickFocusesItem) {
    auto buttons = make_buttons(9);
    auto g = std::make_shared<Grid>(as_widgets(buttons), 5, 1, 1, Alignment::Center);
    RenderSize size = RenderSize::FlowWith(20);
    InputContext ctx;

    // second row, third item: the row starts at x=2, the item spans x=14..18
    EXPECT_TRUE(ctx.dispatch(*g, click_at(15, 2), size));
    EXPECT_EQ(buttons[5]->clicks, 1);
    EXPECT_EQ(g->focus(), 0);

    ctx.dispatch(*g, click_up_at(15, 2), size);
    EXPECT_EQ(g->focus(), 5);
}

TEST(Grid, SettersNotify) {
    auto g = std::make_shared<Grid>(as_widgets(make_buttons(2)), 5, 1, 1);
    int changes = 0;
    auto count = [&](Grid&) { changes++; };
    g->on_width_changed("t", count);
    g->on_h_sep_changed("t", count);
    g->on_v_sep_changed("t", count);
    g->on_align_changed("t", count);
    g->on_subwidgets_changed("t", count);

    g->set_width(3);
    g->set_h_sep(2);
    g->set_v_sep(0);
    g->set_align(Alignment::Right);
    g->set_sub_widgets({text("x")});
    EXPECT_EQ(changes, 5);
    EXPECT_EQ(g->width(), 3);
    EXPECT_EQ(g->h_sep(), 2);
    EXPECT_EQ(g->v_sep(), 0);
    EXPECT_EQ(g->align(), Alignment::Right);
    EXPECT_EQ(g->focus(), -1);
    EXPECT_FALSE(g->selectable());
}

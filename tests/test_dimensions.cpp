#include "test_support.hpp"

using namespace cppwid;

namespace {

    std::vector<int> divide(const std::vector<int>& weights, const std::vector<std::optional<int>>& caps, int space,
                            int* left_over = nullptr) {
        std::vector<int> res(weights.size(), 0);
        int left = divide_by_weight(weights, caps, space, res);
        if (left_over) *left_over = left;
        return res;
    }

}

TEST(Dimensions, WeightsShareSpace) {
    std::vector<std::optional<int>> none(3);
    EXPECT_EQ(divide({1, 1, 1}, none, 12), (std::vector<int>{4, 4, 4}));
    EXPECT_EQ(divide({6, 2, 0}, none, 4), (std::vector<int>{3, 1, 0}));
    EXPECT_EQ(divide({1, 1, 1}, none, 0), (std::vector<int>{0, 0, 0}));
}

TEST(Dimensions, RemainderGoesToLastTaker) {
    std::vector<std::optional<int>> none(3);
    std::vector<int> res = divide({1, 1, 1}, none, 10);
    EXPECT_EQ(res[0] + res[1] + res[2], 10);
    EXPECT_EQ(res, (std::vector<int>{3, 3, 4}));
}

TEST(Dimensions, CappedWeightsArePinned) {
    EXPECT_EQ(divide({1, 1, 1}, {std::nullopt, std::nullopt, 2}, 12), (std::vector<int>{5, 5, 2}));
    EXPECT_EQ(divide({1, 1}, {4, 2}, 6), (std::vector<int>{4, 2}));
}

TEST(Dimensions, AllCappedLeavesSpace) {
    int left = 0;
    EXPECT_EQ(divide({1, 1}, {2, 2}, 6, &left), (std::vector<int>{2, 2}));
    EXPECT_EQ(left, 2);
}

TEST(Dimensions, HorizontalSubSize) {
    EXPECT_EQ(compute_horizontal_sub_size(RenderSize::Box(10, 3), Dimension::Units(4)), RenderSize::Box(4, 3));
    EXPECT_EQ(compute_horizontal_sub_size(RenderSize::FlowWith(10), Dimension::Units(4)), RenderSize::FlowWith(4));
    EXPECT_EQ(compute_horizontal_sub_size(RenderSize::Fixed(), Dimension::Units(4)), RenderSize::FlowWith(4));
    EXPECT_EQ(compute_horizontal_sub_size(RenderSize::Box(10, 3), Dimension::Ratio(0.25)), RenderSize::Box(3, 3));
    EXPECT_EQ(compute_horizontal_sub_size(RenderSize::Box(10, 3), Dimension::Relative(0.25)), RenderSize::Box(3, 3));
    EXPECT_EQ(compute_horizontal_sub_size(RenderSize::FlowWith(10), Dimension::Relative(0.35)), RenderSize::FlowWith(4));
    EXPECT_EQ(compute_horizontal_sub_size(RenderSize::FlowWith(10), Dimension::Flow()), RenderSize::FlowWith(10));
    EXPECT_EQ(compute_horizontal_sub_size(RenderSize::Box(10, 3), Dimension::Fixed()), RenderSize::Fixed());
    EXPECT_THROW(compute_horizontal_sub_size(RenderSize::Box(10, 3), Dimension::Weight(1)), DimensionError);
}

TEST(Dimensions, VerticalSubSize) {
    RenderSize box = RenderSize::Box(5, 10);
    EXPECT_EQ(compute_vertical_sub_size(box, Dimension::Units(2), -1, -1), RenderSize::Box(5, 2));
    EXPECT_EQ(compute_vertical_sub_size(box, Dimension::Flow(), -1, -1), RenderSize::FlowWith(5));
    EXPECT_EQ(compute_vertical_sub_size(box, Dimension::Ratio(0.25), -1, -1), RenderSize::Box(5, 3));
    EXPECT_EQ(compute_vertical_sub_size(box, Dimension::Relative(0.25), -1, -1), RenderSize::Box(5, 3));
    EXPECT_EQ(compute_vertical_sub_size(box, Dimension::Relative(0.5), -1, -1, 4), RenderSize::Box(5, 4));
    EXPECT_EQ(compute_vertical_sub_size(box, Dimension::Ratio(0.5), -1, -1, 7), RenderSize::Box(5, 5));
    EXPECT_EQ(compute_vertical_sub_size(box, Dimension::Weight(1), -1, 4), RenderSize::Box(5, 4));
    EXPECT_FALSE(vertical_sub_size(box, Dimension::Weight(1), -1, -1).has_value());
    EXPECT_THROW(compute_vertical_sub_size(box, Dimension::Box(2, 2), -1, -1), DimensionError);

    EXPECT_EQ(compute_vertical_sub_size(RenderSize::FlowWith(7), Dimension::Units(3), -1, -1), RenderSize::Box(7, 3));
    EXPECT_THROW(compute_vertical_sub_size(RenderSize::FlowWith(7), Dimension::Ratio(0.5), -1, -1), DimensionError);

    EXPECT_EQ(compute_vertical_sub_size(RenderSize::Fixed(), Dimension::Flow(), 6, -1), RenderSize::FlowWith(6));
    EXPECT_THROW(compute_vertical_sub_size(RenderSize::Fixed(), Dimension::Flow(), -1, -1), DimensionError);
}

TEST(Dimensions, Describe) {
    EXPECT_EQ(Dimension::Units(3).to_string(), "units(3)");
    EXPECT_EQ(Dimension::Weight(2, 5).to_string(), "weight(2,max:5)");
    EXPECT_EQ(Dimension::Units(1).with_max_height().to_string(), "units(1)+max");
    EXPECT_TRUE(Dimension::Max().is_max());
    EXPECT_EQ(RenderSize::Box(3, 4).to_string(), "box(c:3,r:4)");
    EXPECT_FALSE(RenderSize::FlowWith(3).has_rows());
    EXPECT_TRUE(RenderSize::FlowWith(3).has_columns());
}

TEST(Dimensions, Selector) {
    EXPECT_EQ(Focused.select_if(true), Focused);
    EXPECT_EQ(Focused.select_if(false), NotSelected);
    EXPECT_EQ(Selected.select_if(true), Selected);
    EXPECT_EQ(Focused.and_if(false), NotSelected);
    EXPECT_EQ(Selected.and_if(true), Selected);
}

TEST(Dimensions, KeyBindings) {
    using test_support::key_event;
    EXPECT_TRUE(key_in(key_event(keys::Up), all_up_keys()));
    EXPECT_TRUE(key_in(key_event('k'), all_up_keys()));
    EXPECT_TRUE(key_in(key_event(keys::CtrlP), all_up_keys()));
    EXPECT_TRUE(key_in(key_event('p', true), all_up_keys()));
    EXPECT_FALSE(key_in(key_event('p'), all_up_keys()));
    EXPECT_TRUE(key_in(key_event(keys::CtrlN), all_down_keys()));
    EXPECT_TRUE(key_in(key_event('h'), all_left_keys()));
    EXPECT_TRUE(key_in(key_event(keys::CtrlF), all_right_keys()));
    EXPECT_FALSE(key_in(test_support::click_at(0, 0), all_right_keys()));
}

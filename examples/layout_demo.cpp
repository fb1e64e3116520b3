#include "cppwid.hpp"

#include <iostream>

using namespace cppwid;

// A selectable label that shows a marker while it has the focus
class Label : public Widget {
public:
    Label(std::string text) : text_(std::move(text)) {}

    Canvas render(const RenderSize& size, const Selector& focus) override {
        Text t(focus.focus ? "[" + text_ + "]" : " " + text_ + " ");
        return t.render(size, focus);
    }

    bool selectable() const override { return true; }

private:
    std::string text_;
};

static void show(const std::string& title, Widget& w, const RenderSize& size) {
    std::cout << "== " << title << " (" << size.to_string() << ") ==\n";
    std::cout << w.render(size, Focused).to_string() << "\n\n";
}

int main() {
    set_log_level(spdlog::level::info);
    logger()->info("cppwid {}", version());

    // Top row: fixed menu, weighted content, capped side panel
    auto top_row = std::make_shared<Columns>(std::vector<ContainerChild>{
        {std::make_shared<Label>("Menu"), Dimension::Fixed()},
        {std::make_shared<Fill>('.'), Dimension::Weight(2)},
        {std::make_shared<Fill>(':'), Dimension::Weight(1, 4)},
    });

    // Middle: stacked items beside a separator as tall as they are
    auto menu = Pile::flow({std::make_shared<Label>("One"), std::make_shared<Label>("Two"),
                            std::make_shared<Label>("Three")});
    auto mid_row = std::make_shared<Columns>(std::vector<ContainerChild>{
        {menu, Dimension::Units(8)},
        {std::make_shared<Fill>('|'), Dimension::Units(1).with_max_height()},
        {std::make_shared<Text>("Main content area wraps to the width left over"), Dimension::Weight(1)},
    });

    auto root = std::make_shared<Pile>(std::vector<ContainerChild>{
        {top_row, Dimension::Units(1)},
        {mid_row, Dimension::Weight(1)},
        {std::make_shared<Text>("status: ready"), Dimension::Flow()},
    });

    RenderSize screen = RenderSize::Box(30, 6);
    show("layout", *root, screen);

    InputContext ctx;
    ctx.dispatch(*root, Event{EventType::Key, keys::Down}, screen);
    ctx.dispatch(*root, Event{EventType::Key, keys::Down}, screen);
    show("after two down keys", *root, screen);

    std::vector<std::shared_ptr<Widget>> items;
    for (int i = 1; i <= 7; ++i) {
        items.push_back(std::make_shared<Label>("#" + std::to_string(i)));
    }
    Grid grid(items, 4, 1, 0, Alignment::Center);
    show("grid", grid, RenderSize::FlowWith(17));
    show("grid", grid, RenderSize::FlowWith(11));

    return 0;
}

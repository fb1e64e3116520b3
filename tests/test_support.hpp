#pragma once

#include "cppwid.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cppwid {
namespace test_support {

    inline Event key_event(int key, bool ctrl = false) {
        Event ev;
        ev.type = EventType::Key;
        ev.key = key;
        ev.ctrl = ctrl;
        return ev;
    }

    inline Event key_rune(char ch) { return key_event(ch); }
    inline Event cursor_up() { return key_event(keys::Up); }
    inline Event cursor_down() { return key_event(keys::Down); }
    inline Event cursor_left() { return key_event(keys::Left); }
    inline Event cursor_right() { return key_event(keys::Right); }

    inline Event mouse_event(int button, int x, int y) {
        Event ev;
        ev.type = EventType::Mouse;
        ev.button = button;
        ev.x = x;
        ev.y = y;
        return ev;
    }

    inline Event click_at(int x, int y) { return mouse_event(buttons::Left, x, y); }
    inline Event click_up_at(int x, int y) { return mouse_event(buttons::Release, x, y); }
    inline Event wheel_up() { return mouse_event(buttons::WheelUp, 0, 0); }
    inline Event wheel_down() { return mouse_event(buttons::WheelDown, 0, 0); }
    inline Event wheel_left() { return mouse_event(buttons::WheelLeft, 0, 0); }
    inline Event wheel_right() { return mouse_event(buttons::WheelRight, 0, 0); }

    /// Selectable widget showing its id, with an "f" marker while focused.
    /// It takes every mouse event and ignores keys.
    class NumberWidget : public Widget {
    public:
        explicit NumberWidget(int id) : id_(id) {}

        Canvas render(const RenderSize& size, const Selector& focus) override {
            Text t(std::to_string(id_) + (focus.focus ? "f" : " "));
            return t.render(size, focus);
        }

        bool on_event(const Event& event, const RenderSize& size, const Selector& focus, InputContext& ctx) override {
            return event.is_mouse();
        }

        bool selectable() const override { return true; }

        int id() const { return id_; }

    private:
        int id_;
    };

    /// Selectable "<label>" that counts Enter/Space presses and left clicks.
    class CountingButton : public Widget {
    public:
        explicit CountingButton(std::string label) : label_(std::move(label)) {}

        Canvas render(const RenderSize& size, const Selector& focus) override {
            Canvas c = Text("<" + label_ + ">").render(RenderSize::Fixed(), focus);
            make_canvas_right_size(c, size);
            return c;
        }

        bool on_event(const Event& event, const RenderSize& size, const Selector& focus, InputContext& ctx) override {
            if (event.is_key() && (event.key == keys::Enter || event.key == keys::Space)) {
                clicks++;
                return true;
            }
            if (event.mouse_left()) {
                clicks++;
                return true;
            }
            return false;
        }

        bool selectable() const override { return true; }

        int clicks = 0;

    private:
        std::string label_;
    };

    /// Selectable widget that records the coordinates of every mouse event it receives.
    class MouseRecorder : public Widget {
    public:
        Canvas render(const RenderSize& size, const Selector& focus) override {
            return Fill('m').render(size, focus);
        }

        bool on_event(const Event& event, const RenderSize& size, const Selector& focus, InputContext& ctx) override {
            if (!event.is_mouse()) return false;
            xs.push_back(event.x);
            ys.push_back(event.y);
            return true;
        }

        bool selectable() const override { return true; }

        std::vector<int> xs;
        std::vector<int> ys;
    };

    /// Selectable widget with a preferred position that logs every position it is given.
    class PositionRecorder : public Widget, public PreferredPosition {
    public:
        explicit PositionRecorder(int pos) : pos_(pos) {}

        Canvas render(const RenderSize& size, const Selector& focus) override {
            return Text(std::to_string(pos_)).render(size, focus);
        }

        bool selectable() const override { return true; }

        std::optional<int> get_preferred_position() const override { return pos_; }
        void set_preferred_position(int pos) override {
            pos_ = pos;
            given.push_back(pos);
        }
        PreferredPosition* preferred_position() override { return this; }

        std::vector<int> given;

    private:
        int pos_;
    };

    inline std::shared_ptr<Widget> text(const std::string& s) { return std::make_shared<Text>(s); }
    inline std::shared_ptr<Widget> fill(char ch) { return std::make_shared<Fill>(ch); }
    inline std::shared_ptr<Widget> selectable_text(const std::string& s) {
        return std::make_shared<Selectable>(std::make_shared<Text>(s));
    }

    /// Render at several box sizes and check the canvas always matches the size asked for.
    inline void render_box_many_times(Widget& w, int min_cols, int max_cols, int min_rows, int max_rows) {
        for (int c = min_cols; c <= max_cols; ++c) {
            for (int r = min_rows; r <= max_rows; ++r) {
                Canvas canvas = w.render(RenderSize::Box(c, r), Focused);
                EXPECT_EQ(canvas.columns(), c) << "box " << c << "x" << r;
                EXPECT_EQ(canvas.rows(), r) << "box " << c << "x" << r;
                EXPECT_EQ(w.render_size(RenderSize::Box(c, r), Focused), (RenderBox{c, r}));
            }
        }
    }

    /// Render at several flow widths and check the width and the reported size.
    inline void render_flow_many_times(Widget& w, int min_cols, int max_cols) {
        for (int c = min_cols; c <= max_cols; ++c) {
            Canvas canvas = w.render(RenderSize::FlowWith(c), Focused);
            EXPECT_EQ(canvas.columns(), c) << "flow " << c;
            RenderBox b = w.render_size(RenderSize::FlowWith(c), Focused);
            EXPECT_EQ(b.rows, canvas.rows()) << "flow " << c;
        }
    }

    /// Render fixed and check the reported size matches the canvas.
    inline void render_fixed(Widget& w) {
        Canvas canvas = w.render(RenderSize::Fixed(), Focused);
        RenderBox b = w.render_size(RenderSize::Fixed(), Focused);
        EXPECT_EQ(b.columns, canvas.columns());
        EXPECT_EQ(b.rows, canvas.rows());
    }

} // namespace test_support
} // namespace cppwid

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <utility>
#include <cstdint>
#include <algorithm>

namespace cppwid {

    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    inline std::string version() {
        return std::to_string(VERSION_MAJOR) + "." +
               std::to_string(VERSION_MINOR) + "." +
               std::to_string(VERSION_PATCH);
    }

    // ========================================================================
    // Logging
    // ========================================================================

    /// @brief Name under which the library logger is registered with spdlog
    inline const char* LOGGER_NAME = "cppwid";

    /// @brief Get the library logger, creating a stderr logger on first use
    /// An application may register its own logger named "cppwid" before the
    /// first widget is rendered to redirect output.
    inline std::shared_ptr<spdlog::logger> logger() {
        auto log = spdlog::get(LOGGER_NAME);
        if (!log) {
            log = spdlog::stderr_color_mt(LOGGER_NAME);
            log->set_level(spdlog::level::warn);
        }
        return log;
    }

    /// @brief Set the verbosity of the library logger
    inline void set_log_level(spdlog::level::level_enum level) {
        logger()->set_level(level);
    }

    // ========================================================================
    // Errors
    // ========================================================================

    /// @brief Base class of every error raised by the library
    class Error : public std::logic_error {
    public:
        explicit Error(const std::string& what) : std::logic_error(what) {}
    };

    /// @brief The widget tree misuses the layout protocol (e.g. two weighted
    /// children along an axis with no known length)
    class ConfigurationError : public Error {
    public:
        explicit ConfigurationError(const std::string& what) : Error(what) {}
    };

    /// @brief A child dimension cannot be used with the size its container was rendered with
    class DimensionError : public Error {
    public:
        explicit DimensionError(const std::string& what) : Error(what) {}
    };

    /// @brief A position or index does not belong to the object it was used with
    class InvalidPositionError : public Error {
    public:
        explicit InvalidPositionError(const std::string& what) : Error(what) {}
    };

    /// @brief Log an error message and build the exception to throw
    template <typename E>
    E logged(const std::string& message) {
        logger()->error("{}", message);
        return E(message);
    }

    // ========================================================================
    // UTF-8 Utilities
    // ========================================================================

    /// @brief Decode a UTF-8 character from a string, returning the codepoint and byte length
    /// @param s The input string
    /// @param pos Starting position in the string
    /// @param out_codepoint Output: the Unicode codepoint
    /// @param out_len Output: number of bytes consumed
    /// @return true if successful, false if invalid UTF-8
    inline bool utf8_decode_codepoint(const std::string& s, size_t pos, uint32_t& out_codepoint, int& out_len) {
        if (pos >= s.size()) return false;

        unsigned char c = static_cast<unsigned char>(s[pos]);
        int len = 1;
        if ((c & 0x80) == 0) {
            out_codepoint = c;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            out_codepoint = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            out_codepoint = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            out_codepoint = c & 0x07;
        } else {
            // Invalid start byte, pass it through as a single unit
            out_codepoint = c;
            out_len = 1;
            return true;
        }
        if (pos + len > s.size()) return false;
        for (int i = 1; i < len; ++i) {
            out_codepoint = (out_codepoint << 6) | (static_cast<unsigned char>(s[pos + i]) & 0x3F);
        }
        out_len = len;
        return true;
    }

    /// @brief Split a UTF-8 string into one string per codepoint
    inline std::vector<std::string> utf8_split(const std::string& text) {
        std::vector<std::string> chars;
        size_t pos = 0;
        while (pos < text.size()) {
            uint32_t cp;
            int len;
            if (utf8_decode_codepoint(text, pos, cp, len)) {
                chars.push_back(text.substr(pos, len));
                pos += len;
            } else {
                pos++; // Skip truncated sequence
            }
        }
        return chars;
    }

    /// @brief alignment options for text and widgets
    enum class Alignment {
        Left,   ///< Align to the left
        Center, ///< Align to the center
        Right   ///< Align to the right
    };

    // ========================================================================
    // Events and Key Bindings
    // ========================================================================

    /// @brief Types of events that can occur
    enum class EventType {
        None,   ///< No event
        Key,    ///< Keyboard key press
        Mouse   ///< Mouse movement, click or wheel
    };

    /// @brief Key codes for keys without a printable character
    namespace keys {
        constexpr int CtrlB = 2;
        constexpr int CtrlF = 6;
        constexpr int CtrlN = 14;
        constexpr int CtrlP = 16;
        constexpr int Enter = 13;
        constexpr int Escape = 27;
        constexpr int Space = 32;
        constexpr int Up = 1000 + 65;
        constexpr int Down = 1000 + 66;
        constexpr int Right = 1000 + 67;
        constexpr int Left = 1000 + 68;
    }

    /// @brief Raw button codes for mouse events (xterm encoding)
    namespace buttons {
        constexpr int Left = 0;
        constexpr int Middle = 1;
        constexpr int Right = 2;
        constexpr int Release = 3;
        constexpr int WheelUp = 64;
        constexpr int WheelDown = 65;
        constexpr int WheelLeft = 66;
        constexpr int WheelRight = 67;
    }

    /// @brief Represents an input event (keyboard or mouse)
    struct Event {
        EventType type = EventType::None; ///< The type of event
        int key = 0;      ///< ASCII or Key code for Key events
        int x = 0;        ///< X coordinate for Mouse events
        int y = 0;        ///< Y coordinate for Mouse events
        int button = -1;  ///< Raw button code for Mouse events

        bool shift = false; ///< True if Shift modifier is active
        bool ctrl = false;  ///< True if Ctrl modifier is active
        bool alt = false;   ///< True if Alt modifier is active

        bool is_key() const { return type == EventType::Key; }
        bool is_mouse() const { return type == EventType::Mouse; }

        bool mouse_wheel() const { return is_mouse() && (button & 64) != 0; }
        bool mouse_motion() const { return (button & 32) != 0; }
        bool mouse_left() const { return is_mouse() && !mouse_wheel() && !mouse_motion() && (button & 3) == 0; }
        bool mouse_middle() const { return is_mouse() && !mouse_wheel() && !mouse_motion() && (button & 3) == 1; }
        bool mouse_right() const { return is_mouse() && !mouse_wheel() && !mouse_motion() && (button & 3) == 2; }
        bool mouse_release() const { return is_mouse() && !mouse_wheel() && (button & 3) == 3; }
        bool mouse_press() const { return mouse_left() || mouse_middle() || mouse_right(); }
        bool mouse_wheel_up() const { return mouse_wheel() && (button & 3) == 0; }
        bool mouse_wheel_down() const { return mouse_wheel() && (button & 3) == 1; }
        bool mouse_wheel_left() const { return mouse_wheel() && (button & 3) == 2; }
        bool mouse_wheel_right() const { return mouse_wheel() && (button & 3) == 3; }

        /// @brief Copy of this event with mouse coordinates moved; key events are unchanged
        Event translated(int dx, int dy) const {
            Event res = *this;
            if (is_mouse()) {
                res.x += dx;
                res.y += dy;
            }
            return res;
        }
    };

    /// @brief A key that can be bound to an action
    struct KeyPress {
        int key = 0;       ///< Key code, or the letter for a Ctrl combination
        bool ctrl = false; ///< Requires the Ctrl modifier

        /// @brief Check whether an event is this key press
        /// A Ctrl combination also matches the raw control code the terminal sends.
        bool matches(const Event& event) const {
            if (!event.is_key()) return false;
            if (!ctrl) return event.key == key && !event.ctrl;
            if (event.ctrl && (event.key == key || event.key == key - 32)) return true;
            return event.key == (key & 0x1F);
        }
    };

    /// @brief Check whether an event matches any key in a list
    inline bool key_in(const Event& event, const std::vector<KeyPress>& keys) {
        for (const auto& k : keys) {
            if (k.matches(event)) return true;
        }
        return false;
    }

    /// @brief Up arrow, Ctrl-P and vi-style k
    inline std::vector<KeyPress> all_up_keys() {
        return {{keys::Up, false}, {'p', true}, {'k', false}};
    }

    /// @brief Down arrow, Ctrl-N and vi-style j
    inline std::vector<KeyPress> all_down_keys() {
        return {{keys::Down, false}, {'n', true}, {'j', false}};
    }

    /// @brief Left arrow, Ctrl-B and vi-style h
    inline std::vector<KeyPress> all_left_keys() {
        return {{keys::Left, false}, {'b', true}, {'h', false}};
    }

    /// @brief Right arrow, Ctrl-F and vi-style l
    inline std::vector<KeyPress> all_right_keys() {
        return {{keys::Right, false}, {'f', true}, {'l', false}};
    }

    /// @brief Navigation key sets used by the containers
    struct KeyBindings {
        std::vector<KeyPress> up;
        std::vector<KeyPress> down;
        std::vector<KeyPress> left;
        std::vector<KeyPress> right;

        static KeyBindings defaults() {
            return {all_up_keys(), all_down_keys(), all_left_keys(), all_right_keys()};
        }
    };

    // ========================================================================
    // Color and Cell
    // ========================================================================

    /// @brief Represents an RGB color
    struct Color {
        uint8_t r = 255, g = 255, b = 255;
        bool is_default = true; ///< If true, uses the terminal's default color

        Color() = default;
        Color(uint8_t r, uint8_t g, uint8_t b, bool is_default = false)
            : r(r), g(g), b(b), is_default(is_default) {}

        static Color White() { return {255, 255, 255, false}; }
        static Color Black() { return {0, 0, 0, false}; }
        static Color Red() { return {255, 0, 0, false}; }
        static Color Green() { return {0, 255, 0, false}; }
        static Color Blue() { return {0, 0, 255, false}; }

        bool operator==(const Color& other) const {
            if (is_default && other.is_default) return true;
            return r == other.r && g == other.g && b == other.b && is_default == other.is_default;
        }
        bool operator!=(const Color& other) const { return !(*this == other); }

        /// @brief Returns this color if not default, otherwise returns the fallback
        Color resolve(const Color& fallback) const {
            return is_default ? fallback : *this;
        }
    };

    /// @brief A single character cell of a canvas
    struct Cell {
        std::string content = " "; // UTF-8 supported by using string
        Color fg_color;
        Color bg_color;
        bool bold = false;      ///< Render text in bold
        bool italic = false;    ///< Render text in italics
        bool underline = false; ///< Render text with underline

        Cell() = default;
        Cell(std::string content) : content(std::move(content)) {}

        bool operator==(const Cell& other) const {
            return content == other.content &&
                   fg_color == other.fg_color &&
                   bg_color == other.bg_color &&
                   bold == other.bold &&
                   italic == other.italic &&
                   underline == other.underline;
        }
        bool operator!=(const Cell& other) const { return !(*this == other); }

        /// @brief Combine two cells, the upper one taking priority where it is set
        static Cell merge_under(const Cell& lower, const Cell& upper) {
            Cell res = upper;
            if (upper.content.empty()) res.content = lower.content;
            res.fg_color = upper.fg_color.resolve(lower.fg_color);
            res.bg_color = upper.bg_color.resolve(lower.bg_color);
            res.bold = upper.bold || lower.bold;
            res.italic = upper.italic || lower.italic;
            res.underline = upper.underline || lower.underline;
            return res;
        }
    };

    /// @brief A line of n blank cells
    inline std::vector<Cell> empty_line(int n) {
        return std::vector<Cell>(std::max(0, n), Cell{});
    }

    // ========================================================================
    // Canvas
    // ========================================================================

    /// @brief A position within a canvas
    struct CanvasPos {
        int x = 0;
        int y = 0;

        CanvasPos plus_x(int n) const { return {x + n, y}; }
        CanvasPos plus_y(int n) const { return {x, y + n}; }
        bool operator==(const CanvasPos& other) const { return x == other.x && y == other.y; }
        bool operator!=(const CanvasPos& other) const { return !(*this == other); }
    };

    /// @brief The output of a render call: a rectangular grid of cells plus named marks
    /// Every line always holds columns() cells. The mark named "cursor" is the cursor position.
    class Canvas {
    public:
        Canvas() = default;

        /// @brief Construct a canvas of cols x rows, every cell a copy of fill
        Canvas(int cols, int rows, const Cell& fill = Cell{}) {
            cols = std::max(0, cols);
            rows = std::max(0, rows);
            lines_.assign(rows, std::vector<Cell>(cols, fill));
            max_col_ = cols;
        }

        /// @brief Build a canvas from lines of cells, padding short lines on the right
        static Canvas from_lines(std::vector<std::vector<Cell>> lines) {
            Canvas c;
            c.lines_ = std::move(lines);
            c.align_right();
            return c;
        }

        int columns() const { return max_col_; }
        int rows() const { return static_cast<int>(lines_.size()); }

        const std::vector<Cell>& line(int row) const {
            check_position(0, row, false);
            return lines_[row];
        }

        const Cell& cell_at(int col, int row) const {
            check_position(col, row, true);
            return lines_[row][col];
        }

        void set_cell_at(int col, int row, const Cell& cell) {
            check_position(col, row, true);
            lines_[row][col] = cell;
        }

        /// @brief Append a line of cells at the bottom, widening the canvas if needed
        void append_line(std::vector<Cell> line) {
            lines_.push_back(std::move(line));
            align_right();
        }

        /// @brief Append another canvas below this one
        /// @param other The canvas to append
        /// @param do_cursor Take the other canvas's cursor, offset by this canvas's height
        void append_below(const Canvas& other, bool do_cursor = false) {
            int offset = rows();
            for (const auto& l : other.lines_) {
                lines_.push_back(l);
            }
            align_right();
            for (const auto& kv : other.marks_) {
                if (do_cursor || kv.first != CURSOR) {
                    marks_[kv.first] = kv.second.plus_y(offset);
                }
            }
        }

        /// @brief Append another canvas to the right of this one
        /// Rows the other canvas does not have are filled with blanks.
        /// @param other The canvas to append
        /// @param use_cursor Take the other canvas's cursor, offset by this canvas's width
        void append_right(const Canvas& other, bool use_cursor = false) {
            int m = max_col_;
            int w = other.columns();
            while (rows() < other.rows()) {
                lines_.push_back(empty_line(m));
            }
            for (int y = 0; y < rows(); ++y) {
                auto& l = lines_[y];
                l.resize(m);
                if (y < other.rows()) {
                    l.insert(l.end(), other.lines_[y].begin(), other.lines_[y].end());
                } else {
                    l.resize(m + w);
                }
            }
            for (const auto& kv : other.marks_) {
                if (use_cursor || kv.first != CURSOR) {
                    marks_[kv.first] = kv.second.plus_x(m);
                }
            }
            max_col_ = m + w;
        }

        /// @brief Add n copies of fill to the right of every line
        void extend_right(int n, const Cell& fill = Cell{}) {
            if (n <= 0) return;
            for (auto& l : lines_) {
                l.insert(l.end(), n, fill);
            }
            max_col_ += n;
        }

        /// @brief Add n copies of fill to the left of every line, shifting marks
        void extend_left(int n, const Cell& fill = Cell{}) {
            if (n <= 0) return;
            for (auto& l : lines_) {
                l.insert(l.begin(), n, fill);
            }
            for (auto& kv : marks_) {
                kv.second = kv.second.plus_x(n);
            }
            max_col_ += n;
        }

        /// @brief Remove columns from the right until cols are left
        void trim_right(int cols) {
            cols = std::max(0, cols);
            for (auto& l : lines_) {
                if (static_cast<int>(l.size()) > cols) l.resize(cols);
            }
            max_col_ = std::min(max_col_, cols);
        }

        /// @brief Remove cols columns from the left, shifting marks
        void trim_left(int cols) {
            cols = std::min(std::max(0, cols), max_col_);
            if (cols == 0) return;
            for (auto& l : lines_) {
                l.erase(l.begin(), l.begin() + std::min<int>(cols, static_cast<int>(l.size())));
            }
            for (auto& kv : marks_) {
                kv.second = kv.second.plus_x(-cols);
            }
            max_col_ -= cols;
        }

        /// @brief Remove lines from the top and the bottom
        void truncate(int above, int below) {
            if (above < 0 || below < 0) {
                throw logged<InvalidPositionError>("Canvas truncate counts must be >= 0, got above=" +
                                                   std::to_string(above) + " below=" + std::to_string(below));
            }
            int cut_above = std::min(rows(), above);
            lines_.erase(lines_.begin(), lines_.begin() + cut_above);
            int cut_below = std::min(rows(), below);
            lines_.resize(lines_.size() - cut_below);
            for (auto& kv : marks_) {
                kv.second = kv.second.plus_y(-cut_above);
            }
        }

        /// @brief Merge another canvas on top of this one using a cell function
        /// @param over The canvas placed at (left, top) of this one
        /// @param fn Combines (lower, upper) cells
        /// @param bottom_gets_cursor Keep this canvas's cursor rather than the other's
        void merge_with(const Canvas& over, int left, int top,
                        const std::function<Cell(const Cell&, const Cell&)>& fn, bool bottom_gets_cursor) {
            for (int i = 0; i < over.rows(); ++i) {
                int y = i + top;
                if (y < 0 || y >= rows()) continue;
                for (int j = 0; j < over.columns(); ++j) {
                    int x = j + left;
                    if (x < 0) continue;
                    if (x >= max_col_) break;
                    lines_[y][x] = fn(lines_[y][x], over.lines_[i][j]);
                }
            }
            for (const auto& kv : over.marks_) {
                if (kv.first != CURSOR || !bottom_gets_cursor) {
                    marks_[kv.first] = kv.second.plus_x(left).plus_y(top);
                }
            }
        }

        /// @brief Merge another canvas on top of this one, its set cells taking priority
        void merge_under(const Canvas& over, int left, int top, bool bottom_gets_cursor) {
            merge_with(over, left, top, Cell::merge_under, bottom_gets_cursor);
        }

        /// @brief Pad every line on the right to the widest line
        void align_right(const Cell& fill = Cell{}) {
            int widest = 0;
            for (const auto& l : lines_) {
                widest = std::max(widest, static_cast<int>(l.size()));
            }
            widest = std::max(widest, max_col_);
            for (auto& l : lines_) {
                if (static_cast<int>(l.size()) < widest) l.resize(widest, fill);
            }
            max_col_ = widest;
        }

        bool cursor_enabled() const { return marks_.count(CURSOR) > 0; }

        CanvasPos cursor_coords() const {
            auto it = marks_.find(CURSOR);
            if (it == marks_.end()) {
                throw logged<InvalidPositionError>("Canvas cursor is not enabled");
            }
            return it->second;
        }

        /// @brief Set the cursor; (-1, -1) disables it
        void set_cursor_coords(int x, int y) {
            if (x == -1 && y == -1) {
                marks_.erase(CURSOR);
            } else {
                set_mark(CURSOR, x, y);
            }
        }

        void set_mark(const std::string& name, int x, int y) { marks_[name] = {x, y}; }

        std::optional<CanvasPos> get_mark(const std::string& name) const {
            auto it = marks_.find(name);
            if (it == marks_.end()) return std::nullopt;
            return it->second;
        }

        void remove_mark(const std::string& name) { marks_.erase(name); }

        const std::map<std::string, CanvasPos>& marks() const { return marks_; }

        /// @brief The canvas text, lines joined with newlines
        std::string to_string() const {
            std::string res;
            for (size_t i = 0; i < lines_.size(); ++i) {
                if (i > 0) res += '\n';
                for (const auto& c : lines_[i]) {
                    res += c.content; // empty content is the tail of a wide character
                }
            }
            return res;
        }

        static constexpr const char* CURSOR = "cursor";

    private:
        void check_position(int col, int row, bool check_col) const {
            if (row < 0 || row >= rows() || (check_col && (col < 0 || col >= max_col_))) {
                throw logged<InvalidPositionError>("Position (" + std::to_string(col) + "," + std::to_string(row) +
                                                   ") is outside canvas " + std::to_string(max_col_) + "x" +
                                                   std::to_string(rows()));
            }
        }

        std::vector<std::vector<Cell>> lines_;
        std::map<std::string, CanvasPos> marks_;
        int max_col_ = 0;
    };

    /// @brief Append n blank lines as wide as the canvas
    inline void append_blank_lines(Canvas& c, int n) {
        for (int i = 0; i < n; ++i) {
            c.append_line(empty_line(c.columns()));
        }
    }

    // ========================================================================
    // Render Sizes and Dimensions
    // ========================================================================

    /// @brief The three ways a widget can be asked to render
    enum class SizeKind {
        Fixed,    ///< The widget picks its own size
        FlowWith, ///< Width given, the widget picks its height
        Box       ///< Width and height given
    };

    /// @brief The size passed to render()
    struct RenderSize {
        SizeKind kind = SizeKind::Fixed;
        int columns = 0; ///< Valid for FlowWith and Box
        int rows = 0;    ///< Valid for Box

        static RenderSize Fixed() { return {SizeKind::Fixed, 0, 0}; }
        static RenderSize FlowWith(int cols) { return {SizeKind::FlowWith, cols, 0}; }
        static RenderSize Box(int cols, int rows) { return {SizeKind::Box, cols, rows}; }

        bool is_fixed() const { return kind == SizeKind::Fixed; }
        bool is_flow() const { return kind == SizeKind::FlowWith; }
        bool is_box() const { return kind == SizeKind::Box; }
        bool has_columns() const { return kind != SizeKind::Fixed; }
        bool has_rows() const { return kind == SizeKind::Box; }

        bool operator==(const RenderSize& other) const {
            return kind == other.kind && columns == other.columns && rows == other.rows;
        }
        bool operator!=(const RenderSize& other) const { return !(*this == other); }

        std::string to_string() const {
            switch (kind) {
                case SizeKind::Fixed: return "fixed";
                case SizeKind::FlowWith: return "flowwith(c:" + std::to_string(columns) + ")";
                case SizeKind::Box: return "box(c:" + std::to_string(columns) + ",r:" + std::to_string(rows) + ")";
            }
            return "unknown";
        }
    };

    /// @brief A resolved size
    struct RenderBox {
        int columns = 0;
        int rows = 0;

        bool operator==(const RenderBox& other) const { return columns == other.columns && rows == other.rows; }
        bool operator!=(const RenderBox& other) const { return !(*this == other); }
    };

    /// @brief Trim or pad a canvas so it has exactly the size requested
    /// Fixed sizes leave the canvas alone; flow sizes only fix the width.
    inline void make_canvas_right_size(Canvas& c, const RenderSize& size) {
        if (!size.has_columns()) return;
        if (c.columns() > size.columns) {
            c.trim_right(size.columns);
        } else if (c.columns() < size.columns) {
            c.extend_right(size.columns - c.columns());
        }
        if (size.has_rows()) {
            if (c.rows() > size.rows) {
                c.truncate(0, c.rows() - size.rows);
            } else if (c.rows() < size.rows) {
                append_blank_lines(c, size.rows - c.rows());
            }
        }
    }

    /// @brief How much space a child of a container asks for along the container's axis
    struct Dimension {
        enum class Kind {
            Fixed,    ///< Child decides, measured by rendering it Fixed
            Flow,     ///< Flow with the container's width
            FlowWith, ///< Flow with a given width
            Box,      ///< Fully given width and height
            Units,    ///< Exactly n columns or rows
            Weight,   ///< Proportional share of what is left
            Ratio,    ///< Fraction of the container's total
            Relative, ///< Fraction of the total, clipped to what is still unassigned
            Max       ///< Whatever is left once all others are placed
        };

        Kind kind = Kind::Flow;
        int columns = 0;               ///< FlowWith and Box width
        int rows = 0;                  ///< Box height
        int units = 0;                 ///< Units count
        int weight = 0;                ///< Weight share
        double ratio = 0.0;            ///< Ratio and Relative fraction
        std::optional<int> max_units;  ///< Cap for Weight
        bool max_height = false;       ///< Rendered last, as tall as the tallest sibling

        static Dimension Fixed() { Dimension d; d.kind = Kind::Fixed; return d; }
        static Dimension Flow() { Dimension d; d.kind = Kind::Flow; return d; }
        static Dimension FlowWith(int cols) { Dimension d; d.kind = Kind::FlowWith; d.columns = cols; return d; }
        static Dimension Box(int cols, int rows) {
            Dimension d;
            d.kind = Kind::Box;
            d.columns = cols;
            d.rows = rows;
            return d;
        }
        static Dimension Units(int n) { Dimension d; d.kind = Kind::Units; d.units = n; return d; }
        static Dimension Weight(int w) { Dimension d; d.kind = Kind::Weight; d.weight = w; return d; }
        static Dimension Weight(int w, int max) {
            Dimension d = Weight(w);
            d.max_units = max;
            return d;
        }
        static Dimension Ratio(double r) { Dimension d; d.kind = Kind::Ratio; d.ratio = r; return d; }
        static Dimension Relative(double r) { Dimension d; d.kind = Kind::Relative; d.ratio = r; return d; }
        static Dimension Max() { Dimension d; d.kind = Kind::Max; d.max_height = true; return d; }

        /// @brief Same dimension, but rendered after its siblings at their max height
        Dimension with_max_height() const {
            Dimension d = *this;
            d.max_height = true;
            return d;
        }

        bool is_weight() const { return kind == Kind::Weight; }
        bool is_max() const { return max_height; }

        std::string to_string() const {
            std::string res;
            switch (kind) {
                case Kind::Fixed: res = "fixed"; break;
                case Kind::Flow: res = "flow"; break;
                case Kind::FlowWith: res = "flowwith(" + std::to_string(columns) + ")"; break;
                case Kind::Box: res = "box(" + std::to_string(columns) + "," + std::to_string(rows) + ")"; break;
                case Kind::Units: res = "units(" + std::to_string(units) + ")"; break;
                case Kind::Weight:
                    res = "weight(" + std::to_string(weight);
                    if (max_units) res += ",max:" + std::to_string(*max_units);
                    res += ")";
                    break;
                case Kind::Ratio: res = "ratio(" + std::to_string(ratio) + ")"; break;
                case Kind::Relative: res = "relative(" + std::to_string(ratio) + ")"; break;
                case Kind::Max: return "max";
            }
            if (max_height) res += "+max";
            return res;
        }
    };

    inline DimensionError dimension_error(const RenderSize& size, const Dimension& dim, int row = -1) {
        std::string msg = "Dimension " + dim.to_string() + " cannot be used with render size " + size.to_string();
        if (row != -1) msg += " and advised row " + std::to_string(row);
        return logged<DimensionError>(msg);
    }

    /// @brief Round half up, as used by every ratio and weight computation
    inline int round_half_up(double v) {
        return static_cast<int>(v + 0.5);
    }

    /// @brief Divide space among weighted slots
    /// Each pass shares what is left in proportion to the weights still in the pool. A slot
    /// whose share would take it past its cap is pinned at the cap and leaves the pool. The
    /// rounding remainder goes to the last uncapped slot that received a share.
    /// @param weights Weight per slot, 0 for slots not taking part
    /// @param caps Optional cap per slot
    /// @param space Space to divide
    /// @param extents In/out: extents are added to
    /// @return Space left undistributed (only when every taker is capped)
    inline int divide_by_weight(const std::vector<int>& weights, const std::vector<std::optional<int>>& caps,
                                int space, std::vector<int>& extents) {
        const size_t n = weights.size();
        std::vector<bool> pinned(n, false);
        std::vector<int> given(n, 0);
        int left = std::max(0, space);
        int last = -1;

        while (left > 0) {
            int total = 0;
            for (size_t i = 0; i < n; ++i) {
                if (weights[i] > 0 && !pinned[i]) total += weights[i];
            }
            if (total == 0) break;

            bool done_one = false;
            int to_divide = left;
            for (size_t i = 0; i < n; ++i) {
                if (weights[i] <= 0 || pinned[i]) continue;
                int share = static_cast<int>(
                    (static_cast<float>(weights[i]) / static_cast<float>(total)) * static_cast<float>(to_divide) + 0.5f);
                if (caps[i] && given[i] + share >= *caps[i]) {
                    share = std::max(0, *caps[i] - given[i]);
                    pinned[i] = true;
                }
                share = std::min(share, left);
                if (share > 0) {
                    given[i] += share;
                    left -= share;
                    done_one = true;
                    if (!pinned[i]) last = static_cast<int>(i);
                }
            }
            if (!done_one) break;
        }

        if (last != -1 && left > 0) {
            given[last] += left;
            left = 0;
        }
        for (size_t i = 0; i < n; ++i) {
            extents[i] += given[i];
        }
        return left;
    }

    /// @brief Size for a child squeezed horizontally by a dimension (used by padding widgets)
    inline RenderSize compute_horizontal_sub_size(const RenderSize& size, const Dimension& d) {
        using K = Dimension::Kind;
        switch (size.kind) {
            case SizeKind::Fixed:
                switch (d.kind) {
                    case K::Fixed: return RenderSize::Fixed();
                    case K::Box: return RenderSize::Box(d.columns, d.rows);
                    case K::FlowWith: return RenderSize::FlowWith(d.columns);
                    case K::Units: return RenderSize::FlowWith(d.units);
                    default: break;
                }
                break;
            case SizeKind::Box:
                switch (d.kind) {
                    case K::Fixed: return RenderSize::Fixed();
                    case K::Box: return RenderSize::Box(d.columns, d.rows);
                    case K::FlowWith: return RenderSize::FlowWith(d.columns);
                    case K::Flow: return RenderSize::FlowWith(size.columns);
                    case K::Ratio:
                    case K::Relative: return RenderSize::Box(round_half_up(d.ratio * size.columns), size.rows);
                    case K::Units: return RenderSize::Box(d.units, size.rows);
                    default: break;
                }
                break;
            case SizeKind::FlowWith:
                switch (d.kind) {
                    case K::Fixed: return RenderSize::Fixed();
                    case K::Box: return RenderSize::Box(d.columns, d.rows);
                    case K::FlowWith: return RenderSize::FlowWith(d.columns);
                    case K::Flow: return RenderSize::FlowWith(size.columns);
                    case K::Ratio:
                    case K::Relative: return RenderSize::FlowWith(round_half_up(d.ratio * size.columns));
                    case K::Units: return RenderSize::FlowWith(d.units);
                    default: break;
                }
                break;
        }
        throw dimension_error(size, d);
    }

    /// @brief Size for a child stacked vertically, or nothing if the pair cannot be combined
    /// @param max_col Width to flow with when the parent is Fixed, -1 if unknown
    /// @param adv_row Rows to give a weighted child, -1 if not yet known
    /// @param available Rows still unassigned, clipping Ratio and Relative; -1 means no clipping
    inline std::optional<RenderSize> vertical_sub_size(const RenderSize& size, const Dimension& d,
                                                       int max_col, int adv_row, int available = -1) {
        using K = Dimension::Kind;
        switch (size.kind) {
            case SizeKind::Fixed:
                switch (d.kind) {
                    case K::Fixed: return RenderSize::Fixed();
                    case K::Box: return RenderSize::Box(d.columns, d.rows);
                    case K::FlowWith: return RenderSize::FlowWith(d.columns);
                    case K::Flow:
                        if (max_col >= 0) return RenderSize::FlowWith(max_col);
                        return std::nullopt;
                    case K::Units: return RenderSize::Fixed();
                    default: return std::nullopt;
                }
            case SizeKind::Box:
                switch (d.kind) {
                    case K::Fixed: return RenderSize::Fixed();
                    case K::FlowWith: return RenderSize::FlowWith(d.columns);
                    case K::Flow: return RenderSize::FlowWith(size.columns);
                    case K::Units: return RenderSize::Box(size.columns, d.units);
                    case K::Ratio:
                    case K::Relative: {
                        int rows = round_half_up(d.ratio * size.rows);
                        if (available >= 0) rows = std::min(rows, available);
                        return RenderSize::Box(size.columns, std::max(0, rows));
                    }
                    case K::Weight:
                        if (adv_row >= 0) return RenderSize::Box(size.columns, adv_row);
                        return std::nullopt;
                    default: return std::nullopt;
                }
            case SizeKind::FlowWith:
                switch (d.kind) {
                    case K::Fixed: return RenderSize::Fixed();
                    case K::Flow: return RenderSize::FlowWith(size.columns);
                    case K::Units: return RenderSize::Box(size.columns, d.units);
                    default: return std::nullopt;
                }
        }
        return std::nullopt;
    }

    /// @brief Like vertical_sub_size, but an impossible combination is a DimensionError
    inline RenderSize compute_vertical_sub_size(const RenderSize& size, const Dimension& d,
                                                int max_col, int adv_row, int available = -1) {
        auto res = vertical_sub_size(size, d, max_col, adv_row, available);
        if (!res) throw dimension_error(size, d, adv_row);
        return *res;
    }

    // ========================================================================
    // Focus Selector
    // ========================================================================

    /// @brief Focus state handed down the tree with every render and event
    /// Three states are meaningful: not selected, selected, and focused (selected too).
    struct Selector {
        bool focus = false;    ///< This subtree holds the UI focus
        bool selected = false; ///< This subtree is its parent's current child

        /// @brief Selected follows cond; focus needs both cond and the current focus
        Selector select_if(bool cond) const { return {focus && cond, cond}; }

        /// @brief Both flags additionally require cond
        Selector and_if(bool cond) const { return {focus && cond, selected && cond}; }

        bool operator==(const Selector& other) const { return focus == other.focus && selected == other.selected; }
        bool operator!=(const Selector& other) const { return !(*this == other); }
    };

    inline const Selector Focused{true, true};
    inline const Selector Selected{false, true};
    inline const Selector NotSelected{false, false};

    // ========================================================================
    // Input Context
    // ========================================================================

    /// @brief Which mouse buttons are held down
    struct MouseState {
        bool left = false;
        bool middle = false;
        bool right = false;

        bool no_button_clicked() const { return !left && !middle && !right; }
    };

    class Widget;

    /// @brief Services the application driver provides while input is being handled
    /// Tracks mouse button state across events and which widgets saw a button go
    /// down, so a later release can be matched to the press.
    class InputContext {
    public:
        MouseState mouse_state() const { return mouse_; }
        MouseState last_mouse_state() const { return last_mouse_; }

        void set_mouse_state(MouseState m) { mouse_ = m; }
        void set_last_mouse_state(MouseState m) { last_mouse_ = m; }

        /// @brief Roll the mouse state forward for a new mouse event
        void update_mouse_state(const Event& event) {
            if (!event.is_mouse() || event.mouse_wheel() || event.mouse_motion()) return;
            last_mouse_ = mouse_;
            if (event.mouse_release()) {
                mouse_ = MouseState{};
            } else {
                mouse_.left = event.mouse_left();
                mouse_.middle = event.mouse_middle();
                mouse_.right = event.mouse_right();
            }
        }

        /// @brief Record that a button went down over a widget
        /// @return true if this is the first target recorded for the button
        bool set_click_target(int button, const Widget* w) {
            auto& targets = click_[button & 3];
            targets.push_back(w);
            return targets.size() == 1;
        }

        /// @brief Check whether a widget saw a button go down since the last release
        bool is_click_target(const Widget* w) const {
            for (const auto& kv : click_) {
                for (const Widget* t : kv.second) {
                    if (t == w) return true;
                }
            }
            return false;
        }

        void clear_click_targets(int button) { click_.erase(button & 3); }
        void clear_click_targets() { click_.clear(); }

        /// @brief Deliver an event to a root widget the way an application driver does
        bool dispatch(Widget& root, const Event& event, const RenderSize& size, const Selector& focus = Focused);

    private:
        MouseState mouse_;
        MouseState last_mouse_;
        std::map<int, std::vector<const Widget*>> click_;
    };

    // ========================================================================
    // Widget Interfaces
    // ========================================================================

    /// @brief Optional capability: remembers a column/row to restore when focus comes back
    class PreferredPosition {
    public:
        virtual ~PreferredPosition() = default;
        virtual std::optional<int> get_preferred_position() const = 0;
        virtual void set_preferred_position(int pos) = 0;
    };

    /// @brief Optional capability: a widget with an indexed focus child
    class FocusContainer {
    public:
        virtual ~FocusContainer() = default;
        virtual int focus() const = 0;
        virtual void set_focus(int i) = 0;
        virtual int child_count() const = 0;
        virtual std::shared_ptr<Widget> child_widget(int i) const = 0;
    };

    /// @brief Base class for all visual elements
    class Widget {
    public:
        virtual ~Widget() = default;

        /// @brief Render the widget into a new canvas
        /// @param size How much space the widget gets
        /// @param focus Whether this subtree is selected and/or focused
        virtual Canvas render(const RenderSize& size, const Selector& focus) = 0;

        /// @brief Size the canvas would have if rendered
        /// Box sizes are returned as they are; otherwise the widget is rendered and measured.
        virtual RenderBox render_size(const RenderSize& size, const Selector& focus) {
            if (size.is_box()) return {size.columns, size.rows};
            Canvas c = render(size, focus);
            return {c.columns(), c.rows()};
        }

        /// @brief Handle an input event
        /// @return true if the event was consumed, false to let it bubble up
        virtual bool on_event(const Event& event, const RenderSize& size, const Selector& focus, InputContext& ctx) {
            return false;
        }

        /// @brief Check if the widget can take focus
        virtual bool selectable() const { return false; }

        /// @brief The wrapped widget, for single-child decorators
        virtual std::shared_ptr<Widget> sub_widget() const { return nullptr; }

        virtual PreferredPosition* preferred_position() { return nullptr; }
        virtual FocusContainer* focus_container() { return nullptr; }

        /// @brief Short description used in log and error messages
        virtual std::string describe() const { return "widget"; }
    };

    inline bool InputContext::dispatch(Widget& root, const Event& event, const RenderSize& size, const Selector& focus) {
        update_mouse_state(event);
        bool res = root.on_event(event, size, focus, *this);
        if (event.mouse_release()) {
            clear_click_targets();
        }
        return res;
    }

    /// @brief Pass an event to a widget only if it is selectable
    inline bool user_input_if_selectable(Widget& w, const Event& event, const RenderSize& size,
                                         const Selector& focus, InputContext& ctx) {
        if (!w.selectable()) return false;
        return w.on_event(event, size, focus, ctx);
    }

    /// @brief Preferred position of a widget, looking through single-child decorators
    inline std::optional<int> pref_position(Widget* w) {
        while (w) {
            if (auto* p = w->preferred_position()) return p->get_preferred_position();
            w = w->sub_widget().get();
        }
        return std::nullopt;
    }

    /// @brief Apply a preferred position, looking through single-child decorators
    /// @return false if no widget on the way supports it
    inline bool set_pref_position(Widget* w, int pos) {
        while (w) {
            if (auto* p = w->preferred_position()) {
                p->set_preferred_position(pos);
                return true;
            }
            w = w->sub_widget().get();
        }
        return false;
    }

    /// @brief Find the next selectable widget from pos in direction dir
    /// A pos of -1 starts before the first widget (or after the last when dir <= 0).
    /// @return The index found, or -1
    inline int find_next_selectable(const std::vector<std::shared_ptr<Widget>>& widgets, int pos, int dir, bool wrap) {
        const int n = static_cast<int>(widgets.size());
        if (n == 0 || dir == 0) return -1;
        if (pos == -1 && dir < 0) pos = n;
        int start = pos;
        for (int step = 0; step < n; ++step) {
            pos += dir;
            if (pos < 0 || pos >= n) {
                if (!wrap) return -1;
                pos = pos < 0 ? n - 1 : 0;
            }
            if (pos == start) return -1;
            if (widgets[pos] && widgets[pos]->selectable()) return pos;
        }
        return -1;
    }

    /// @brief Result of applying a focus path
    struct FocusPathResult {
        bool succeeded = true;
        int failed_level = -1; ///< Index in the path that could not be applied
    };

    /// @brief First widget at or below w (following sub widgets and focus children) that has a focus
    inline Widget* find_focus_container(Widget* w, bool include_me) {
        while (w) {
            if (include_me && w->focus_container()) return w;
            include_me = true;
            if (auto sub = w->sub_widget()) {
                w = sub.get();
            } else if (auto* fc = w->focus_container()) {
                if (fc->focus() < 0 || fc->focus() >= fc->child_count()) return nullptr;
                w = fc->child_widget(fc->focus()).get();
            } else {
                return nullptr;
            }
        }
        return nullptr;
    }

    /// @brief Focus indices from w down to the innermost focus container
    inline std::vector<int> focus_path(Widget& w) {
        std::vector<int> res;
        Widget* cur = find_focus_container(&w, true);
        while (cur) {
            res.push_back(cur->focus_container()->focus());
            cur = find_focus_container(cur, false);
        }
        return res;
    }

    /// @brief Set focus indices from w downwards
    inline FocusPathResult set_focus_path(Widget& w, const std::vector<int>& path) {
        FocusPathResult res;
        Widget* cur = &w;
        bool include_me = true;
        for (size_t i = 0; i < path.size(); ++i) {
            cur = find_focus_container(cur, include_me);
            if (!cur) {
                res.succeeded = false;
                res.failed_level = static_cast<int>(i);
                break;
            }
            include_me = false;
            cur->focus_container()->set_focus(path[i]);
        }
        return res;
    }

    // ========================================================================
    // Observer Lists
    // ========================================================================

    /// @brief Callbacks registered under an id so they can be removed again
    template <typename... Args>
    class ObserverList {
    public:
        using Callback = std::function<void(Args...)>;

        void add(const std::string& id, Callback cb) {
            entries_.emplace_back(id, std::move(cb));
        }

        /// @brief Remove every callback registered under id
        /// @return true if any was removed
        bool remove(const std::string& id) {
            auto it = std::remove_if(entries_.begin(), entries_.end(),
                                     [&](const auto& e) { return e.first == id; });
            bool found = it != entries_.end();
            entries_.erase(it, entries_.end());
            return found;
        }

        void notify(Args... args) const {
            auto copy = entries_; // a callback may add or remove observers
            for (auto& e : copy) {
                if (e.second) e.second(args...);
            }
        }

        size_t size() const { return entries_.size(); }
        bool empty() const { return entries_.empty(); }

    private:
        std::vector<std::pair<std::string, Callback>> entries_;
    };

    // ========================================================================
    // Leaf and Decorator Widgets
    // ========================================================================

    /// @brief Fills its whole area with one cell
    class Fill : public Widget {
    public:
        Fill(Cell cell = Cell{}) : cell_(std::move(cell)) {}
        Fill(char ch) : cell_(std::string(1, ch)) {}

        Canvas render(const RenderSize& size, const Selector& focus) override {
            switch (size.kind) {
                case SizeKind::Box: return Canvas(size.columns, size.rows, cell_);
                case SizeKind::FlowWith: return Canvas(size.columns, 1, cell_);
                case SizeKind::Fixed: break;
            }
            return Canvas(1, 1, cell_);
        }

        const Cell& cell() const { return cell_; }
        void set_cell(const Cell& c) { cell_ = c; }

        std::string describe() const override { return "fill[" + cell_.content + "]"; }

    private:
        Cell cell_;
    };

    /// @brief Plain text, wrapped at the width it is given
    class Text : public Widget {
    public:
        Text(std::string text = "") : text_(std::move(text)) {}

        const std::string& text() const { return text_; }
        void set_text(const std::string& text) { text_ = text; }

        Color fg_color = Color(); ///< Foreground color override
        Color bg_color = Color(); ///< Background color override

        Canvas render(const RenderSize& size, const Selector& focus) override {
            std::vector<std::vector<Cell>> lines;
            int width = size.has_columns() ? std::max(0, size.columns) : -1;

            for (const auto& src : split_lines()) {
                std::vector<Cell> cells;
                for (const auto& ch : utf8_split(src)) {
                    Cell c(ch);
                    c.fg_color = fg_color;
                    c.bg_color = bg_color;
                    cells.push_back(c);
                }
                if (width < 0) {
                    lines.push_back(std::move(cells));
                } else if (width == 0 || cells.empty()) {
                    lines.emplace_back();
                } else {
                    for (size_t i = 0; i < cells.size(); i += width) {
                        size_t end = std::min(cells.size(), i + static_cast<size_t>(width));
                        lines.emplace_back(cells.begin() + i, cells.begin() + end);
                    }
                }
            }

            Canvas c = Canvas::from_lines(std::move(lines));
            make_canvas_right_size(c, size);
            return c;
        }

        std::string describe() const override { return "text[" + text_ + "]"; }

    private:
        std::vector<std::string> split_lines() const {
            std::vector<std::string> res;
            std::stringstream ss(text_);
            std::string l;
            while (std::getline(ss, l, '\n')) res.push_back(l);
            if (res.empty() || (!text_.empty() && text_.back() == '\n')) res.emplace_back();
            return res;
        }

        std::string text_;
    };

    /// @brief Makes the wrapped widget selectable
    class Selectable : public Widget {
    public:
        Selectable(std::shared_ptr<Widget> child) : child_(std::move(child)) {}

        Canvas render(const RenderSize& size, const Selector& focus) override { return child_->render(size, focus); }
        RenderBox render_size(const RenderSize& size, const Selector& focus) override {
            return child_->render_size(size, focus);
        }
        bool on_event(const Event& event, const RenderSize& size, const Selector& focus, InputContext& ctx) override {
            return child_->on_event(event, size, focus, ctx);
        }
        bool selectable() const override { return true; }
        std::shared_ptr<Widget> sub_widget() const override { return child_; }

        std::string describe() const override { return "selectable[" + child_->describe() + "]"; }

    private:
        std::shared_ptr<Widget> child_;
    };

    /// @brief Places its child horizontally within the width it is given
    class HPadding : public Widget {
    public:
        /// @brief Construct a new HPadding
        /// @param child The wrapped widget
        /// @param align Where the child sits when there is spare width
        /// @param width How wide the child is rendered
        HPadding(std::shared_ptr<Widget> child, Alignment align, Dimension width)
            : child_(std::move(child)), align_(align), width_(width) {}

        Alignment align() const { return align_; }
        void set_align(Alignment a) { align_ = a; }
        const Dimension& width() const { return width_; }
        void set_width(const Dimension& d) { width_ = d; }

        Canvas render(const RenderSize& size, const Selector& focus) override {
            Canvas c = child_->render(compute_horizontal_sub_size(size, width_), focus);
            int sub_cols = c.columns();
            int my_cols = size.has_columns() ? size.columns : sub_cols;

            if (my_cols < sub_cols) {
                c.trim_right(my_cols);
            } else if (my_cols > sub_cols) {
                int spare = my_cols - sub_cols;
                switch (align_) {
                    case Alignment::Right:
                        c.extend_left(spare);
                        break;
                    case Alignment::Left:
                        c.extend_right(spare);
                        break;
                    case Alignment::Center: {
                        int r = spare / 2;
                        c.extend_right(r);
                        c.extend_left(spare - r);
                        break;
                    }
                }
            }
            make_canvas_right_size(c, size);
            return c;
        }

        bool on_event(const Event& event, const RenderSize& size, const Selector& focus, InputContext& ctx) override {
            RenderSize sub = compute_horizontal_sub_size(size, width_);
            int cols = child_->render_size(sub, focus).columns;

            int xd = 0;
            if (size.has_columns() && size.columns > cols) {
                int spare = size.columns - cols;
                switch (align_) {
                    case Alignment::Right:
                        xd = -spare;
                        break;
                    case Alignment::Center:
                        xd = -(spare - spare / 2);
                        break;
                    case Alignment::Left:
                        break;
                }
            }
            Event ev = event.translated(xd, 0);
            if (ev.is_mouse() && (ev.x < 0 || ev.x >= cols)) return false;
            return user_input_if_selectable(*child_, ev, sub, focus, ctx);
        }

        bool selectable() const override { return child_->selectable(); }
        std::shared_ptr<Widget> sub_widget() const override { return child_; }

        std::string describe() const override { return "hpadding[" + child_->describe() + "]"; }

    private:
        std::shared_ptr<Widget> child_;
        Alignment align_;
        Dimension width_;
    };

    // ========================================================================
    // Containers
    // ========================================================================

    /// @brief A child of a container with its dimension
    struct ContainerChild {
        std::shared_ptr<Widget> widget;
        Dimension dim = Dimension::Flow();
    };

    /// @brief Wrap plain widgets as container children sharing one dimension
    inline std::vector<ContainerChild> with_dimension(const Dimension& dim,
                                                      const std::vector<std::shared_ptr<Widget>>& widgets) {
        std::vector<ContainerChild> res;
        res.reserve(widgets.size());
        for (const auto& w : widgets) {
            res.push_back({w, dim});
        }
        return res;
    }

    /// @brief Shared state of the multi-child containers: children, focus and observers
    class Container : public Widget, public PreferredPosition, public FocusContainer {
    public:
        /// @brief Get the index of the focused child, -1 if nothing is selectable
        int focus() const override { return focus_; }

        /// @brief Move focus to child i, clamped to the valid range
        /// Observers are only told when the focus actually changes.
        void set_focus(int i) override { change_focus(std::min(std::max(i, 0), child_count() - 1)); }

        int child_count() const override { return static_cast<int>(children_.size()); }

        std::shared_ptr<Widget> child_widget(int i) const override { return child_at(i).widget; }

        const ContainerChild& child_at(int i) const {
            if (i < 0 || i >= child_count()) {
                throw logged<InvalidPositionError>(describe() + " has no child " + std::to_string(i));
            }
            return children_[i];
        }

        const std::vector<ContainerChild>& children() const { return children_; }

        std::vector<std::shared_ptr<Widget>> sub_widgets() const {
            std::vector<std::shared_ptr<Widget>> res;
            res.reserve(children_.size());
            for (const auto& c : children_) res.push_back(c.widget);
            return res;
        }

        /// @brief Replace the children, keeping the focus index where possible
        /// If the old index is gone or no longer selectable, focus moves to the first
        /// selectable child, or -1 if there is none.
        void set_sub_widgets(std::vector<ContainerChild> children) {
            children_ = std::move(children);
            logger()->debug("{} now has {} children", describe(), children_.size());
            int f = focus_ == -1 ? -1 : std::min(focus_, child_count() - 1);
            if (f == -1 || !child_selectable(f)) {
                f = cppwid::find_next_selectable(sub_widgets(), -1, 1, false);
            }
            change_focus(f);
            subwidgets_changed_.notify(*this);
        }

        /// @brief Replace the children with plain widgets, each given a Flow dimension
        void set_sub_widgets(const std::vector<std::shared_ptr<Widget>>& widgets) {
            set_sub_widgets(with_dimension(Dimension::Flow(), widgets));
        }

        std::vector<Dimension> dimensions() const {
            std::vector<Dimension> res;
            res.reserve(children_.size());
            for (const auto& c : children_) res.push_back(c.dim);
            return res;
        }

        /// @brief Replace every child's dimension
        void set_dimensions(const std::vector<Dimension>& dims) {
            if (dims.size() != children_.size()) {
                throw logged<InvalidPositionError>(describe() + " has " + std::to_string(children_.size()) +
                                                   " children but " + std::to_string(dims.size()) +
                                                   " dimensions were given");
            }
            for (size_t i = 0; i < dims.size(); ++i) children_[i].dim = dims[i];
            dimensions_changed_.notify(*this);
        }

        void set_dimension(int i, const Dimension& dim) {
            child_at(i);
            children_[i].dim = dim;
            dimensions_changed_.notify(*this);
        }

        bool wrap() const { return wrap_; }

        /// @brief A container is selectable if any child is
        bool selectable() const override {
            for (int i = 0; i < child_count(); ++i) {
                if (child_selectable(i)) return true;
            }
            return false;
        }

        /// @brief Index of the next selectable child after the focus, -1 if none
        int find_next_selectable(int dir, bool wrap) const {
            return cppwid::find_next_selectable(sub_widgets(), focus_, dir, wrap);
        }

        std::optional<int> get_preferred_position() const override {
            int f = pref_ == -1 ? focus_ : pref_;
            if (f == -1) return std::nullopt;
            return f;
        }

        /// @brief Focus the selectable child closest to pos and remember pos
        /// The search starts at pos going right/down, then tries pos-1 going left/up,
        /// alternating until a selectable child is found.
        void set_preferred_position(int pos) override {
            int n = child_count();
            if (n == 0) return;
            int target = std::min(std::max(pos, 0), n - 1);
            int before = target - 1;
            int after = target;
            while (before >= 0 || after < n) {
                if (after < n && child_selectable(after)) {
                    set_focus(after);
                    break;
                }
                after++;
                if (before >= 0 && child_selectable(before)) {
                    set_focus(before);
                    break;
                }
                before--;
            }
            pref_ = target; // passed on if focus does not move before it is asked for
        }

        PreferredPosition* preferred_position() override { return this; }
        FocusContainer* focus_container() override { return this; }

        void on_focus_changed(const std::string& id, std::function<void(Container&)> cb) {
            focus_changed_.add(id, std::move(cb));
        }
        bool remove_on_focus_changed(const std::string& id) { return focus_changed_.remove(id); }

        void on_subwidgets_changed(const std::string& id, std::function<void(Container&)> cb) {
            subwidgets_changed_.add(id, std::move(cb));
        }
        bool remove_on_subwidgets_changed(const std::string& id) { return subwidgets_changed_.remove(id); }

        void on_dimensions_changed(const std::string& id, std::function<void(Container&)> cb) {
            dimensions_changed_.add(id, std::move(cb));
        }
        bool remove_on_dimensions_changed(const std::string& id) { return dimensions_changed_.remove(id); }

    protected:
        Container(std::vector<ContainerChild> children, int start, bool wrap, bool do_not_set_selected)
            : children_(std::move(children)), wrap_(wrap), do_not_set_selected_(do_not_set_selected) {
            if (start >= 0) {
                focus_ = std::min(start, child_count() - 1);
            } else {
                focus_ = find_next_selectable(1, wrap_);
            }
        }

        /// @brief Null children are never selectable
        bool child_selectable(int i) const { return children_[i].widget && children_[i].widget->selectable(); }

        /// @brief Set the focus index as given and tell observers if it changed
        void change_focus(int f) {
            int old = focus_;
            focus_ = f;
            pref_ = -1; // moved, so pass on real focus from now on
            if (old != focus_) {
                logger()->debug("{} focus {} -> {}", describe(), old, focus_);
                focus_changed_.notify(*this);
            }
        }

        /// @brief Whether children are told they are selected when their parent is
        bool select_child(const Selector& f) const { return !do_not_set_selected_ && f.selected; }

        /// @brief Selector for child i
        Selector child_focus(const Selector& f, int i) const { return f.select_if(select_child(f) && i == focus_); }

        /// @brief Move focus to the next selectable child in a direction
        /// @return true if focus moved
        bool scroll(int dir) {
            int next = find_next_selectable(dir, wrap_);
            if (next == -1) return false;
            set_focus(next);
            return true;
        }

        /// @brief Move focus, carrying the outgoing child's preferred position to the focus child
        /// The position is applied even when focus stays put.
        bool scroll_keeping_position(int dir) {
            auto pref = pref_position(children_[focus_].widget.get());
            bool moved = scroll(dir);
            if (pref) {
                set_pref_position(children_[focus_].widget.get(), *pref);
            }
            return moved;
        }

        /// @brief Focus the hit child on the release that ends a press on this container
        void click_focus(const Event& event, int i, InputContext& ctx) {
            if (event.mouse_press()) {
                ctx.set_click_target(event.button, this);
            } else if (event.mouse_release() && !ctx.last_mouse_state().no_button_clicked()) {
                if (child_selectable(i) && ctx.is_click_target(this)) {
                    set_focus(i);
                }
            }
        }

        std::vector<ContainerChild> children_;
        int focus_ = -1; ///< -1 means nothing selectable
        int pref_ = -1;  ///< last preferred column/row set, -1 for none
        bool wrap_ = false;
        bool do_not_set_selected_ = false;

        ObserverList<Container&> focus_changed_;
        ObserverList<Container&> subwidgets_changed_;
        ObserverList<Container&> dimensions_changed_;
    };

    // ========================================================================
    // Columns
    // ========================================================================

    /// @brief Options for Columns
    struct ColumnsOptions {
        int start_column = -1;           ///< Column with initial focus, -1 for the first selectable
        bool wrap = false;               ///< Wrap from the last column to the first when moving
        bool do_not_set_selected = false; ///< Do not mark the focus child as selected
        std::vector<KeyPress> left_keys = {{keys::Left, false}, {'b', true}};
        std::vector<KeyPress> right_keys = {{keys::Right, false}, {'f', true}};
    };

    /// @brief Lays out children left to right
    class Columns : public Container {
    public:
        Columns(std::vector<ContainerChild> children, ColumnsOptions opt = ColumnsOptions{})
            : Container(std::move(children), opt.start_column, opt.wrap, opt.do_not_set_selected),
              opt_(std::move(opt)) {}

        static std::shared_ptr<Columns> with_dim(const Dimension& dim, const std::vector<std::shared_ptr<Widget>>& widgets) {
            return std::make_shared<Columns>(with_dimension(dim, widgets));
        }
        static std::shared_ptr<Columns> flow(const std::vector<std::shared_ptr<Widget>>& widgets) {
            return with_dim(Dimension::Flow(), widgets);
        }
        static std::shared_ptr<Columns> fixed(const std::vector<std::shared_ptr<Widget>>& widgets) {
            return with_dim(Dimension::Fixed(), widgets);
        }

        const ColumnsOptions& options() const { return opt_; }

        /// @brief Width in columns of every child when rendered with size
        std::vector<int> widget_widths(const RenderSize& size, const Selector& focus) {
            using K = Dimension::Kind;
            const int n = child_count();
            std::vector<int> res(n, 0);
            std::vector<int> weights(n, 0);
            std::vector<int> max_pool(n, 0);
            std::vector<std::optional<int>> caps(n);

            bool have_total = size.has_columns();
            int total = have_total ? std::max(0, size.columns) : 0;

            if (!have_total) {
                int weighted = 0;
                for (const auto& c : children_) {
                    if (c.dim.is_weight()) weighted++;
                }
                if (weighted > 1) {
                    throw logged<ConfigurationError>("Columns rendered as " + size.to_string() +
                                                     " cannot contain more than one Weight widget");
                }
            }

            int used = 0;
            auto trunc = [&](int x) {
                x = std::max(0, x);
                if (have_total && used + x > total) x = total - used;
                return x;
            };

            for (int i = 0; i < n; ++i) {
                const Dimension& d = children_[i].dim;
                switch (d.kind) {
                    case K::Fixed:
                        res[i] = children_[i].widget->render_size(RenderSize::Fixed(), child_focus(focus, i)).columns;
                        break;
                    case K::Box:
                    case K::FlowWith:
                        res[i] = d.columns;
                        break;
                    case K::Units:
                        res[i] = d.units;
                        break;
                    case K::Ratio:
                    case K::Relative:
                        if (!have_total) throw dimension_error(size, d);
                        res[i] = round_half_up(d.ratio * total);
                        break;
                    case K::Weight:
                        weights[i] = d.weight;
                        caps[i] = d.max_units;
                        continue;
                    case K::Flow:
                        weights[i] = 1;
                        continue;
                    case K::Max:
                        max_pool[i] = 1;
                        continue;
                }
                res[i] = trunc(res[i]);
                used += res[i];
            }

            int left = have_total ? total - used : 0;
            left = divide_by_weight(weights, caps, left, res);
            if (left > 0) {
                divide_by_weight(max_pool, std::vector<std::optional<int>>(n), left, res);
            }
            logger()->trace("{} widths for {}: {} of {}", describe(), size.to_string(), n, total);
            return res;
        }

        /// @brief Size a child is rendered with, given the width it was allotted
        RenderSize sub_widget_size(const RenderSize& size, int width, const Dimension& dim) const {
            using K = Dimension::Kind;
            switch (size.kind) {
                case SizeKind::Fixed:
                    if (dim.kind == K::Box) return RenderSize::Box(dim.columns, dim.rows);
                    return RenderSize::Fixed();
                case SizeKind::Box:
                    if (dim.kind == K::Fixed) return RenderSize::Fixed();
                    if (dim.kind == K::Flow) return RenderSize::FlowWith(width);
                    return RenderSize::Box(width, size.rows);
                case SizeKind::FlowWith:
                    if (dim.kind == K::Fixed) return RenderSize::Fixed();
                    if (dim.kind == K::Box) return RenderSize::Box(dim.columns, dim.rows);
                    return RenderSize::FlowWith(width);
            }
            throw dimension_error(size, dim);
        }

        Canvas render(const RenderSize& size, const Selector& focus) override {
            auto canvases = render_sub_widgets(size, focus);

            Canvas res;
            for (int i = 0; i < static_cast<int>(canvases.size()); ++i) {
                Canvas& c = canvases[i];
                int diff = res.rows() - c.rows();
                if (diff > 0) {
                    append_blank_lines(c, diff);
                } else if (diff < 0) {
                    append_blank_lines(res, -diff);
                }
                res.append_right(c, i == focus_);
            }

            if (size.has_columns()) {
                res.extend_right(size.columns - res.columns());
                if (size.has_rows() && res.rows() < size.rows) {
                    append_blank_lines(res, size.rows - res.rows());
                }
            }
            make_canvas_right_size(res, size);
            return res;
        }

        RenderBox render_size(const RenderSize& size, const Selector& focus) override {
            RenderBox res;
            for (const auto& b : rendered_sub_widget_sizes(size, focus)) {
                res.columns += b.columns;
                res.rows = std::max(res.rows, b.rows);
            }
            if (size.has_columns()) {
                res.columns = size.columns;
                if (size.has_rows()) res.rows = size.rows;
            }
            return res;
        }

        /// @brief Render every child in its column
        /// Max children are rendered last, as tall as the tallest other child.
        std::vector<Canvas> render_sub_widgets(const RenderSize& size, const Selector& focus) {
            const int n = child_count();
            std::vector<Canvas> canvases(n);
            if (n == 0) return canvases;

            auto widths = widget_widths(size, focus);
            std::vector<int> maxes;
            std::vector<RenderSize> max_sizes;
            int cur_max = -1;

            for (int i = 0; i < n; ++i) {
                RenderSize sub = sub_widget_size(size, widths[i], children_[i].dim);
                if (children_[i].dim.is_max()) {
                    maxes.push_back(i);
                    max_sizes.push_back(sub);
                } else {
                    canvases[i] = children_[i].widget->render(sub, child_focus(focus, i));
                    cur_max = std::max(cur_max, canvases[i].rows());
                }
            }

            if (cur_max == -1) throw all_max_error();

            for (size_t j = 0; j < maxes.size(); ++j) {
                int i = maxes[j];
                RenderSize sub = max_sizes[j];
                if (sub.has_columns()) sub = RenderSize::Box(sub.columns, cur_max);
                canvases[i] = children_[i].widget->render(sub, child_focus(focus, i));
            }
            return canvases;
        }

        /// @brief The boxes each child would occupy, without rendering them
        std::vector<RenderBox> rendered_sub_widget_sizes(const RenderSize& size, const Selector& focus) {
            const int n = child_count();
            std::vector<RenderBox> res(n);
            if (n == 0) return res;

            auto widths = widget_widths(size, focus);
            std::vector<int> maxes;
            int cur_max = -1;

            for (int i = 0; i < n; ++i) {
                if (children_[i].dim.is_max()) {
                    maxes.push_back(i);
                    continue;
                }
                RenderSize sub = sub_widget_size(size, widths[i], children_[i].dim);
                RenderBox b = children_[i].widget->render_size(sub, child_focus(focus, i));
                res[i] = {widths[i], b.rows};
                cur_max = std::max(cur_max, b.rows);
            }

            if (cur_max == -1) throw all_max_error();

            for (int i : maxes) {
                res[i] = {widths[i], cur_max};
            }
            return res;
        }

        bool on_event(const Event& event, const RenderSize& size, const Selector& focus, InputContext& ctx) override {
            if (focus_ == -1) return false;

            auto widths = widget_widths(size, focus);
            bool for_child = false;

            if (event.is_mouse()) {
                int cur_x = 0;
                for (int i = 0; i < child_count(); ++i) {
                    int w = widths[i];
                    if (event.x >= cur_x && event.x < cur_x + w) {
                        RenderSize sub = sub_widget_size(size, w, children_[i].dim);
                        for_child = children_[i].widget->on_event(event.translated(-cur_x, 0), sub,
                                                                  child_focus(focus, i), ctx);
                        click_focus(event, i, ctx);
                        break;
                    }
                    cur_x += w;
                }
            } else {
                RenderSize sub = sub_widget_size(size, widths[focus_], children_[focus_].dim);
                for_child = user_input_if_selectable(*children_[focus_].widget, event, sub, focus, ctx);
            }

            if (for_child) return true;

            if (event.is_key()) {
                if (key_in(event, opt_.right_keys)) return scroll_keeping_position(1);
                if (key_in(event, opt_.left_keys)) return scroll_keeping_position(-1);
            }
            return false;
        }

        std::string describe() const override { return "columns[" + std::to_string(children_.size()) + "]"; }

    private:
        ConfigurationError all_max_error() const {
            return logged<ConfigurationError>("All columns widgets were rendered Max, so there is no max height to use");
        }

        ColumnsOptions opt_;
    };

    // ========================================================================
    // Pile
    // ========================================================================

    /// @brief Options for Pile
    struct PileOptions {
        int start_row = -1;               ///< Row with initial focus, -1 for the first selectable
        bool wrap = false;                ///< Wrap from the last row to the first when moving
        bool do_not_set_selected = false; ///< Do not mark the focus child as selected
        std::vector<KeyPress> up_keys = all_up_keys();
        std::vector<KeyPress> down_keys = all_down_keys();
    };

    /// @brief Lays out children top to bottom
    class Pile : public Container {
    public:
        Pile(std::vector<ContainerChild> children, PileOptions opt = PileOptions{})
            : Container(std::move(children), opt.start_row, opt.wrap, opt.do_not_set_selected),
              opt_(std::move(opt)) {}

        static std::shared_ptr<Pile> with_dim(const Dimension& dim, const std::vector<std::shared_ptr<Widget>>& widgets) {
            return std::make_shared<Pile>(with_dimension(dim, widgets));
        }
        static std::shared_ptr<Pile> flow(const std::vector<std::shared_ptr<Widget>>& widgets) {
            return with_dim(Dimension::Flow(), widgets);
        }
        static std::shared_ptr<Pile> fixed(const std::vector<std::shared_ptr<Widget>>& widgets) {
            return with_dim(Dimension::Fixed(), widgets);
        }

        const PileOptions& options() const { return opt_; }

        /// @brief Per-child result of a layout pass
        template <typename T>
        struct Layout {
            std::vector<T> results;        ///< rendered canvas or measured box per child
            std::vector<RenderSize> sizes; ///< size each child was given
        };

        /// @brief Lay the children out, producing a result per child with make
        /// Children that size themselves go first; whatever rows are left are then
        /// divided among the weighted children.
        template <typename T>
        Layout<T> layout(const RenderSize& size, const Selector& focus,
                         const std::function<T(Widget&, const RenderSize&, const Selector&)>& make,
                         const std::function<int(const T&)>& rows_of,
                         const std::function<int(const T&)>& cols_of) {
            const int n = child_count();

            if (!size.is_box()) {
                int weighted = 0;
                for (const auto& c : children_) {
                    if (c.dim.is_weight()) weighted++;
                }
                if (weighted > 1) {
                    throw logged<ConfigurationError>("Pile is rendered as " + size.to_string() +
                                                     " so cannot contain more than one Weight widget");
                }
            }

            Layout<T> res;
            res.results.resize(n);
            res.sizes.resize(n);
            std::vector<bool> done(n, false);
            std::vector<int> heights(n, 0);
            int rows_used = 0;

            auto place = [&](int i, const RenderSize& sub) {
                res.sizes[i] = sub;
                res.results[i] = make(*children_[i].widget, sub, child_focus(focus, i));
                heights[i] = rows_of(res.results[i]);
                done[i] = true;
            };

            // Fixed children first; their width guides any Flow children in a Fixed pile
            int max_col = -1;
            for (int i = 0; i < n; ++i) {
                if (children_[i].dim.is_max()) {
                    throw dimension_error(size, children_[i].dim);
                }
                auto sub = vertical_sub_size(size, children_[i].dim, -1, -1);
                if (sub && sub->is_fixed()) {
                    place(i, *sub);
                    rows_used += heights[i];
                    max_col = std::max(max_col, cols_of(res.results[i]));
                }
            }

            for (int i = 0; i < n; ++i) {
                if (done[i]) continue;
                const Dimension& d = children_[i].dim;
                int available = size.is_box() ? size.rows - rows_used : -1;
                auto sub = vertical_sub_size(size, d, max_col, -1, available);
                if (sub) {
                    place(i, *sub);
                    rows_used += heights[i];
                } else if (!d.is_weight()) {
                    throw dimension_error(size, d);
                }
            }

            if (size.is_box()) {
                std::vector<int> weights(n, 0);
                std::vector<std::optional<int>> caps(n);
                std::vector<int> shares(n, 0);
                for (int i = 0; i < n; ++i) {
                    if (!done[i] && children_[i].dim.is_weight()) {
                        weights[i] = children_[i].dim.weight;
                        caps[i] = children_[i].dim.max_units;
                    }
                }
                divide_by_weight(weights, caps, size.rows - rows_used, shares);
                for (int i = 0; i < n; ++i) {
                    if (!done[i] && children_[i].dim.is_weight()) {
                        place(i, RenderSize::Box(size.columns, shares[i]));
                    }
                }
            } else {
                for (int i = 0; i < n; ++i) {
                    if (!done[i] && children_[i].dim.is_weight()) {
                        place(i, size);
                    }
                }
            }

            for (int i = 0; i < n; ++i) {
                if (!done[i]) place(i, RenderSize::Box(0, 0));
            }
            return res;
        }

        Layout<Canvas> render_sub_widgets(const RenderSize& size, const Selector& focus) {
            return layout<Canvas>(
                size, focus,
                [](Widget& w, const RenderSize& s, const Selector& f) { return w.render(s, f); },
                [](const Canvas& c) { return c.rows(); },
                [](const Canvas& c) { return c.columns(); });
        }

        Layout<RenderBox> rendered_sub_widget_sizes(const RenderSize& size, const Selector& focus) {
            return layout<RenderBox>(
                size, focus,
                [](Widget& w, const RenderSize& s, const Selector& f) { return w.render_size(s, f); },
                [](const RenderBox& b) { return b.rows; },
                [](const RenderBox& b) { return b.columns; });
        }

        Canvas render(const RenderSize& size, const Selector& focus) override {
            auto canvases = render_sub_widgets(size, focus).results;

            Canvas res;
            for (int i = 0; i < static_cast<int>(canvases.size()); ++i) {
                res.append_below(canvases[i], i == focus_);
                if (size.has_rows() && res.rows() >= size.rows) break;
            }
            if (size.has_rows()) {
                if (res.rows() > size.rows) {
                    res.truncate(0, res.rows() - size.rows);
                } else if (res.rows() < size.rows) {
                    append_blank_lines(res, size.rows - res.rows());
                }
            }
            make_canvas_right_size(res, size);
            return res;
        }

        RenderBox render_size(const RenderSize& size, const Selector& focus) override {
            RenderBox res;
            for (const auto& b : rendered_sub_widget_sizes(size, focus).results) {
                res.columns = std::max(res.columns, b.columns);
                res.rows += b.rows;
            }
            if (size.has_rows()) res.rows = std::min(res.rows, size.rows);
            return res;
        }

        bool on_event(const Event& event, const RenderSize& size, const Selector& focus, InputContext& ctx) override {
            if (focus_ == -1) return false;

            auto lay = rendered_sub_widget_sizes(size, focus);
            bool for_child = false;

            // Sends the event to the focus child, moved into its coordinates
            auto to_focus_child = [&](bool if_selectable) {
                int srows = 0;
                for (int i = 0; i < focus_; ++i) srows += lay.results[i].rows;
                Event ev = event.translated(0, -srows);
                Widget& w = *children_[focus_].widget;
                return if_selectable ? user_input_if_selectable(w, ev, lay.sizes[focus_], focus, ctx)
                                     : w.on_event(ev, lay.sizes[focus_], focus, ctx);
            };

            if (event.is_mouse()) {
                if (event.mouse_wheel_up() || event.mouse_wheel_down()) {
                    // the focus child gets first go at the wheel, so a focused list can scroll itself
                    for_child = to_focus_child(false);
                } else {
                    int cur_y = 0;
                    for (int i = 0; i < child_count(); ++i) {
                        int h = lay.results[i].rows;
                        if (event.y >= cur_y && event.y < cur_y + h) {
                            for_child = children_[i].widget->on_event(event.translated(0, -cur_y), lay.sizes[i],
                                                                      child_focus(focus, i), ctx);
                            click_focus(event, i, ctx);
                            break;
                        }
                        cur_y += h;
                    }
                }
            } else {
                for_child = to_focus_child(true);
            }

            if (for_child) return true;

            if (event.is_key()) {
                if (key_in(event, opt_.down_keys)) return scroll_keeping_position(1);
                if (key_in(event, opt_.up_keys)) return scroll_keeping_position(-1);
            } else if (event.mouse_wheel_down()) {
                return scroll_keeping_position(1);
            } else if (event.mouse_wheel_up()) {
                return scroll_keeping_position(-1);
            }
            return false;
        }

        std::string describe() const override { return "pile[" + std::to_string(children_.size()) + "]"; }

    private:
        PileOptions opt_;
    };

    // ========================================================================
    // Grid
    // ========================================================================

    /// @brief Options for Grid
    struct GridOptions {
        int start_pos = -1; ///< Item with initial focus, -1 for the first selectable
        bool wrap = false;  ///< Wrap around when moving left/right past the ends
        KeyBindings keys = KeyBindings::defaults();
    };

    /// @brief Position of a flat item index in rows of n items
    inline std::pair<int, int> row_col_of(int i, int n) { return {i / n, i % n}; }

    /// @brief Flat item index of a row and column in rows of n items
    inline int flat_index(int row, int col, int n) { return row * n + col; }

    /// @brief Flows same-width items into as many columns as fit, wrapping into rows
    /// The rows are rebuilt as a Pile of Columns every time the grid is rendered or
    /// handles input, since how many items fit depends on the width.
    class Grid : public Widget, public FocusContainer {
    public:
        /// @brief The generated arrangement for one size
        struct Generated {
            std::shared_ptr<Pile> pile;                 ///< rows and separators
            std::vector<std::shared_ptr<Columns>> rows; ///< one Columns per row
            int items_per_row = 0;
        };

        /// @brief Construct a new Grid
        /// @param items The items, in reading order
        /// @param width Width of every item
        /// @param h_sep Blank columns between items
        /// @param v_sep Blank rows between rows
        /// @param align Where each row sits within the width
        Grid(std::vector<std::shared_ptr<Widget>> items, int width, int h_sep, int v_sep,
             Alignment align = Alignment::Left, GridOptions opt = GridOptions{})
            : items_(std::move(items)), width_(width), h_sep_(h_sep), v_sep_(v_sep), align_(align),
              opt_(std::move(opt)) {
            if (opt_.start_pos >= 0) {
                focus_ = std::min(opt_.start_pos, child_count() - 1);
            } else {
                focus_ = find_next_selectable(1, opt_.wrap);
            }
        }

        int width() const { return width_; }
        int h_sep() const { return h_sep_; }
        int v_sep() const { return v_sep_; }
        Alignment align() const { return align_; }
        bool wrap() const { return opt_.wrap; }
        const GridOptions& options() const { return opt_; }

        void set_width(int w) { width_ = w; width_changed_.notify(*this); }
        void set_h_sep(int s) { h_sep_ = s; h_sep_changed_.notify(*this); }
        void set_v_sep(int s) { v_sep_ = s; v_sep_changed_.notify(*this); }
        void set_align(Alignment a) { align_ = a; align_changed_.notify(*this); }

        const std::vector<std::shared_ptr<Widget>>& sub_widgets() const { return items_; }

        /// @brief Replace the items, keeping the focus index if it still names a selectable item
        void set_sub_widgets(std::vector<std::shared_ptr<Widget>> items) {
            items_ = std::move(items);
            int f = focus_ == -1 ? -1 : std::min(focus_, child_count() - 1);
            if (f == -1 || !items_[f] || !items_[f]->selectable()) {
                f = cppwid::find_next_selectable(items_, -1, 1, false);
            }
            change_focus(f);
            subwidgets_changed_.notify(*this);
        }

        int focus() const override { return focus_; }

        void set_focus(int i) override { change_focus(std::min(std::max(i, 0), child_count() - 1)); }

    private:
        void change_focus(int f) {
            int old = focus_;
            focus_ = f;
            if (old != focus_) {
                logger()->debug("{} focus {} -> {}", describe(), old, focus_);
                focus_changed_.notify(*this);
            }
        }

    public:
        int child_count() const override { return static_cast<int>(items_.size()); }

        std::shared_ptr<Widget> child_widget(int i) const override {
            if (i < 0 || i >= child_count()) {
                throw logged<InvalidPositionError>(describe() + " has no item " + std::to_string(i));
            }
            return items_[i];
        }

        FocusContainer* focus_container() override { return this; }

        bool selectable() const override {
            for (const auto& w : items_) {
                if (w && w->selectable()) return true;
            }
            return false;
        }

        int find_next_selectable(int dir, bool wrap) const {
            return cppwid::find_next_selectable(items_, focus_, dir, wrap);
        }

        /// @brief Build the Pile of Columns for a size
        Generated generate_widgets(const RenderSize& size) const {
            if (!size.has_columns()) {
                throw logged<ConfigurationError>("Grid must not be rendered in Fixed mode");
            }
            if (width_ < 1) {
                throw logged<ConfigurationError>("Grid item width must be at least 1, got " + std::to_string(width_));
            }

            Generated gen;
            int cols = size.columns;
            int n = std::max(0, (cols - h_sep_) / (width_ + h_sep_));
            gen.items_per_row = n;

            std::vector<ContainerChild> pile_children;
            int pile_focus = -1;

            if (n > 0 && !items_.empty()) {
                int row_width = n * width_ + (n - 1) * h_sep_;
                int todo = ((child_count() - 1) / n + 1) * n;

                std::vector<ContainerChild> cur_row;
                int row_focus = -1;
                for (int i = 0; i < todo; ++i) {
                    if (i < child_count()) {
                        if (i == focus_) row_focus = static_cast<int>(cur_row.size());
                        cur_row.push_back({items_[i], Dimension::Units(width_)});
                    } else {
                        cur_row.push_back({std::make_shared<Text>(std::string(width_, ' ')), Dimension::Units(width_)});
                    }

                    if (static_cast<int>(cur_row.size()) == 2 * n - 1) {
                        auto row = std::make_shared<Columns>(std::move(cur_row));
                        if (!gen.rows.empty()) {
                            pile_children.push_back({std::make_shared<Fill>(' '), Dimension::Units(v_sep_)});
                        }
                        pile_children.push_back({std::make_shared<HPadding>(row, align_, Dimension::Units(row_width)),
                                                 Dimension::Flow()});
                        if (row_focus != -1) {
                            row->set_focus(row_focus);
                            row_focus = -1;
                            pile_focus = static_cast<int>(pile_children.size()) - 1;
                        }
                        gen.rows.push_back(row);
                        cur_row.clear();
                    } else {
                        cur_row.push_back({std::make_shared<Text>(std::string(h_sep_, ' ')), Dimension::Units(h_sep_)});
                    }
                }
            }

            gen.pile = std::make_shared<Pile>(std::move(pile_children));
            if (pile_focus != -1) gen.pile->set_focus(pile_focus);
            return gen;
        }

        Canvas render(const RenderSize& size, const Selector& focus) override {
            return generate_widgets(size).pile->render(size, focus);
        }

        bool on_event(const Event& event, const RenderSize& size, const Selector& focus, InputContext& ctx) override {
            bool for_child = false;
            int n = 0;

            if (event.is_mouse()) {
                if (!event.mouse_wheel()) {
                    Generated gen = generate_widgets(size);
                    n = gen.items_per_row;
                    // the arrangement is rebuilt each time, so a press recorded on the grid
                    // stands for the rows and columns generated for the release
                    if (event.mouse_release() && ctx.is_click_target(this)) {
                        ctx.set_click_target(buttons::Left, gen.pile.get());
                        for (const auto& row : gen.rows) ctx.set_click_target(buttons::Left, row.get());
                    }
                    for_child = user_input_if_selectable(*gen.pile, event, size, focus, ctx);
                    if (event.mouse_press()) ctx.set_click_target(event.button, this);

                    int pile_idx = gen.pile->focus();
                    if (pile_idx != -1 && n > 0) {
                        int row = (pile_idx + 1) / 2;
                        int col = (gen.rows[row]->focus() + 1) / 2;
                        int target = flat_index(row, col, n);
                        if (target != focus_ && target < child_count() && items_[target]->selectable()) {
                            set_focus(target);
                            for_child = true;
                        }
                    }
                }
            } else if (focus_ != -1 && focus.focus) {
                for_child = user_input_if_selectable(*items_[focus_], event, RenderSize::FlowWith(width_), focus, ctx);
            }

            if (for_child) return true;

            if (event.is_key()) {
                if (key_in(event, opt_.keys.right)) return move_to(find_next_selectable(1, opt_.wrap));
                if (key_in(event, opt_.keys.left)) return move_to(find_next_selectable(-1, opt_.wrap));
            }

            bool down = event.mouse_wheel_down() || key_in(event, opt_.keys.down);
            bool up = event.mouse_wheel_up() || key_in(event, opt_.keys.up);
            bool right = event.mouse_wheel_right();
            bool left = event.mouse_wheel_left();
            if (!(down || up || right || left) || focus_ == -1) return false;

            if (n == 0) n = generate_widgets(size).items_per_row;
            if (n == 0) return false;

            int next = -1;
            if (down) {
                for (int i = focus_ + n; i < child_count(); i += n) {
                    if (items_[i]->selectable()) { next = i; break; }
                }
            } else if (up) {
                for (int i = focus_ - n; i >= 0; i -= n) {
                    if (items_[i]->selectable()) { next = i; break; }
                }
            } else if (right) {
                int base = (focus_ / n) * n;
                int end = std::min(base + n - 1, child_count() - 1);
                for (int i = base + std::min(focus_ % n + 1, n - 1); i <= end; ++i) {
                    if (items_[i]->selectable()) { next = i; break; }
                }
            } else {
                int base = (focus_ / n) * n;
                for (int i = base + std::max(focus_ % n - 1, 0); i >= base; --i) {
                    if (items_[i]->selectable()) { next = i; break; }
                }
            }
            return move_to(next);
        }

        void on_focus_changed(const std::string& id, std::function<void(Grid&)> cb) { focus_changed_.add(id, std::move(cb)); }
        bool remove_on_focus_changed(const std::string& id) { return focus_changed_.remove(id); }
        void on_subwidgets_changed(const std::string& id, std::function<void(Grid&)> cb) {
            subwidgets_changed_.add(id, std::move(cb));
        }
        void on_width_changed(const std::string& id, std::function<void(Grid&)> cb) { width_changed_.add(id, std::move(cb)); }
        void on_h_sep_changed(const std::string& id, std::function<void(Grid&)> cb) { h_sep_changed_.add(id, std::move(cb)); }
        void on_v_sep_changed(const std::string& id, std::function<void(Grid&)> cb) { v_sep_changed_.add(id, std::move(cb)); }
        void on_align_changed(const std::string& id, std::function<void(Grid&)> cb) { align_changed_.add(id, std::move(cb)); }

        std::string describe() const override { return "grid[" + std::to_string(items_.size()) + "]"; }

    private:
        bool move_to(int next) {
            if (next == -1) return false;
            int old = focus_;
            set_focus(next);
            return focus_ != old;
        }

        std::vector<std::shared_ptr<Widget>> items_;
        int width_;
        int h_sep_;
        int v_sep_;
        Alignment align_;
        GridOptions opt_;
        int focus_ = -1; ///< -1 means nothing selectable

        ObserverList<Grid&> focus_changed_;
        ObserverList<Grid&> subwidgets_changed_;
        ObserverList<Grid&> width_changed_;
        ObserverList<Grid&> h_sep_changed_;
        ObserverList<Grid&> v_sep_changed_;
        ObserverList<Grid&> align_changed_;
    };

} // namespace cppwid

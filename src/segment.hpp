#pragma once

/**
 * Segment: the atomic rendering unit.
 *
 * Everything the renderer produces funnels into a stream of segments, each a
 * run of text with one style, or a zero-width control segment carrying
 * terminal control codes.
 */

#include "style.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rich {

enum class ControlType {
    Bell,
    CarriageReturn,
    Home,
    Clear,
    ShowCursor,
    HideCursor,
    EnableAltScreen,
    DisableAltScreen,
    CursorUp,
    CursorDown,
    CursorForward,
    CursorBackward,
    CursorMoveToColumn,
    CursorMoveTo,
    EraseInLine,
    SetWindowTitle
};

/**
 * A terminal control code with its integer parameters
 * (e.g. CursorUp {3}, CursorMoveTo {x, y}).
 */
struct ControlCode {
    ControlType type;
    std::vector<int> params;

    bool operator==(const ControlCode& other) const {
        return type == other.type && params == other.params;
    }
};

struct Segment {
    std::string text;
    std::optional<Style> style;
    std::optional<std::vector<ControlCode>> control;  // Set for control segments.

    Segment() = default;
    Segment(std::string text, std::optional<Style> style = std::nullopt)
        : text(std::move(text)), style(std::move(style)) {}

    static Segment plain(const std::string& text) { return Segment(text); }

    static Segment line() { return Segment("\n"); }

    // Control segment; `payload` carries auxiliary text such as a window title.
    static Segment control_codes(std::vector<ControlCode> codes, std::string payload = "");

    bool is_control() const { return control.has_value(); }

    // Cell width; always 0 for control segments.
    size_t cell_length() const;

    bool empty() const { return text.empty() && !control; }

    /**
     * Split at a cell offset into (left, right).
     * A double-width character straddling the offset goes to the right half.
     * A control segment splits into (whole, empty).
     */
    std::pair<Segment, Segment> split_at_cell(size_t cell_pos) const;

    bool operator==(const Segment& other) const {
        return text == other.text && style == other.style && control == other.control;
    }
    bool operator!=(const Segment& other) const { return !(*this == other); }
};

using SegmentLine = std::vector<Segment>;

namespace segment {

/**
 * Apply styles to every non-control segment: `style` underneath the
 * segment's own style and `post_style` on top of it.
 */
std::vector<Segment> apply_style(const std::vector<Segment>& segments,
                                 const std::optional<Style>& style,
                                 const std::optional<Style>& post_style = std::nullopt);

// Split a stream into lines at '\n'; newline characters are consumed.
std::vector<SegmentLine> split_lines(const std::vector<Segment>& segments);

// Pad (when `pad` is true) or truncate a line to exactly `length` cells.
SegmentLine adjust_line_length(const SegmentLine& line, size_t length,
                               const std::optional<Style>& style = std::nullopt,
                               bool pad = true);

// Cut a line to at most `max_width` cells; control segments are kept.
SegmentLine truncate_line(const SegmentLine& line, size_t max_width);

// Merge adjacent segments with equal styles and drop empty ones.
std::vector<Segment> simplify(const std::vector<Segment>& segments);

/**
 * Divide a line at ascending cell positions into cuts.size() + 1 groups.
 */
std::vector<SegmentLine> divide(const SegmentLine& segments, const std::vector<size_t>& cuts);

// Pad lines to `width` and to `height` lines, placing content at the top,
// bottom or middle.
std::vector<SegmentLine> align_top(std::vector<SegmentLine> lines, size_t width, size_t height,
                                   const Style& style);
std::vector<SegmentLine> align_bottom(std::vector<SegmentLine> lines, size_t width, size_t height,
                                      const Style& style);
std::vector<SegmentLine> align_middle(std::vector<SegmentLine> lines, size_t width, size_t height,
                                      const Style& style);

size_t line_length(const SegmentLine& line);

} // namespace segment

} // namespace rich

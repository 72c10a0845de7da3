#pragma once

/**
 * Rich text: a plain string annotated with styled spans.
 *
 * Span offsets are byte offsets into the UTF-8 plain string and always fall
 * on character boundaries. Overlapping spans are resolved by application
 * order: later spans are combined on top of earlier ones. All width math
 * (wrapping, padding, truncation) is done in terminal cells.
 */

#include "config.hpp"
#include "segment.hpp"
#include "style.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rich {

enum class JustifyMethod {
    Default,  // Leave lines as wrapped
    Left,
    Center,
    Right,
    Full      // Stretch inter-word gaps; the last line stays left aligned
};

enum class OverflowMethod {
    Fold,      // Break onto the next line
    Crop,      // Cut at the boundary
    Ellipsis,  // Cut and end with a single-cell ellipsis
    Ignore     // Leave overflowing text alone
};

std::optional<JustifyMethod> parse_justify(const std::string& name);
std::optional<OverflowMethod> parse_overflow(const std::string& name);

/**
 * A styled byte range [start, end) of a Text.
 */
struct Span {
    size_t start = 0;
    size_t end = 0;
    Style style;

    Span() = default;
    Span(size_t start, size_t end, Style style);

    bool empty() const { return start >= end; }
    size_t length() const { return end > start ? end - start : 0; }

    // Shift right by `offset`, clamped to `max`.
    Span move_right(size_t offset, size_t max) const;

    // Shift left by `offset`, saturating at 0.
    Span adjust(size_t offset) const;

    bool operator==(const Span& other) const {
        return start == other.start && end == other.end && style == other.style;
    }
};

class Text {
public:
    explicit Text(std::string plain = "", Style style = Style());

    // Text whose whole content carries `style` as a span.
    static Text styled(const std::string& plain, const Style& style);

    // Concatenate (text, optional style) pieces.
    static Text assemble(const std::vector<std::pair<std::string, std::optional<Style>>>& pieces);

    const std::string& plain() const { return plain_; }
    const std::vector<Span>& spans() const { return spans_; }

    // Length in bytes.
    size_t size() const { return plain_.size(); }
    bool empty() const { return plain_.empty(); }

    // Width in terminal cells.
    size_t cell_len() const;

    const Style& style() const { return style_; }
    void set_style(const Style& style) { style_ = style; }

    JustifyMethod justify = JustifyMethod::Default;
    OverflowMethod overflow = OverflowMethod::Fold;
    bool no_wrap = false;
    std::string end = "\n";
    size_t tab_size = DEFAULT_TAB_SIZE;

    // ========== Building ==========

    void append(const std::string& text);
    void append_styled(const std::string& text, const Style& style);

    // Append another Text, shifting its spans.
    void append_text(const Text& other);

    /**
     * Apply a style to the byte range [start, end). Offsets are clamped to
     * the text and widened to character boundaries; empty ranges are ignored.
     */
    void stylize(size_t start, size_t end, const Style& style);

    void stylize_all(const Style& style);

    // Style every occurrence of each word; returns the number of matches.
    size_t highlight_words(const std::vector<std::string>& words, const Style& style,
                           bool case_sensitive = true);

    /**
     * Style every match of an ECMAScript regular expression.
     * @throws std::regex_error if the pattern is invalid
     */
    size_t highlight_regex(const std::string& pattern, const Style& style);

    // ========== Slicing ==========

    // Copy of the byte range [start, end) with spans clipped and rebased.
    Text slice(size_t start, size_t end) const;

    // Concatenate `items` with this text as the separator.
    Text join(const std::vector<Text>& items) const;

    // Split at '\n' (consumed); a trailing newline yields a trailing empty line.
    std::vector<Text> split_lines() const;

    // Split at ascending byte offsets into offsets.size() + 1 pieces.
    std::vector<Text> divide(const std::vector<size_t>& offsets) const;

    // Replace tabs with spaces up to the next multiple of `tab_size` cells.
    Text expand_tabs(size_t tab_size) const;

    Text strip() const;
    Text strip_right() const;

    // ========== Layout ==========

    /**
     * Word-wrap to `width` cells.
     *
     * Whitespace at a break stays on the line being closed, so joining the
     * lines gives back the original text. The exception is break whitespace
     * that extends past the width: that part is trimmed and is lost from the
     * joined result. Words wider than the width are folded. With Crop
     * or Ellipsis overflow each input line is truncated instead. Lines are
     * justified according to `justify`.
     */
    std::vector<Text> wrap(size_t width) const;

    // Cut to `width` cells according to `overflow`, padding with spaces if `pad`.
    void truncate(size_t width, OverflowMethod overflow, bool pad = false);

    // Pad with spaces to `width` cells; center puts the odd cell on the right.
    void pad(size_t width, JustifyMethod justify);

    void pad_left(size_t count);
    void pad_right(size_t count);

    // Remove trailing whitespace that extends past `size` cells.
    void rstrip_end(size_t size);

    // Justify a block of wrapped lines in place.
    static void justify_lines(std::vector<Text>& lines, size_t width, JustifyMethod justify,
                              OverflowMethod overflow);

    // ========== Rendering ==========

    /**
     * Project the text to segments: one per run of constant span coverage,
     * styled with the base style combined with the active spans in the
     * order they were applied, followed by `end` when non-empty.
     */
    std::vector<Segment> render(const std::string& end = "") const;

    bool operator==(const Text& other) const {
        return plain_ == other.plain_ && spans_ == other.spans_;
    }
    bool operator!=(const Text& other) const { return !(*this == other); }

    Text operator+(const Text& other) const;
    Text& operator+=(const Text& other);

private:
    // Copy of this text's settings with new content.
    Text with_content(std::string plain, std::vector<Span> spans) const;

    std::vector<Text> wrap_line(const Text& line, size_t width) const;

    std::string plain_;
    std::vector<Span> spans_;
    Style style_;
};

} // namespace rich

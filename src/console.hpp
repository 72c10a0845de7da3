#pragma once

#include "markup.hpp"
#include "segment.hpp"
#include "text.hpp"
#include "theme.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace rich {

/**
 * ANSI writer.
 *
 * Turns markup, Text and segment streams into escape-sequence output for a
 * given color capability and width. With no color system (dumb terminal,
 * NO_COLOR, or "--color-system none") only the plain text is written.
 */
class Console {
public:
    // Creates a Console that writes to stdout and detects width and color support.
    Console();

    Console(std::optional<ColorSystem> color_system, size_t width, std::ostream& out = std::cout);

    // ========== Configuration ==========

    const std::optional<ColorSystem>& color_system() const { return color_system_; }
    void set_color_system(std::optional<ColorSystem> system) { color_system_ = system; }

    size_t width() const { return width_; }
    void set_width(size_t width) { width_ = width == 0 ? 1 : width; }

    const Theme& theme() const { return theme_; }
    void set_theme(const Theme& theme) { theme_ = theme; }

    // Fail on malformed markup instead of printing it literally.
    bool strict() const { return strict_; }
    void set_strict(bool strict) { strict_ = strict; }

    /**
     * Look up a style by theme name, falling back to a style definition.
     * @throws StyleParseError if `name` is neither
     */
    Style get_style(const std::string& name) const;

    // ========== Rendering ==========

    /**
     * Encode segments as ANSI text: each styled segment is wrapped in its
     * SGR/OSC 8 prefix and suffix, control segments become CSI/OSC sequences.
     */
    std::string render_segments(const std::vector<Segment>& segments) const;

    /**
     * Wrap text to the console width and flatten it to segments, with a
     * newline segment between lines and the text's `end` after the last one.
     */
    std::vector<Segment> render_text(const Text& text) const;

    /**
     * Parse markup with the console theme and render it to an ANSI string.
     * @throws MarkupError in strict mode
     */
    std::string render_markup(const std::string& markup) const;

    // Encode one control code.
    static std::string control_sequence(const ControlCode& code, const std::string& payload = "");

    // ========== Output ==========

    // Prints markup followed by a newline.
    void print(const std::string& markup) const;

    void print_text(const Text& text) const;

    void print_segments(const std::vector<Segment>& segments) const;

    // Writes control codes (cursor movement, screen clearing, title).
    // `payload` carries the window title for SetWindowTitle.
    void control(const std::vector<ControlCode>& codes, const std::string& payload = "") const;

    // Prints a message in a theme style ("error", "warning", "success", "info").
    void print_error(const std::string& text) const;
    void print_warning(const std::string& text) const;
    void print_success(const std::string& text) const;
    void print_info(const std::string& text) const;

    // Flushes the output stream.
    void flush() const;

private:
    std::optional<ColorSystem> color_system_;
    size_t width_;
    Theme theme_;
    bool strict_ = false;
    std::ostream* out_;

    void print_themed(const std::string& style_name, const std::string& text) const;

    // Enables ANSI processing on Windows consoles.
    void enable_colors();
};

} // namespace rich

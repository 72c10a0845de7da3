#pragma once

#include "color.hpp"

#include <optional>
#include <string>

namespace rich {
namespace terminal {

/**
 * Get the terminal width in columns.
 * Returns 80 if width cannot be determined.
 */
int get_width();

/**
 * Get the terminal height in rows.
 * Returns 24 if height cannot be determined.
 */
int get_height();

/**
 * Check if stdout is a TTY (interactive terminal).
 */
bool is_tty();

/**
 * Guess the color capability from the environment.
 *
 * COLORTERM=truecolor|24bit gives TrueColor, a TERM containing "256color"
 * gives EightBit, TERM=dumb or no TERM gives no color (nullopt), and any
 * other TERM gives Standard. NO_COLOR disables color.
 */
std::optional<ColorSystem> detect_color_system();

/**
 * Remove ANSI CSI and OSC escape sequences from a string.
 */
std::string strip_ansi(const std::string& text);

/**
 * Calculate the display width of a string in cells, ignoring ANSI escape
 * sequences (which have zero width).
 *
 * @param text The text to measure
 * @return Display width in columns
 */
int display_width(const std::string& text);

namespace cursor {
    /**
     * Move cursor up n lines.
     * ANSI: \033[nA
     */
    std::string up(int n);

    /**
     * Move cursor down n lines.
     * ANSI: \033[nB
     */
    std::string down(int n);

    // ANSI: \033[nC
    std::string forward(int n);

    // ANSI: \033[nD
    std::string backward(int n);

    /**
     * Move cursor to column n (1-based).
     * ANSI: \033[nG
     */
    std::string column(int n);

    /**
     * Move cursor to (x, y), 0-based.
     * ANSI: \033[y+1;x+1H
     */
    std::string move_to(int x, int y);

    // ANSI: \033[H
    std::string home();

    // ANSI: \033[?25h / \033[?25l
    std::string show();
    std::string hide();
}

namespace clear {
    /**
     * Erase in line. Mode 0 clears to end, 1 to start, 2 the whole line.
     * ANSI: \033[nK
     */
    std::string in_line(int mode);

    /**
     * Clear entire screen.
     * ANSI: \033[2J
     */
    std::string screen();
}

// ANSI: \033[?1049h / \033[?1049l
std::string enable_alt_screen();
std::string disable_alt_screen();

// OSC 0 window title, BEL terminated.
std::string set_title(const std::string& title);

} // namespace terminal
} // namespace rich

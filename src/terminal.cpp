#include "terminal.hpp"
#include "cells.hpp"
#include "config.hpp"

#ifdef _WIN32
#include <windows.h>
#include <io.h>
#define isatty _isatty
#define STDOUT_FILENO 1
#else
#include <sys/ioctl.h>
#include <unistd.h>
#endif

#include <cstdlib>

namespace rich {
namespace terminal {

namespace {
    std::string env(const char* name) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string();
    }
}

int get_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi)) {
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    }
#else
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return ws.ws_col;
    }
#endif

    // Try COLUMNS environment variable
    const char* columns = std::getenv("COLUMNS");
    if (columns) {
        int width = std::atoi(columns);
        if (width > 0) {
            return width;
        }
    }

    return DEFAULT_WIDTH;
}

int get_height() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi)) {
        return csbi.srWindow.Bottom - csbi.srWindow.Top + 1;
    }
#else
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0) {
        return ws.ws_row;
    }
#endif

    const char* lines = std::getenv("LINES");
    if (lines) {
        int height = std::atoi(lines);
        if (height > 0) {
            return height;
        }
    }

    return 24;
}

bool is_tty() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(STDOUT_FILENO) != 0;
#endif
}

std::optional<ColorSystem> detect_color_system() {
    if (std::getenv("NO_COLOR")) {
        return std::nullopt;
    }

    std::string colorterm = env("COLORTERM");
    if (colorterm == "truecolor" || colorterm == "24bit") {
        return ColorSystem::TrueColor;
    }

    std::string term = env("TERM");
    if (term.empty() || term == "dumb") {
        return std::nullopt;
    }
    if (term.find("256color") != std::string::npos) {
        return ColorSystem::EightBit;
    }
    return ColorSystem::Standard;
}

std::string strip_ansi(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    size_t i = 0;

    while (i < text.size()) {
        if (text[i] != '\033' || i + 1 >= text.size()) {
            result += text[i++];
            continue;
        }

        char kind = text[i + 1];
        i += 2;
        if (kind == '[') {
            // CSI: parameters then a final byte in @..~
            while (i < text.size() && !(text[i] >= '@' && text[i] <= '~')) {
                i++;
            }
            i++;
        } else if (kind == ']') {
            // OSC: terminated by BEL or ESC backslash
            while (i < text.size()) {
                if (text[i] == '\007') {
                    i++;
                    break;
                }
                if (text[i] == '\033' && i + 1 < text.size() && text[i + 1] == '\\') {
                    i += 2;
                    break;
                }
                i++;
            }
        }
    }

    return result;
}

int display_width(const std::string& text) {
    return static_cast<int>(cell_len(strip_ansi(text)));
}

namespace cursor {

std::string up(int n) {
    if (n <= 0) return "";
    return "\033[" + std::to_string(n) + "A";
}

std::string down(int n) {
    if (n <= 0) return "";
    return "\033[" + std::to_string(n) + "B";
}

std::string forward(int n) {
    if (n <= 0) return "";
    return "\033[" + std::to_string(n) + "C";
}

std::string backward(int n) {
    if (n <= 0) return "";
    return "\033[" + std::to_string(n) + "D";
}

std::string column(int n) {
    if (n <= 0) n = 1;
    return "\033[" + std::to_string(n) + "G";
}

std::string move_to(int x, int y) {
    if (x < 0) x = 0;
    if (y < 0) y = 0;
    return "\033[" + std::to_string(y + 1) + ";" + std::to_string(x + 1) + "H";
}

std::string home() {
    return "\033[H";
}

std::string show() {
    return "\033[?25h";
}

std::string hide() {
    return "\033[?25l";
}

} // namespace cursor

namespace clear {

std::string in_line(int mode) {
    if (mode < 0 || mode > 2) mode = 2;
    return "\033[" + std::to_string(mode) + "K";
}

std::string screen() {
    return "\033[2J";
}

} // namespace clear

std::string enable_alt_screen() {
    return "\033[?1049h";
}

std::string disable_alt_screen() {
    return "\033[?1049l";
}

std::string set_title(const std::string& title) {
    return "\033]0;" + title + "\007";
}

} // namespace terminal
} // namespace rich

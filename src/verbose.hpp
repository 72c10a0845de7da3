#pragma once

/**
 * Verbose logging for crich.
 *
 * Diagnostics go to stderr so they never mix with rendered output on stdout.
 * Messages are tagged with a timestamp and a category (CACHE, THEME, SETTINGS,
 * MARKUP, CONSOLE, MAIN). Tags are colored only when stderr is a terminal.
 */

#include <string>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <sstream>
#include <ctime>
#include <cstdio>
#include <unistd.h>

namespace rich {

inline bool g_verbose = false;

inline void set_verbose(bool enabled) {
    g_verbose = enabled;
}

inline bool is_verbose() {
    return g_verbose;
}

/**
 * Get current timestamp as string.
 */
inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

namespace detail {
    inline void write_log(const char* color, const std::string& tag, const std::string& message) {
        static const bool colored = isatty(STDERR_FILENO);
        if (colored) {
            std::cerr << "\033[90m[" << timestamp() << "] " << color << "[" << tag << "]\033[0m "
                      << message << std::endl;
        } else {
            std::cerr << "[" << timestamp() << "] [" << tag << "] " << message << std::endl;
        }
    }
}

/**
 * Log a verbose message with timestamp and category.
 */
inline void verbose_log(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    detail::write_log("\033[36m", category, message);
}

/**
 * Log a recoverable error (always shown in verbose mode).
 */
inline void verbose_err(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    detail::write_log("\033[31m", category + " ERR", message);
}

/**
 * Make escape sequences readable in a log line: ESC becomes "\e", BEL "\a",
 * other control bytes "\xNN". Output longer than `max_len` is cut.
 */
inline std::string visible_escapes(const std::string& s, size_t max_len = 200) {
    std::string result;
    for (unsigned char c : s) {
        if (result.size() >= max_len) {
            result += "... (" + std::to_string(s.length()) + " bytes total)";
            break;
        }
        if (c == 0x1b) {
            result += "\\e";
        } else if (c == 0x07) {
            result += "\\a";
        } else if (c == '\n') {
            result += "\\n";
        } else if (c < 0x20 || c == 0x7f) {
            char buf[5];
            std::snprintf(buf, sizeof(buf), "\\x%02x", c);
            result += buf;
        } else {
            result += static_cast<char>(c);
        }
    }
    return result;
}

} // namespace rich

#pragma once

/**
 * Library-wide configuration constants.
 *
 * Defines cache capacities, rendering defaults and the settings file name for
 * the crich rendering engine and CLI.
 */

#include <cstddef>

namespace rich {

// ========== File Paths ==========

constexpr const char* SETTINGS_FILE = ".crich.json";  // Local settings file.

// ========== Parse Caches ==========

constexpr std::size_t COLOR_CACHE_CAPACITY = 1024;  // Parsed colors kept per process.
constexpr std::size_t STYLE_CACHE_CAPACITY = 512;   // Parsed styles kept per process.

// ========== Rendering Defaults ==========

constexpr int DEFAULT_WIDTH = 80;           // Fallback console width in cells.
constexpr std::size_t DEFAULT_TAB_SIZE = 8;  // Tab stop interval for expand_tabs.

// Single-cell marker appended by the ellipsis overflow policy (U+2026).
constexpr const char* ELLIPSIS = "\xE2\x80\xA6";

} // namespace rich

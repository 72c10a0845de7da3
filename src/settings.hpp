#pragma once

/**
 * Settings persistence for the crich CLI.
 *
 * Handles loading and saving of rendering defaults to a local JSON file:
 * color system, width, theme file and inline style overrides.
 */

#include "color.hpp"
#include "config.hpp"
#include "theme.hpp"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace rich {

class SettingsError : public std::runtime_error {
public:
    enum class Kind {
        InvalidJson,  // File is not valid JSON
        InvalidValue  // A field has the wrong type or an unknown value
    };

    SettingsError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

/**
 * Application settings stored in .crich.json.
 */
struct Settings {
    std::string color_system = "auto";          // auto, none, standard, 256 or truecolor.
    size_t width = 0;                           // Output width; 0 uses the terminal width.
    std::string justify;                        // Default justify method (empty for none).
    std::string overflow;                       // Default overflow method (empty for fold).
    std::string theme_file;                     // JSON theme loaded on top of the defaults.
    std::map<std::string, std::string> styles;  // Inline style overrides.
    bool cache_enabled = true;                  // Parse caches on or off.
};

/**
 * Loads settings from `path`. Returns empty optional if the file doesn't exist.
 * @throws SettingsError if the file is malformed
 */
std::optional<Settings> load_settings(const std::string& path = SETTINGS_FILE);

// Saves settings to `path`.
void save_settings(const Settings& settings, const std::string& path = SETTINGS_FILE);

/**
 * Resolve the "color_system" setting. "auto" probes the environment and
 * "none" disables color.
 * @throws SettingsError for unknown names
 */
std::optional<ColorSystem> resolve_color_system(const std::string& name);

/**
 * Build the theme described by the settings: defaults, then the theme file,
 * then inline styles.
 * @throws ThemeError if the theme file or a style is invalid
 */
Theme build_theme(const Settings& settings);

} // namespace rich

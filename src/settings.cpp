#include "settings.hpp"
#include "terminal.hpp"
#include "text.hpp"
#include "verbose.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <filesystem>

namespace rich {

using json = nlohmann::json;

std::optional<Settings> load_settings(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw SettingsError(SettingsError::Kind::InvalidJson,
                            "Failed to parse " + path + ": " + e.what());
    }

    if (!j.is_object()) {
        throw SettingsError(SettingsError::Kind::InvalidJson, path + " must contain a JSON object");
    }

    try {
        Settings settings;
        settings.color_system = j.value("color_system", settings.color_system);
        settings.width = j.value("width", settings.width);
        settings.justify = j.value("justify", "");
        settings.overflow = j.value("overflow", "");
        settings.theme_file = j.value("theme_file", "");
        settings.cache_enabled = j.value("cache_enabled", true);

        if (j.contains("styles") && j["styles"].is_object()) {
            for (const auto& [name, definition] : j["styles"].items()) {
                if (definition.is_string()) {
                    settings.styles[name] = definition.get<std::string>();
                }
            }
        }

        if (!settings.justify.empty() && !parse_justify(settings.justify)) {
            throw SettingsError(SettingsError::Kind::InvalidValue,
                                "Invalid justify in " + path + ": " + settings.justify);
        }
        if (!settings.overflow.empty() && !parse_overflow(settings.overflow)) {
            throw SettingsError(SettingsError::Kind::InvalidValue,
                                "Invalid overflow in " + path + ": " + settings.overflow);
        }
        const std::string& system = settings.color_system;
        if (system != "auto" && system != "none" && !system.empty() && !parse_color_system(system)) {
            throw SettingsError(SettingsError::Kind::InvalidValue,
                                "Invalid color_system in " + path + ": " + system);
        }

        verbose_log("SETTINGS", "Loaded " + path);
        return settings;
    } catch (const json::exception& e) {
        throw SettingsError(SettingsError::Kind::InvalidValue,
                            "Invalid value in " + path + ": " + e.what());
    }
}

void save_settings(const Settings& settings, const std::string& path) {
    json j;
    j["color_system"] = settings.color_system;
    j["width"] = settings.width;
    j["cache_enabled"] = settings.cache_enabled;
    if (!settings.justify.empty()) {
        j["justify"] = settings.justify;
    }
    if (!settings.overflow.empty()) {
        j["overflow"] = settings.overflow;
    }
    if (!settings.theme_file.empty()) {
        j["theme_file"] = settings.theme_file;
    }
    j["styles"] = settings.styles;

    std::ofstream file(path);
    if (file.is_open()) {
        file << j.dump(2) << std::endl;
    } else {
        verbose_err("SETTINGS", "Failed to write " + path);
    }
}

std::optional<ColorSystem> resolve_color_system(const std::string& name) {
    if (name.empty() || name == "auto") {
        return terminal::detect_color_system();
    }
    if (name == "none") {
        return std::nullopt;
    }
    if (auto system = parse_color_system(name)) {
        return system;
    }
    throw SettingsError(SettingsError::Kind::InvalidValue, "Unknown color system: " + name);
}

Theme build_theme(const Settings& settings) {
    Theme base = settings.theme_file.empty() ? Theme() : Theme::read(settings.theme_file);
    if (settings.styles.empty()) {
        return base;
    }

    std::map<std::string, Style> styles = base.styles();
    for (const auto& [name, style] : Theme::from_style_definitions(settings.styles, false).styles()) {
        styles[name] = style;
    }
    return Theme(styles, false);
}

} // namespace rich

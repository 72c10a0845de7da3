#pragma once

/**
 * Named style registry.
 *
 * A Theme maps names such as "rule.line" or "warning" to styles. Markup tags
 * are resolved against the active theme before falling back to the style
 * grammar. Themes are stored as JSON: {"styles": {"name": "definition"}}.
 */

#include "style.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace rich {

class ThemeError : public std::runtime_error {
public:
    enum class Kind {
        Io,             // Theme file could not be read
        InvalidJson,    // File is not valid JSON or has the wrong shape
        InvalidStyle,   // A style definition failed to parse
        StackUnderflow  // Attempt to pop the base theme
    };

    ThemeError(Kind kind, const std::string& message);

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

// Built-in style definitions every inheriting theme starts from.
const std::map<std::string, std::string>& default_style_definitions();

class Theme {
public:
    /**
     * Create a theme from parsed styles.
     * With `inherit`, the built-in defaults are loaded first and `styles`
     * override or extend them.
     */
    explicit Theme(const std::map<std::string, Style>& styles = {}, bool inherit = true);

    /**
     * Build a theme from style definition strings.
     * @throws ThemeError (InvalidStyle) naming the offending entry
     */
    static Theme from_style_definitions(const std::map<std::string, std::string>& definitions,
                                        bool inherit = true);

    /**
     * Build a theme from JSON. Accepts {"styles": {...}} or a flat object of
     * name to definition strings.
     * @throws ThemeError on wrong shape or bad definitions
     */
    static Theme from_json(const nlohmann::json& j, bool inherit = true);

    // Load a JSON theme file. @throws ThemeError
    static Theme read(const std::string& path, bool inherit = true);

    // Exact-match lookup.
    std::optional<Style> get(const std::string& name) const;

    const std::map<std::string, Style>& styles() const { return styles_; }
    size_t size() const { return styles_.size(); }

    // {"styles": {name: definition}} with canonical definitions.
    nlohmann::json to_json() const;

private:
    std::map<std::string, Style> styles_;
};

/**
 * Stack of themes; lookups consult the top entry only.
 */
class ThemeStack {
public:
    explicit ThemeStack(const Theme& base);

    std::optional<Style> get(const std::string& name) const;

    // With `inherit`, the pushed theme extends the current top.
    void push_theme(const Theme& theme, bool inherit = true);

    // @throws ThemeError (StackUnderflow) when only the base theme remains
    void pop_theme();

    size_t size() const { return entries_.size(); }

private:
    std::vector<std::map<std::string, Style>> entries_;
};

} // namespace rich

#include "theme.hpp"
#include "verbose.hpp"

#include <filesystem>
#include <fstream>

namespace rich {

using json = nlohmann::json;

ThemeError::ThemeError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

const std::map<std::string, std::string>& default_style_definitions() {
    static const std::map<std::string, std::string> definitions = {
        // General purpose
        {"none", "none"},
        {"reset", "default on default"},
        {"dim", "dim"},
        {"bright", "not dim"},
        {"bold", "bold"},
        {"strong", "bold"},
        {"code", "reverse bold"},
        {"italic", "italic"},
        {"emphasize", "italic"},
        {"underline", "underline"},
        {"blink", "blink"},
        {"reverse", "reverse"},
        {"strike", "strike"},
        {"black", "black"},
        {"red", "red"},
        {"green", "green"},
        {"yellow", "yellow"},
        {"magenta", "magenta"},
        {"cyan", "cyan"},
        {"white", "white"},
        {"info", "cyan"},
        {"warning", "yellow"},
        {"error", "bold red"},
        {"success", "green"},

        // Inspection and repr
        {"repr.ellipsis", "yellow"},
        {"repr.indent", "dim green"},
        {"repr.error", "bold red"},
        {"repr.str", "green"},
        {"repr.brace", "bold"},
        {"repr.comma", "bold"},
        {"repr.ipv4", "bold bright_green"},
        {"repr.ipv6", "bold bright_green"},
        {"repr.eui48", "bold bright_green"},
        {"repr.tag_start", "bold"},
        {"repr.tag_name", "bold bright_magenta"},
        {"repr.tag_contents", "default"},
        {"repr.tag_end", "bold"},
        {"repr.attrib_name", "yellow"},
        {"repr.attrib_equal", "bold"},
        {"repr.attrib_value", "magenta"},
        {"repr.number", "bold cyan"},
        {"repr.bool_true", "italic bright_green"},
        {"repr.bool_false", "italic bright_red"},
        {"repr.none", "italic magenta"},
        {"repr.url", "underline bright_blue"},
        {"repr.uuid", "bright_yellow"},
        {"repr.call", "bold magenta"},
        {"repr.path", "magenta"},
        {"repr.filename", "bright_magenta"},

        // Rules and boxes
        {"rule.line", "bright_green"},
        {"rule.text", "none"},

        // Logging
        {"log.level", "none"},
        {"log.time", "cyan dim"},
        {"log.message", "none"},
        {"log.path", "dim"},
        {"logging.keyword", "bold yellow"},
        {"logging.level.notset", "dim"},
        {"logging.level.debug", "green"},
        {"logging.level.info", "blue"},
        {"logging.level.warning", "red"},
        {"logging.level.error", "bold red"},
        {"logging.level.critical", "bold reverse red"},

        // JSON
        {"json.brace", "bold"},
        {"json.bool_true", "italic bright_green"},
        {"json.bool_false", "italic bright_red"},
        {"json.null", "italic magenta"},
        {"json.number", "bold cyan"},
        {"json.str", "green"},
        {"json.key", "bold blue"},

        // Tables
        {"table.header", "bold"},
        {"table.footer", "bold"},
        {"table.cell", "none"},
        {"table.title", "italic"},
        {"table.caption", "dim italic"},

        // Progress
        {"progress.description", "none"},
        {"progress.filesize", "green"},
        {"progress.filesize.total", "green"},
        {"progress.download", "green"},
        {"progress.elapsed", "yellow"},
        {"progress.percentage", "magenta"},
        {"progress.remaining", "cyan"},
        {"progress.data.speed", "red"},
        {"progress.spinner", "green"},
        {"bar.back", "grey23"},
        {"bar.complete", "rgb(249,38,114)"},
        {"bar.finished", "rgb(114,156,31)"},
        {"bar.pulse", "rgb(249,38,114)"},

        // Markdown
        {"markdown.paragraph", "none"},
        {"markdown.text", "none"},
        {"markdown.em", "italic"},
        {"markdown.strong", "bold"},
        {"markdown.code", "bold cyan on black"},
        {"markdown.code_block", "cyan on black"},
        {"markdown.block_quote", "magenta"},
        {"markdown.list", "cyan"},
        {"markdown.item.bullet", "bold yellow"},
        {"markdown.item.number", "bold yellow"},
        {"markdown.hr", "yellow"},
        {"markdown.h1", "bold"},
        {"markdown.h2", "bold underline"},
        {"markdown.h3", "bold"},
        {"markdown.h4", "bold dim"},
        {"markdown.h5", "underline"},
        {"markdown.h6", "italic"},
        {"markdown.link", "bright_blue"},
        {"markdown.link_url", "blue underline"},

        // Tracebacks and prompts
        {"traceback.border", "red"},
        {"traceback.title", "bold red"},
        {"traceback.error", "bold red"},
        {"traceback.exc_type", "bold bright_red"},
        {"traceback.exc_value", "default"},
        {"prompt", "none"},
        {"prompt.choices", "bold magenta"},
        {"prompt.default", "bold cyan"},
        {"prompt.invalid", "red"},
    };
    return definitions;
}

namespace {
    std::map<std::string, Style> parse_definitions(const std::map<std::string, std::string>& definitions) {
        std::map<std::string, Style> styles;
        for (const auto& [name, definition] : definitions) {
            try {
                styles[name] = Style::parse(definition);
            } catch (const StyleParseError& e) {
                throw ThemeError(ThemeError::Kind::InvalidStyle,
                                 "Invalid style definition for theme key '" + name + "': " + e.what());
            }
        }
        return styles;
    }

    const std::map<std::string, Style>& default_styles() {
        static const std::map<std::string, Style> styles = parse_definitions(default_style_definitions());
        return styles;
    }
}

Theme::Theme(const std::map<std::string, Style>& styles, bool inherit) {
    if (inherit) {
        styles_ = default_styles();
    }
    for (const auto& [name, style] : styles) {
        styles_[name] = style;
    }
}

Theme Theme::from_style_definitions(const std::map<std::string, std::string>& definitions,
                                    bool inherit) {
    return Theme(parse_definitions(definitions), inherit);
}

Theme Theme::from_json(const json& j, bool inherit) {
    if (!j.is_object()) {
        throw ThemeError(ThemeError::Kind::InvalidJson, "Theme must be a JSON object");
    }

    const json& styles = j.contains("styles") ? j["styles"] : j;
    if (!styles.is_object()) {
        throw ThemeError(ThemeError::Kind::InvalidJson, "Theme 'styles' must be an object");
    }

    std::map<std::string, std::string> definitions;
    for (const auto& [name, value] : styles.items()) {
        if (!value.is_string()) {
            throw ThemeError(ThemeError::Kind::InvalidJson,
                             "Style definition for '" + name + "' must be a string");
        }
        definitions[name] = value.get<std::string>();
    }

    return from_style_definitions(definitions, inherit);
}

Theme Theme::read(const std::string& path, bool inherit) {
    if (!std::filesystem::exists(path)) {
        throw ThemeError(ThemeError::Kind::Io, "Theme file not found: " + path);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ThemeError(ThemeError::Kind::Io, "Failed to open theme file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw ThemeError(ThemeError::Kind::InvalidJson,
                         "Failed to parse theme file " + path + ": " + e.what());
    }

    Theme theme = from_json(j, inherit);
    verbose_log("THEME", "Loaded " + std::to_string(theme.size()) + " styles from " + path);
    return theme;
}

std::optional<Style> Theme::get(const std::string& name) const {
    auto it = styles_.find(name);
    if (it == styles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

json Theme::to_json() const {
    json styles = json::object();
    for (const auto& [name, style] : styles_) {
        styles[name] = style.to_string();
    }
    return json{{"styles", styles}};
}

// ========== ThemeStack ==========

ThemeStack::ThemeStack(const Theme& base) {
    entries_.push_back(base.styles());
}

std::optional<Style> ThemeStack::get(const std::string& name) const {
    const auto& top = entries_.back();
    auto it = top.find(name);
    if (it == top.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ThemeStack::push_theme(const Theme& theme, bool inherit) {
    std::map<std::string, Style> styles;
    if (inherit) {
        styles = entries_.back();
    }
    for (const auto& [name, style] : theme.styles()) {
        styles[name] = style;
    }
    entries_.push_back(std::move(styles));
}

void ThemeStack::pop_theme() {
    if (entries_.size() == 1) {
        throw ThemeError(ThemeError::Kind::StackUnderflow, "Unable to pop base theme");
    }
    entries_.pop_back();
}

} // namespace rich

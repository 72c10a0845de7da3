#include "config.hpp"
#include "console.hpp"
#include "markup.hpp"
#include "parse_cache.hpp"
#include "settings.hpp"
#include "terminal.hpp"
#include "verbose.hpp"

#include <CLI/CLI.hpp>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

using namespace rich;

// ========== Input ==========

// Reads all of stdin; a single trailing newline is dropped.
std::string read_stdin() {
    std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    if (!input.empty() && input.back() == '\n') {
        input.pop_back();
    }
    return input;
}

// ========== Settings Management ==========

// Applies command line overrides on top of the settings file.
Settings merge_settings(Settings settings,
                        const std::string& color_system,
                        size_t width,
                        const std::string& justify,
                        const std::string& overflow,
                        const std::string& theme_file,
                        bool no_cache) {
    if (!color_system.empty()) settings.color_system = color_system;
    if (width > 0) settings.width = width;
    if (!justify.empty()) settings.justify = justify;
    if (!overflow.empty()) settings.overflow = overflow;
    if (!theme_file.empty()) settings.theme_file = theme_file;
    if (no_cache) settings.cache_enabled = false;
    return settings;
}

int main(int argc, char* argv[]) {
    CLI::App app{"Render console markup as styled terminal output"};
    app.footer("\nExamples:\n"
               "  crich '[bold red]Error:[/] disk full'       Render markup\n"
               "  crich -w 40 --justify full < notes.txt     Wrap stdin to 40 cells\n"
               "  crich --color-system 256 '[#ff8800]orange'  Downgrade to 256 colors\n"
               "  crich --theme dark.json '[warning]careful'  Use a theme file\n");

    std::vector<std::string> inputs;
    app.add_option("markup", inputs, "Markup strings to render (reads stdin when none are given)");

    std::string color_system;
    app.add_option("--color-system", color_system, "Color capability of the output")
        ->check(CLI::IsMember({"none", "standard", "256", "truecolor", "auto"}));

    size_t width = 0;
    app.add_option("-w,--width", width, "Output width in cells (default: terminal width)")
        ->check(CLI::Range(1, 10000));

    std::string justify;
    app.add_option("--justify", justify, "Line justification")
        ->check(CLI::IsMember({"left", "center", "right", "full"}));

    std::string overflow;
    app.add_option("--overflow", overflow, "Handling of words wider than the output")
        ->check(CLI::IsMember({"fold", "crop", "ellipsis"}));

    std::string theme_file;
    app.add_option("--theme", theme_file, "JSON theme file with named styles");

    std::string settings_file = SETTINGS_FILE;
    app.add_option("--settings", settings_file, "Settings file (default: .crich.json)");

    bool strict = false;
    app.add_flag("--strict", strict, "Fail on malformed markup instead of printing it literally");

    bool no_cache = false;
    app.add_flag("--no-cache", no_cache, "Disable the color and style parse caches");

    bool dump_theme = false;
    app.add_flag("--dump-theme", dump_theme, "Print the active theme as JSON and exit");

    bool save = false;
    app.add_flag("--save", save, "Save the effective options to the settings file");

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Log cache, theme and settings activity to stderr");

    CLI11_PARSE(app, argc, argv);

    set_verbose(verbose);

    Console console;

    Settings settings;
    try {
        settings = load_settings(settings_file).value_or(Settings());
    } catch (const SettingsError& e) {
        console.print_error(std::string("Error: ") + e.what());
        return 1;
    }
    settings = merge_settings(settings, color_system, width, justify, overflow, theme_file, no_cache);

    set_parse_cache_enabled(settings.cache_enabled);
    verbose_log("MAIN", std::string("Parse caches ") + (settings.cache_enabled ? "enabled" : "disabled"));

    try {
        console.set_color_system(resolve_color_system(settings.color_system));
    } catch (const SettingsError& e) {
        console.print_error(std::string("Error: ") + e.what());
        return 1;
    }
    if (settings.width > 0) {
        console.set_width(settings.width);
    }
    console.set_strict(strict);

    try {
        console.set_theme(build_theme(settings));
    } catch (const ThemeError& e) {
        console.print_error(std::string("Error: ") + e.what());
        return 1;
    }

    verbose_log("MAIN", "Width " + std::to_string(console.width()) + ", color system " +
                (console.color_system() ? color_system_name(*console.color_system()) : "none"));

    if (save) {
        save_settings(settings, settings_file);
        console.print_success("Saved settings to " + settings_file);
    }

    if (dump_theme) {
        std::cout << console.theme().to_json().dump(2) << std::endl;
        return 0;
    }

    if (inputs.empty()) {
        if (save) {
            return 0;
        }
        inputs.push_back(read_stdin());
    }

    std::optional<JustifyMethod> justify_method = parse_justify(settings.justify);
    std::optional<OverflowMethod> overflow_method = parse_overflow(settings.overflow);

    for (const auto& input : inputs) {
        Text text;
        try {
            text = strict ? markup::render(input, &console.theme())
                          : markup::render_or_plain(input, &console.theme());
        } catch (const MarkupError& e) {
            console.print_error(std::string("Error: ") + e.what());
            return 1;
        }

        if (justify_method) text.justify = *justify_method;
        if (overflow_method) text.overflow = *overflow_method;
        if (is_verbose()) {
            verbose_log("MAIN", "Output: " + visible_escapes(console.render_segments(console.render_text(text))));
        }
        console.print_text(text);
    }
    console.flush();

    verbose_log("CACHE", "colors=" + std::to_string(color_cache_size()) +
                " styles=" + std::to_string(style_cache_size()));

    return 0;
}

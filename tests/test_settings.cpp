#include <catch2/catch.hpp>
#include "settings.hpp"
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using namespace rich;

// Helper to write a file for the duration of a test
class TempFile {
public:
    TempFile(const std::string& path, const std::string& content) : path_(path) {
        std::ofstream file(path_);
        file << content;
    }
    ~TempFile() { std::remove(path_.c_str()); }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

TEST_CASE("Missing settings file gives no settings", "[settings]") {
    REQUIRE_FALSE(load_settings("no_such_settings_file.json").has_value());
}

TEST_CASE("Load settings fields", "[settings]") {
    TempFile file("test_settings_load.json", R"({
        "color_system": "256",
        "width": 60,
        "justify": "center",
        "cache_enabled": false,
        "styles": {"warning": "bold red"}
    })");

    auto settings = load_settings(file.path());
    REQUIRE(settings.has_value());
    REQUIRE(settings->color_system == "256");
    REQUIRE(settings->width == 60);
    REQUIRE(settings->justify == "center");
    REQUIRE(settings->overflow.empty());
    REQUIRE_FALSE(settings->cache_enabled);
    REQUIRE(settings->styles.at("warning") == "bold red");
}

TEST_CASE("Malformed settings raise SettingsError", "[settings][errors]") {
    TempFile broken("test_settings_broken.json", "{ nope");
    try {
        load_settings(broken.path());
        FAIL("expected SettingsError");
    } catch (const SettingsError& e) {
        REQUIRE(e.kind() == SettingsError::Kind::InvalidJson);
    }

    TempFile wrong_type("test_settings_type.json", R"({"width": "wide"})");
    try {
        load_settings(wrong_type.path());
        FAIL("expected SettingsError");
    } catch (const SettingsError& e) {
        REQUIRE(e.kind() == SettingsError::Kind::InvalidValue);
    }
}

TEST_CASE("Unknown justify, overflow or color system is rejected", "[settings][errors]") {
    std::vector<std::string> bodies = {
        R"({"justify": "middle"})",
        R"({"overflow": "wrap"})",
        R"({"color_system": "sepia"})",
    };
    for (const auto& body : bodies) {
        TempFile file("test_settings_values.json", body);
        try {
            load_settings(file.path());
            FAIL("expected SettingsError for " << body);
        } catch (const SettingsError& e) {
            REQUIRE(e.kind() == SettingsError::Kind::InvalidValue);
        }
    }

    TempFile valid("test_settings_valid.json", R"({"justify": "full", "overflow": "crop"})");
    auto settings = load_settings(valid.path());
    REQUIRE(settings.has_value());
    REQUIRE(settings->overflow == "crop");
}

TEST_CASE("Save and reload settings", "[settings]") {
    std::string path = "test_settings_save.json";
    Settings settings;
    settings.color_system = "truecolor";
    settings.width = 72;
    settings.overflow = "ellipsis";
    settings.styles["note"] = "italic";
    save_settings(settings, path);

    auto loaded = load_settings(path);
    std::remove(path.c_str());

    REQUIRE(loaded.has_value());
    REQUIRE(loaded->color_system == "truecolor");
    REQUIRE(loaded->width == 72);
    REQUIRE(loaded->overflow == "ellipsis");
    REQUIRE(loaded->styles.at("note") == "italic");
    REQUIRE(loaded->cache_enabled);
}

TEST_CASE("Resolve color system names", "[settings]") {
    REQUIRE(resolve_color_system("truecolor") == ColorSystem::TrueColor);
    REQUIRE(resolve_color_system("256") == ColorSystem::EightBit);
    REQUIRE_FALSE(resolve_color_system("none").has_value());
    REQUIRE_THROWS_AS(resolve_color_system("sepia"), SettingsError);
}

TEST_CASE("Inline styles override the theme", "[settings][theme]") {
    Settings settings;
    settings.styles["warning"] = "bold red";
    Theme theme = build_theme(settings);
    REQUIRE(theme.get("warning") == Style::parse("bold red"));
    REQUIRE(theme.get("rule.line").has_value());
}

TEST_CASE("Theme file is layered under inline styles", "[settings][theme]") {
    TempFile theme_file("test_settings_theme.json",
                        R"({"styles": {"headline": "bold", "warning": "magenta"}})");
    Settings settings;
    settings.theme_file = theme_file.path();
    settings.styles["headline"] = "italic";

    Theme theme = build_theme(settings);
    REQUIRE(theme.get("headline") == Style::parse("italic"));
    REQUIRE(theme.get("warning") == Style::parse("magenta"));
    REQUIRE(theme.get("error").has_value());
}

TEST_CASE("Invalid inline style raises ThemeError", "[settings][theme][errors]") {
    Settings settings;
    settings.styles["broken"] = "on nothing";
    REQUIRE_THROWS_AS(build_theme(settings), ThemeError);
}

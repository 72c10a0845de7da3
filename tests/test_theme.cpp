#include <catch2/catch.hpp>
#include "theme.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <string>

using namespace rich;
using json = nlohmann::json;

TEST_CASE("Default theme has built-in styles", "[theme]") {
    Theme theme;
    REQUIRE(theme.get("rule.line").has_value());
    REQUIRE(theme.get("rule.line")->to_string() == "bright_green");
    REQUIRE(theme.get("error")->to_string() == "bold red");
    REQUIRE_FALSE(theme.get("no.such.style").has_value());
}

TEST_CASE("Every built-in definition parses", "[theme]") {
    Theme theme;
    REQUIRE(theme.size() == default_style_definitions().size());
}

TEST_CASE("Inheriting theme overrides defaults", "[theme]") {
    Theme theme = Theme::from_style_definitions({{"rule.line", "bold red"}}, true);
    REQUIRE(theme.get("rule.line")->to_string() == "bold red");
    REQUIRE(theme.get("warning").has_value());
}

TEST_CASE("Non-inheriting theme holds only its own styles", "[theme]") {
    Theme theme = Theme::from_style_definitions({{"warning", "bold red"}}, false);
    REQUIRE(theme.size() == 1);
    REQUIRE_FALSE(theme.get("rule.line").has_value());
}

TEST_CASE("Invalid definitions raise ThemeError", "[theme][errors]") {
    try {
        Theme::from_style_definitions({{"broken", "bold wibble"}}, false);
        FAIL("expected ThemeError");
    } catch (const ThemeError& e) {
        REQUIRE(e.kind() == ThemeError::Kind::InvalidStyle);
        REQUIRE(std::string(e.what()).find("broken") != std::string::npos);
    }
}

TEST_CASE("Theme from JSON with a styles object", "[theme][json]") {
    json j = {{"styles", {{"warning", "bold red"}, {"note", "italic"}}}};
    Theme theme = Theme::from_json(j, false);
    REQUIRE(theme.size() == 2);
    REQUIRE(theme.get("note")->has(ITALIC));
}

TEST_CASE("Theme from a flat JSON object", "[theme][json]") {
    json j = {{"warning", "bold red"}};
    Theme theme = Theme::from_json(j, false);
    REQUIRE(theme.get("warning")->to_string() == "bold red");
}

TEST_CASE("Theme JSON with the wrong shape", "[theme][json][errors]") {
    REQUIRE_THROWS_AS(Theme::from_json(json::array(), false), ThemeError);
    REQUIRE_THROWS_AS(Theme::from_json(json{{"styles", {{"x", 1}}}}, false), ThemeError);
}

TEST_CASE("to_json round-trips through from_json", "[theme][json]") {
    Theme theme = Theme::from_style_definitions({{"warning", "bold red on white"}}, false);
    json j = theme.to_json();
    REQUIRE(j["styles"]["warning"] == "bold red on white");
    REQUIRE(Theme::from_json(j, false).get("warning") == theme.get("warning"));
}

TEST_CASE("Read a theme file", "[theme][file]") {
    std::string path = "test_theme_read.json";
    {
        std::ofstream file(path);
        file << R"({"styles": {"headline": "bold underline magenta"}})";
    }
    Theme theme = Theme::read(path, false);
    std::remove(path.c_str());

    REQUIRE(theme.get("headline")->has(UNDERLINE));
}

TEST_CASE("Reading a missing or malformed theme file fails", "[theme][file][errors]") {
    try {
        Theme::read("definitely_missing_theme.json");
        FAIL("expected ThemeError");
    } catch (const ThemeError& e) {
        REQUIRE(e.kind() == ThemeError::Kind::Io);
    }

    std::string path = "test_theme_bad.json";
    {
        std::ofstream file(path);
        file << "{ not json";
    }
    try {
        Theme::read(path);
        std::remove(path.c_str());
        FAIL("expected ThemeError");
    } catch (const ThemeError& e) {
        std::remove(path.c_str());
        REQUIRE(e.kind() == ThemeError::Kind::InvalidJson);
    }
}

// ============================================================================
// Theme stack
// ============================================================================

TEST_CASE("ThemeStack push and pop", "[theme][stack]") {
    ThemeStack stack(Theme{});
    REQUIRE(stack.get("warning")->to_string() == "yellow");

    stack.push_theme(Theme::from_style_definitions({{"warning", "bold red"}}, false));
    REQUIRE(stack.get("warning")->to_string() == "bold red");
    REQUIRE(stack.get("rule.line").has_value());

    stack.pop_theme();
    REQUIRE(stack.get("warning")->to_string() == "yellow");
}

TEST_CASE("ThemeStack push without inheritance", "[theme][stack]") {
    ThemeStack stack(Theme{});
    stack.push_theme(Theme::from_style_definitions({{"only", "bold"}}, false), false);
    REQUIRE_FALSE(stack.get("rule.line").has_value());
    REQUIRE(stack.size() == 2);
}

TEST_CASE("Popping the base theme fails", "[theme][stack][errors]") {
    ThemeStack stack(Theme{});
    try {
        stack.pop_theme();
        FAIL("expected ThemeError");
    } catch (const ThemeError& e) {
        REQUIRE(e.kind() == ThemeError::Kind::StackUnderflow);
        REQUIRE(std::string(e.what()) == "Unable to pop base theme");
    }
}

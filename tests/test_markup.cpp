#include <catch2/catch.hpp>
#include "markup.hpp"
#include <string>
#include <vector>

using namespace rich;

// Helper to render and capture a MarkupError
std::optional<MarkupError> markup_error(const std::string& input) {
    try {
        markup::render(input);
    } catch (const MarkupError& e) {
        return e;
    }
    return std::nullopt;
}

// Style of the single rendered segment covering `needle`
Style style_at(const Text& text, const std::string& needle) {
    for (const auto& seg : text.render()) {
        if (seg.text == needle) {
            return seg.style.value_or(Style::null());
        }
    }
    FAIL("no segment '" << needle << "'");
    return Style::null();
}

// ============================================================================
// Basic rendering
// ============================================================================

TEST_CASE("Plain markup passes through", "[markup]") {
    Text text = markup::render("hello world");
    REQUIRE(text.plain() == "hello world");
    REQUIRE(text.spans().empty());
}

TEST_CASE("Implicit close", "[markup]") {
    Text text = markup::render("[bold]hello[/]");
    REQUIRE(text.plain() == "hello");
    REQUIRE(text.spans().size() == 1);
    REQUIRE(text.spans()[0].start == 0);
    REQUIRE(text.spans()[0].end == 5);
    REQUIRE(text.spans()[0].style.has(BOLD));
}

TEST_CASE("Explicit close", "[markup]") {
    Text text = markup::render("[bold]hello[/bold]");
    REQUIRE(text.plain() == "hello");
    REQUIRE(text.spans().size() == 1);
}

TEST_CASE("Nested tags combine", "[markup]") {
    Text text = markup::render("[bold][red]x[/red][/bold]");
    REQUIRE(text.plain() == "x");
    REQUIRE(text.spans().size() == 2);

    Style style = style_at(text, "x");
    REQUIRE(style.has(BOLD));
    REQUIRE(style.color() == Color::parse("red"));
}

TEST_CASE("Multiple styles in one tag", "[markup]") {
    Text text = markup::render("[bold red]hello[/]");
    REQUIRE(text.spans().size() == 1);
    REQUIRE(text.spans()[0].style == Style::parse("bold red"));
}

TEST_CASE("Closing by first word", "[markup]") {
    Text text = markup::render("[bold red]a[/bold]b");
    REQUIRE(text.plain() == "ab");
    REQUIRE(text.spans().size() == 1);
    REQUIRE(text.spans()[0].end == 1);
}

TEST_CASE("Closing tags are case-insensitive", "[markup]") {
    REQUIRE(markup::render("[bold]a[/BOLD]").spans().size() == 1);
}

TEST_CASE("Explicit close can skip inner tags", "[markup]") {
    Text text = markup::render("[bold]a[italic]b[/bold]c");
    REQUIRE(text.plain() == "abc");
    REQUIRE(text.spans().size() == 2);
    REQUIRE(style_at(text, "c").has(ITALIC));
    REQUIRE_FALSE(style_at(text, "c").has(BOLD));
}

TEST_CASE("Mixed text and tags", "[markup]") {
    Text text = markup::render("hello [bold]world[/]!");
    REQUIRE(text.plain() == "hello world!");
    REQUIRE(text.spans().size() == 1);
    REQUIRE(text.spans()[0].start == 6);
    REQUIRE(text.spans()[0].end == 11);
}

TEST_CASE("Unterminated tags are auto-closed", "[markup]") {
    Text text = markup::render("[bold]unterminated");
    REQUIRE(text.plain() == "unterminated");
    REQUIRE(text.spans().size() == 1);
    REQUIRE(text.spans()[0].start == 0);
    REQUIRE(text.spans()[0].end == 12);
}

TEST_CASE("Auto-close is innermost first", "[markup]") {
    Text text = markup::render("[red]a[bold]b");
    REQUIRE(text.spans().size() == 2);
    REQUIRE(text.spans()[0].style.has(BOLD));
    REQUIRE(text.spans()[1].style.color() == Color::parse("red"));
}

TEST_CASE("Tags around empty content add no span", "[markup]") {
    REQUIRE(markup::render("[bold][/bold]x").spans().empty());
}

TEST_CASE("Unknown style names give an empty style", "[markup]") {
    Text text = markup::render("[wibble]x[/wibble]");
    REQUIRE(text.plain() == "x");
    REQUIRE(text.spans().size() == 1);
    REQUIRE(text.spans()[0].style == Style());
}

TEST_CASE("Color tags", "[markup]") {
    Text text = markup::render("[#ff8800 on blue]x");
    REQUIRE(text.spans()[0].style.color() == Color::from_rgb(255, 136, 0));
    REQUIRE(text.spans()[0].style.bgcolor() == Color::parse("blue"));
}

// ============================================================================
// Escaping
// ============================================================================

TEST_CASE("Escaped bracket is literal", "[markup][escape]") {
    Text text = markup::render("\\[escaped]");
    REQUIRE(text.plain() == "[escaped]");
    REQUIRE(text.spans().empty());
}

TEST_CASE("Backslash pairs collapse before a tag", "[markup][escape]") {
    Text text = markup::render("\\\\[bold]x");
    REQUIRE(text.plain() == "\\x");
    REQUIRE(text.spans().size() == 1);

    Text escaped = markup::render("\\\\\\[bold]x");
    REQUIRE(escaped.plain() == "\\[bold]x");
    REQUIRE(escaped.spans().empty());
}

TEST_CASE("Brackets that cannot start a tag are literal", "[markup][escape]") {
    Text text = markup::render("array[0] and [1, 2]");
    REQUIRE(text.plain() == "array[0] and [1, 2]");
    REQUIRE(text.spans().empty());
}

TEST_CASE("escape makes text render literally", "[markup][escape]") {
    REQUIRE(markup::escape("hello [world]") == "hello \\[world]");
    REQUIRE(markup::escape("a[0]") == "a\\[0]");
    REQUIRE(markup::escape("no brackets") == "no brackets");

    std::vector<std::string> inputs = {
        "path\\[bold] and [red]x[/red]",
        "path\\[1]",
        "a\\\\[0] [b[c]",
        "[\\[b]",
        "trailing \\",
    };
    for (const auto& input : inputs) {
        Text text = markup::render(markup::escape(input));
        REQUIRE(text.plain() == input);
        REQUIRE(text.spans().empty());
    }
}

TEST_CASE("Backslash before a non-tag bracket is consumed", "[markup][escape]") {
    REQUIRE(markup::render("a\\[0]").plain() == "a[0]");
}

TEST_CASE("Long unclosed tags render as plain text", "[markup][escape]") {
    std::string input = "[info" + std::string(200000, 'x');
    Text text = markup::render_or_plain(input);
    REQUIRE(text.plain() == input);
    REQUIRE(text.spans().empty());

    std::string nested = "[b" + std::string(100000, 'x') + "[bold]y[/bold]";
    Text inner = markup::render(nested);
    REQUIRE(inner.plain() == "[b" + std::string(100000, 'x') + "y");
    REQUIRE(inner.spans().size() == 1);
    REQUIRE(markup::render(markup::escape(input)).plain() == input);
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("Implicit close with nothing open", "[markup][errors]") {
    auto error = markup_error("hello[/]");
    REQUIRE(error.has_value());
    REQUIRE(error->kind() == MarkupError::Kind::UnmatchedClosingTag);
    REQUIRE_FALSE(error->tag().has_value());
    REQUIRE(std::string(error->what()) == "closing tag '[/]' has nothing to close");
}

TEST_CASE("Explicit close with no matching tag", "[markup][errors]") {
    auto error = markup_error("[/bold]");
    REQUIRE(error.has_value());
    REQUIRE(error->kind() == MarkupError::Kind::UnmatchedClosingTag);
    REQUIRE(error->tag() == std::string("bold"));
    REQUIRE(std::string(error->what()) == "closing tag '[/bold]' doesn't match any open tag");
}

TEST_CASE("render_or_plain falls back to the literal markup", "[markup][errors]") {
    Text text = markup::render_or_plain("oops[/]");
    REQUIRE(text.plain() == "oops[/]");
    REQUIRE(text.spans().empty());
}

// ============================================================================
// Links, handlers and themes
// ============================================================================

TEST_CASE("Link tag sets the hyperlink", "[markup][link]") {
    Text text = markup::render("[link=https://example.com]site[/link]");
    REQUIRE(text.plain() == "site");
    REQUIRE(text.spans().size() == 1);
    REQUIRE(text.spans()[0].style.link() == std::string("https://example.com"));
}

TEST_CASE("Link tag without a URL is invalid", "[markup][link][errors]") {
    auto error = markup_error("[link]x[/link]");
    REQUIRE(error.has_value());
    REQUIRE(error->kind() == MarkupError::Kind::InvalidTag);
}

TEST_CASE("Tag parameters", "[markup][tags]") {
    markup::Tag tag = markup::parse_tag("link = https://x.io ");
    REQUIRE(tag.name == "link");
    REQUIRE(tag.parameters == std::string("https://x.io"));

    markup::Tag handler = markup::parse_tag("@click(1, 2)");
    REQUIRE(handler.name == "@click");
    REQUIRE(handler.parameters == std::string("1, 2"));

    REQUIRE(markup::parse_tag("/bold").is_closing());
    REQUIRE(markup::parse_tag("/bold").base_name() == "bold");
}

TEST_CASE("Handler tags produce spans without styling", "[markup][tags]") {
    Text text = markup::render("[@click(open)]button[/@click]");
    REQUIRE(text.plain() == "button");
    REQUIRE(text.spans().size() == 1);
    REQUIRE(text.spans()[0].style == Style());
}

TEST_CASE("Handler tags with unbalanced parentheses are invalid", "[markup][tags][errors]") {
    auto error = markup_error("[@click(open]x");
    REQUIRE(error.has_value());
    REQUIRE(error->kind() == MarkupError::Kind::InvalidTag);
}

TEST_CASE("Theme names resolve before the style grammar", "[markup][theme]") {
    Theme theme = Theme::from_style_definitions({{"warning", "bold yellow"}}, false);
    Text text = markup::render("[warning]careful[/warning]", &theme);
    REQUIRE(text.spans()[0].style == Style::parse("bold yellow"));

    Text without = markup::render("[warning]careful[/warning]");
    REQUIRE(without.spans()[0].style == Style());
}

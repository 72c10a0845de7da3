#include <catch2/catch.hpp>
#include "text.hpp"
#include "cells.hpp"
#include <string>
#include <vector>

using namespace rich;

// Helper to collect the plain strings of wrapped lines
std::vector<std::string> plains(const std::vector<Text>& lines) {
    std::vector<std::string> result;
    for (const auto& line : lines) {
        result.push_back(line.plain());
    }
    return result;
}

// Helper to wrap with justify and overflow settings
std::vector<std::string> wrap(const std::string& content, size_t width,
                              JustifyMethod justify = JustifyMethod::Default,
                              OverflowMethod overflow = OverflowMethod::Fold) {
    Text text(content);
    text.justify = justify;
    text.overflow = overflow;
    return plains(text.wrap(width));
}

// ============================================================================
// Building
// ============================================================================

TEST_CASE("Append and append_styled", "[text]") {
    Text text("hello");
    text.append(" ");
    text.append_styled("world", Style().bold());
    REQUIRE(text.plain() == "hello world");
    REQUIRE(text.spans().size() == 1);
    REQUIRE(text.spans()[0].start == 6);
    REQUIRE(text.spans()[0].end == 11);
}

TEST_CASE("append_text shifts spans", "[text]") {
    Text a("ab");
    Text b = Text::styled("cd", Style().italic());
    a.append_text(b);
    REQUIRE(a.plain() == "abcd");
    REQUIRE(a.spans().size() == 1);
    REQUIRE(a.spans()[0].start == 2);
    REQUIRE(a.spans()[0].end == 4);
}

TEST_CASE("assemble pieces", "[text]") {
    Text text = Text::assemble({{"a", Style().bold()}, {"b", std::nullopt}, {"c", Style().italic()}});
    REQUIRE(text.plain() == "abc");
    REQUIRE(text.spans().size() == 2);
}

TEST_CASE("Span bounds are normalized", "[text][span]") {
    Span span(5, 2, Style());
    REQUIRE(span.start == 2);
    REQUIRE(span.end == 5);
    REQUIRE(span.length() == 3);
    REQUIRE(span.move_right(10, 12).end == 12);
    REQUIRE(span.adjust(3).start == 0);
}

TEST_CASE("stylize widens to character boundaries", "[text][stylize]") {
    Text text("a日b");
    text.stylize(2, 3, Style().bold());  // Inside the three-byte character
    REQUIRE(text.spans().size() == 1);
    REQUIRE(text.spans()[0].start == 1);
    REQUIRE(text.spans()[0].end == 4);
}

TEST_CASE("stylize ignores empty ranges and clamps", "[text][stylize]") {
    Text text("abc");
    text.stylize(2, 2, Style().bold());
    REQUIRE(text.spans().empty());
    text.stylize(1, 100, Style().bold());
    REQUIRE(text.spans()[0].end == 3);
}

TEST_CASE("highlight_words", "[text][highlight]") {
    Text text("foo bar Foo baz foo");
    REQUIRE(text.highlight_words({"foo"}, Style().bold()) == 2);
    REQUIRE(text.highlight_words({"foo"}, Style().italic(), false) == 3);
}

TEST_CASE("highlight_regex", "[text][highlight]") {
    Text text("id=12 and id=345");
    REQUIRE(text.highlight_regex("[0-9]+", Style().bold()) == 2);
    REQUIRE(text.spans()[1].start == 13);
    REQUIRE(text.spans()[1].end == 16);
}

// ============================================================================
// Slicing
// ============================================================================

TEST_CASE("slice clips and rebases spans", "[text][slice]") {
    Text text("hello world");
    text.stylize(3, 8, Style().bold());
    Text sliced = text.slice(6, 11);
    REQUIRE(sliced.plain() == "world");
    REQUIRE(sliced.spans().size() == 1);
    REQUIRE(sliced.spans()[0].start == 0);
    REQUIRE(sliced.spans()[0].end == 2);
}

TEST_CASE("split_lines", "[text][slice]") {
    Text text("one\ntwo\n");
    auto lines = text.split_lines();
    REQUIRE(plains(lines) == std::vector<std::string>{"one", "two", ""});
}

TEST_CASE("divide at offsets", "[text][slice]") {
    Text text("abcdef");
    REQUIRE(plains(text.divide({2, 4})) == std::vector<std::string>{"ab", "cd", "ef"});
}

TEST_CASE("join with a separator", "[text][slice]") {
    Text separator(", ");
    Text joined = separator.join({Text("a"), Text::styled("b", Style().bold()), Text("c")});
    REQUIRE(joined.plain() == "a, b, c");
    REQUIRE(joined.spans().size() == 1);
    REQUIRE(joined.spans()[0].start == 3);
}

TEST_CASE("expand_tabs moves spans", "[text][tabs]") {
    Text text("a\tb");
    text.stylize(2, 3, Style().bold());
    Text expanded = text.expand_tabs(4);
    REQUIRE(expanded.plain() == "a   b");
    REQUIRE(expanded.spans()[0].start == 4);
    REQUIRE(expanded.spans()[0].end == 5);
}

TEST_CASE("strip and strip_right", "[text]") {
    REQUIRE(Text("  hi  ").strip().plain() == "hi");
    REQUIRE(Text("  hi  ").strip_right().plain() == "  hi");
}

// ============================================================================
// Truncate and pad
// ============================================================================

TEST_CASE("truncate with crop", "[text][truncate]") {
    Text text("hello world");
    text.truncate(5, OverflowMethod::Crop);
    REQUIRE(text.plain() == "hello");
}

TEST_CASE("truncate with ellipsis never exceeds width", "[text][truncate]") {
    Text text("hello world");
    text.truncate(6, OverflowMethod::Ellipsis);
    REQUIRE(text.plain() == "hello\xE2\x80\xA6");
    REQUIRE(text.cell_len() == 6);
}

TEST_CASE("truncate with padding", "[text][truncate]") {
    Text text("hi");
    text.truncate(5, OverflowMethod::Fold, true);
    REQUIRE(text.plain() == "hi   ");
}

TEST_CASE("pad justifies within a width", "[text][pad]") {
    Text left("ab");
    left.pad(5, JustifyMethod::Left);
    REQUIRE(left.plain() == "ab   ");

    Text right("ab");
    right.pad(5, JustifyMethod::Right);
    REQUIRE(right.plain() == "   ab");

    Text center("ab");
    center.pad(5, JustifyMethod::Center);
    REQUIRE(center.plain() == " ab  ");
}

TEST_CASE("pad_left moves spans", "[text][pad]") {
    Text text = Text::styled("ab", Style().bold());
    text.pad_left(2);
    REQUIRE(text.plain() == "  ab");
    REQUIRE(text.spans()[0].start == 2);
    REQUIRE(text.spans()[0].end == 4);
}

// ============================================================================
// Wrapping
// ============================================================================

TEST_CASE("Wrap at word boundaries", "[text][wrap]") {
    REQUIRE(wrap("hello world foo", 11) == std::vector<std::string>{"hello world", "foo"});
}

TEST_CASE("Break whitespace stays on the closing line unless it overflows", "[text][wrap]") {
    auto lines = wrap("The quick brown fox jumps over the lazy dog", 10);
    REQUIRE(lines == std::vector<std::string>{"The quick ", "brown fox ", "jumps over", "the lazy ", "dog"});
    for (const auto& line : lines) {
        REQUIRE(cell_len(line) <= 10);
    }
}

TEST_CASE("Wrapped lines join back to the original when nothing overflows", "[text][wrap]") {
    std::string content = "one two three four";
    std::string joined;
    for (const auto& line : wrap(content, 8)) {
        joined += line;
    }
    REQUIRE(joined == content);
}

TEST_CASE("Break whitespace past the width is trimmed", "[text][wrap]") {
    auto lines = wrap("hello   world foo", 7);
    REQUIRE(lines == std::vector<std::string>{"hello  ", "world ", "foo"});
    REQUIRE(lines[0] + lines[1] + lines[2] == "hello  world foo");
}

TEST_CASE("Long words are folded", "[text][wrap]") {
    REQUIRE(wrap("abcdefghij", 4) == std::vector<std::string>{"abcd", "efgh", "ij"});
}

TEST_CASE("Wide characters are folded by cell width", "[text][wrap]") {
    auto lines = wrap("日本語テキスト", 4);
    REQUIRE(lines == std::vector<std::string>{"日本", "語テ", "キス", "ト"});
}

TEST_CASE("Wrap respects existing newlines", "[text][wrap]") {
    REQUIRE(wrap("ab\ncd", 10) == std::vector<std::string>{"ab", "cd"});
}

TEST_CASE("Wrap with crop overflow truncates each line", "[text][wrap]") {
    REQUIRE(wrap("hello world", 5, JustifyMethod::Default, OverflowMethod::Crop) ==
            std::vector<std::string>{"hello"});
}

TEST_CASE("Wrap with ellipsis overflow", "[text][wrap]") {
    REQUIRE(wrap("hello world", 5, JustifyMethod::Default, OverflowMethod::Ellipsis) ==
            std::vector<std::string>{"hell\xE2\x80\xA6"});
}

TEST_CASE("no_wrap leaves lines whole", "[text][wrap]") {
    Text text("hello world");
    text.no_wrap = true;
    REQUIRE(plains(text.wrap(5)) == std::vector<std::string>{"hello world"});
}

TEST_CASE("Wrap keeps spans on the wrapped lines", "[text][wrap]") {
    Text text("hello world");
    text.stylize(6, 11, Style().bold());
    auto lines = text.wrap(6);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[1].plain() == "world");
    REQUIRE(lines[1].spans().size() == 1);
    REQUIRE(lines[1].spans()[0].start == 0);
    REQUIRE(lines[1].spans()[0].end == 5);
}

TEST_CASE("Wrap with center and right justify", "[text][wrap][justify]") {
    REQUIRE(wrap("ab cd", 3, JustifyMethod::Center) == std::vector<std::string>{"ab ", "cd "});
    REQUIRE(wrap("ab cd", 4, JustifyMethod::Right) == std::vector<std::string>{"  ab", "  cd"});
}

TEST_CASE("Full justify spreads words across the width", "[text][wrap][justify]") {
    auto lines = wrap("aa b cc dd eee", 9, JustifyMethod::Full);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0] == "aa  b  cc");
    REQUIRE(lines[1] == "dd eee   ");
}

TEST_CASE("Wrap to zero width yields one empty line", "[text][wrap]") {
    REQUIRE(wrap("abc", 0) == std::vector<std::string>{""});
}

// ============================================================================
// Rendering
// ============================================================================

TEST_CASE("Render unstyled text", "[text][render]") {
    auto segments = Text("hello").render();
    REQUIRE(segments.size() == 1);
    REQUIRE(segments[0].text == "hello");
}

TEST_CASE("Render splits at span boundaries", "[text][render]") {
    Text text("hello world");
    text.stylize(0, 5, Style().bold());
    auto segments = text.render("\n");
    REQUIRE(segments.size() == 3);
    REQUIRE(segments[0].text == "hello");
    REQUIRE(segments[0].style->has(BOLD));
    REQUIRE(segments[1].text == " world");
    REQUIRE_FALSE(segments[1].style->has(BOLD));
    REQUIRE(segments[2].text == "\n");
}

TEST_CASE("Overlapping spans combine in application order", "[text][render]") {
    Text text("abc");
    text.stylize(0, 3, Style::parse("red bold"));
    text.stylize(1, 2, Style::parse("blue not bold"));
    auto segments = text.render();
    REQUIRE(segments.size() == 3);
    REQUIRE(segments[0].style->color() == Color::parse("red"));
    REQUIRE(segments[1].style->color() == Color::parse("blue"));
    REQUIRE_FALSE(segments[1].style->has(BOLD));
    REQUIRE(segments[2].style->has(BOLD));
}

TEST_CASE("Base style applies under spans", "[text][render]") {
    Text text("ab", Style::parse("italic"));
    text.stylize(1, 2, Style::parse("bold"));
    auto segments = text.render();
    REQUIRE(segments[0].style->has(ITALIC));
    REQUIRE(segments[1].style->has(ITALIC));
    REQUIRE(segments[1].style->has(BOLD));
}

TEST_CASE("Justify and overflow names", "[text]") {
    REQUIRE(parse_justify("full") == JustifyMethod::Full);
    REQUIRE(parse_overflow("ellipsis") == OverflowMethod::Ellipsis);
    REQUIRE_FALSE(parse_justify("sideways").has_value());
}

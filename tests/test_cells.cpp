#include <catch2/catch.hpp>
#include "cells.hpp"
#include <string>
#include <vector>

using namespace rich;

// ============================================================================
// Character widths
// ============================================================================

TEST_CASE("ASCII characters are one cell", "[cells]") {
    REQUIRE(get_character_cell_size(U'a') == 1);
    REQUIRE(get_character_cell_size(U' ') == 1);
    REQUIRE(get_character_cell_size(U'~') == 1);
}

TEST_CASE("Control characters are zero cells", "[cells]") {
    REQUIRE(get_character_cell_size(U'\0') == 0);
    REQUIRE(get_character_cell_size(U'\x1b') == 0);
    REQUIRE(get_character_cell_size(U'\x7f') == 0);
    REQUIRE(get_character_cell_size(0x9B) == 0);
}

TEST_CASE("East Asian wide characters are two cells", "[cells]") {
    REQUIRE(get_character_cell_size(0x65E5) == 2);   // 日
    REQUIRE(get_character_cell_size(0xAC00) == 2);   // 가
    REQUIRE(get_character_cell_size(0xFF21) == 2);   // Ａ fullwidth
    REQUIRE(get_character_cell_size(0x1F600) == 2);  // 😀
}

TEST_CASE("Combining marks are zero cells", "[cells]") {
    REQUIRE(get_character_cell_size(0x0301) == 0);
    REQUIRE(cell_len("e\xCC\x81") == 1);
}

TEST_CASE("cell_len sums character widths", "[cells]") {
    REQUIRE(cell_len("") == 0);
    REQUIRE(cell_len("hello") == 5);
    REQUIRE(cell_len("日本語") == 6);
    REQUIRE(cell_len("a日b") == 4);
}

// ============================================================================
// UTF-8
// ============================================================================

TEST_CASE("Decode and encode UTF-8", "[cells][utf8]") {
    std::vector<char32_t> decoded = decode_utf8("a\xC3\xA9\xE6\x97\xA5\xF0\x9F\x98\x80");
    REQUIRE(decoded == std::vector<char32_t>{U'a', 0xE9, 0x65E5, 0x1F600});

    std::string encoded;
    for (char32_t cp : decoded) {
        encoded += encode_utf8(cp);
    }
    REQUIRE(encoded == "a\xC3\xA9\xE6\x97\xA5\xF0\x9F\x98\x80");
}

TEST_CASE("Invalid UTF-8 decodes to the replacement character", "[cells][utf8]") {
    std::string bad = "\xFF" "a";
    size_t pos = 0;
    REQUIRE(next_codepoint(bad, pos) == 0xFFFD);
    REQUIRE(pos == 1);
    REQUIRE(next_codepoint(bad, pos) == U'a');

    // Truncated three-byte sequence
    std::string truncated = "\xE6\x97";
    pos = 0;
    REQUIRE(next_codepoint(truncated, pos) == 0xFFFD);
    REQUIRE(pos == 1);

    // Overlong encoding of '/'
    std::string overlong = "\xC0\xAF";
    pos = 0;
    REQUIRE(next_codepoint(overlong, pos) == 0xFFFD);
}

// ============================================================================
// Fitting and chopping
// ============================================================================

TEST_CASE("fit_to_width pads short text", "[cells][fit]") {
    REQUIRE(fit_to_width("abc", 5) == "abc  ");
    REQUIRE(fit_to_width("", 3) == "   ");
}

TEST_CASE("fit_to_width truncates long text", "[cells][fit]") {
    REQUIRE(fit_to_width("abcdef", 3) == "abc");
    REQUIRE(fit_to_width("abc", 3) == "abc");
    REQUIRE(fit_to_width("abc", 0) == "");
}

TEST_CASE("fit_to_width never splits a wide character", "[cells][fit]") {
    std::string fitted = fit_to_width("日本語", 5);
    REQUIRE(fitted == "日本 ");
    REQUIRE(cell_len(fitted) == 5);

    REQUIRE(fit_to_width("日本語", 1) == " ");
}

TEST_CASE("fit_to_width is always exactly the requested width", "[cells][fit]") {
    std::vector<std::string> samples = {"", "a", "hello world", "日本語テキスト", "a日b本c", "😀😀x"};
    for (const auto& sample : samples) {
        for (size_t width = 0; width < 12; width++) {
            REQUIRE(cell_len(fit_to_width(sample, width)) == width);
        }
    }
}

TEST_CASE("chop_cells splits at a character boundary", "[cells][fit]") {
    auto [head, tail] = chop_cells("a日b", 2);
    REQUIRE(head == "a");
    REQUIRE(tail == "日b");

    auto [all, none] = chop_cells("abc", 10);
    REQUIRE(all == "abc");
    REQUIRE(none.empty());
}

TEST_CASE("cell_to_byte_index maps cell columns to bytes", "[cells]") {
    std::string text = "a日b";
    REQUIRE(cell_to_byte_index(text, 0) == 0);
    REQUIRE(cell_to_byte_index(text, 1) == 1);
    REQUIRE(cell_to_byte_index(text, 3) == 4);
    REQUIRE(cell_to_byte_index(text, 4) == text.size());
    REQUIRE(cell_to_byte_index(text, 5) == std::string::npos);
}

TEST_CASE("has_wide_chars", "[cells]") {
    REQUIRE_FALSE(has_wide_chars("plain ascii"));
    REQUIRE(has_wide_chars("mixed 日本"));
}

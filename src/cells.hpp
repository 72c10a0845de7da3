#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace rich {

/**
 * Terminal cell-width measurement.
 *
 * Every position and width in crich is expressed in cells: one fixed-width
 * terminal column. Characters are 0 (controls, combining marks), 1, or 2
 * (East Asian wide and fullwidth, most emoji) cells wide.
 */

// ========== UTF-8 Decoding ==========

/**
 * Decode one code point starting at byte index `pos` and advance `pos` past it.
 * Invalid or truncated sequences decode to U+FFFD and advance by one byte.
 */
char32_t next_codepoint(const std::string& text, size_t& pos);

/**
 * Decode a whole UTF-8 string into code points.
 */
std::vector<char32_t> decode_utf8(const std::string& text);

/**
 * Encode a code point as UTF-8.
 */
std::string encode_utf8(char32_t codepoint);

// ========== Cell Width ==========

/**
 * Get the cell width of a single code point (0, 1 or 2).
 */
int get_character_cell_size(char32_t codepoint);

/**
 * Get the total cell width of a UTF-8 string.
 */
size_t cell_len(const std::string& text);

/**
 * Pad or truncate text to exactly `width` cells.
 *
 * A double-width character that would straddle the boundary is dropped and
 * its remaining cell is filled with a space, so the result is always exactly
 * `width` cells wide.
 */
std::string fit_to_width(const std::string& text, size_t width);

/**
 * Split text at the last character boundary that fits in `max_cells`.
 * Returns (head, tail); head never exceeds `max_cells` cells.
 */
std::pair<std::string, std::string> chop_cells(const std::string& text, size_t max_cells);

/**
 * Byte index of the first character starting at or after cell `cell_pos`.
 * Returns text.size() when `cell_pos` equals the total width and
 * std::string::npos when it lies beyond it.
 */
size_t cell_to_byte_index(const std::string& text, size_t cell_pos);

/**
 * Check if any character in text is double width.
 */
bool has_wide_chars(const std::string& text);

} // namespace rich

#include "cells.hpp"

#include <iterator>

namespace rich {

namespace {
    struct Interval {
        char32_t first;
        char32_t last;
    };

    // Nonspacing, enclosing and format characters that occupy no cell.
    const Interval kZeroWidth[] = {
        {0x0300, 0x036F}, {0x0483, 0x0489}, {0x0591, 0x05BD}, {0x05BF, 0x05BF},
        {0x05C1, 0x05C2}, {0x05C4, 0x05C5}, {0x05C7, 0x05C7}, {0x0600, 0x0605},
        {0x0610, 0x061A}, {0x061C, 0x061C}, {0x064B, 0x065F}, {0x0670, 0x0670},
        {0x06D6, 0x06DD}, {0x06DF, 0x06E4}, {0x06E7, 0x06E8}, {0x06EA, 0x06ED},
        {0x070F, 0x070F}, {0x0711, 0x0711}, {0x0730, 0x074A}, {0x07A6, 0x07B0},
        {0x07EB, 0x07F3}, {0x0816, 0x0819}, {0x081B, 0x0823}, {0x0825, 0x0827},
        {0x0829, 0x082D}, {0x0859, 0x085B}, {0x08D3, 0x0902}, {0x093A, 0x093A},
        {0x093C, 0x093C}, {0x0941, 0x0948}, {0x094D, 0x094D}, {0x0951, 0x0957},
        {0x0962, 0x0963}, {0x0981, 0x0981}, {0x09BC, 0x09BC}, {0x09C1, 0x09C4},
        {0x09CD, 0x09CD}, {0x09E2, 0x09E3}, {0x0A01, 0x0A02}, {0x0A3C, 0x0A3C},
        {0x0A41, 0x0A42}, {0x0A47, 0x0A48}, {0x0A4B, 0x0A4D}, {0x0A70, 0x0A71},
        {0x0A81, 0x0A82}, {0x0ABC, 0x0ABC}, {0x0AC1, 0x0AC5}, {0x0AC7, 0x0AC8},
        {0x0ACD, 0x0ACD}, {0x0B01, 0x0B01}, {0x0B3C, 0x0B3C}, {0x0B3F, 0x0B3F},
        {0x0B41, 0x0B44}, {0x0B4D, 0x0B4D}, {0x0B82, 0x0B82}, {0x0BC0, 0x0BC0},
        {0x0BCD, 0x0BCD}, {0x0C3E, 0x0C40}, {0x0C46, 0x0C48}, {0x0C4A, 0x0C4D},
        {0x0C55, 0x0C56}, {0x0CBC, 0x0CBC}, {0x0CCC, 0x0CCD}, {0x0D41, 0x0D44},
        {0x0D4D, 0x0D4D}, {0x0DCA, 0x0DCA}, {0x0DD2, 0x0DD4}, {0x0DD6, 0x0DD6},
        {0x0E31, 0x0E31}, {0x0E34, 0x0E3A}, {0x0E47, 0x0E4E}, {0x0EB1, 0x0EB1},
        {0x0EB4, 0x0EBC}, {0x0EC8, 0x0ECD}, {0x0F18, 0x0F19}, {0x0F35, 0x0F35},
        {0x0F37, 0x0F37}, {0x0F39, 0x0F39}, {0x0F71, 0x0F7E}, {0x0F80, 0x0F84},
        {0x0F86, 0x0F87}, {0x0F8D, 0x0FBC}, {0x0FC6, 0x0FC6}, {0x102D, 0x1030},
        {0x1032, 0x1037}, {0x1039, 0x103A}, {0x1058, 0x1059}, {0x1160, 0x11FF},
        {0x135D, 0x135F}, {0x1712, 0x1714}, {0x1732, 0x1734}, {0x1752, 0x1753},
        {0x1772, 0x1773}, {0x17B4, 0x17B5}, {0x17B7, 0x17BD}, {0x17C6, 0x17C6},
        {0x17C9, 0x17D3}, {0x17DD, 0x17DD}, {0x180B, 0x180E}, {0x18A9, 0x18A9},
        {0x1920, 0x1922}, {0x1927, 0x1928}, {0x1932, 0x1932}, {0x1939, 0x193B},
        {0x1A17, 0x1A18}, {0x1AB0, 0x1AFF}, {0x1B00, 0x1B03}, {0x1B34, 0x1B34},
        {0x1B36, 0x1B3A}, {0x1B3C, 0x1B3C}, {0x1B42, 0x1B42}, {0x1B6B, 0x1B73},
        {0x1DC0, 0x1DFF}, {0x200B, 0x200F}, {0x202A, 0x202E}, {0x2060, 0x2064},
        {0x206A, 0x206F}, {0x20D0, 0x20F0}, {0x2CEF, 0x2CF1}, {0x2DE0, 0x2DFF},
        {0x302A, 0x302D}, {0x3099, 0x309A}, {0xA66F, 0xA672}, {0xA674, 0xA67D},
        {0xA69E, 0xA69F}, {0xA6F0, 0xA6F1}, {0xA802, 0xA802}, {0xA806, 0xA806},
        {0xA80B, 0xA80B}, {0xA825, 0xA826}, {0xFB1E, 0xFB1E}, {0xFE00, 0xFE0F},
        {0xFE20, 0xFE2F}, {0xFEFF, 0xFEFF}, {0xFFF9, 0xFFFB}, {0x1D167, 0x1D169},
        {0x1D173, 0x1D182}, {0x1D185, 0x1D18B}, {0x1D1AA, 0x1D1AD}, {0xE0001, 0xE0001},
        {0xE0020, 0xE007F}, {0xE0100, 0xE01EF}};

    // East Asian Wide (W) and Fullwidth (F) ranges, including emoji presentation.
    const Interval kDoubleWidth[] = {
        {0x1100, 0x115F}, {0x231A, 0x231B}, {0x2329, 0x232A}, {0x23E9, 0x23EC},
        {0x23F0, 0x23F0}, {0x23F3, 0x23F3}, {0x25FD, 0x25FE}, {0x2614, 0x2615},
        {0x2648, 0x2653}, {0x267F, 0x267F}, {0x2693, 0x2693}, {0x26A1, 0x26A1},
        {0x26AA, 0x26AB}, {0x26BD, 0x26BE}, {0x26C4, 0x26C5}, {0x26CE, 0x26CE},
        {0x26D4, 0x26D4}, {0x26EA, 0x26EA}, {0x26F2, 0x26F3}, {0x26F5, 0x26F5},
        {0x26FA, 0x26FA}, {0x26FD, 0x26FD}, {0x2705, 0x2705}, {0x270A, 0x270B},
        {0x2728, 0x2728}, {0x274C, 0x274C}, {0x274E, 0x274E}, {0x2753, 0x2755},
        {0x2757, 0x2757}, {0x2795, 0x2797}, {0x27B0, 0x27B0}, {0x27BF, 0x27BF},
        {0x2B1B, 0x2B1C}, {0x2B50, 0x2B50}, {0x2B55, 0x2B55}, {0x2E80, 0x2E99},
        {0x2E9B, 0x2EF3}, {0x2F00, 0x2FD5}, {0x2FF0, 0x2FFB}, {0x3000, 0x3029},
        {0x302E, 0x303E}, {0x3041, 0x3096}, {0x309B, 0x30FF}, {0x3105, 0x312F},
        {0x3131, 0x318E}, {0x3190, 0x31E3}, {0x31F0, 0x321E}, {0x3220, 0x3247},
        {0x3250, 0x4DBF}, {0x4E00, 0xA48C}, {0xA490, 0xA4C6}, {0xA960, 0xA97C},
        {0xAC00, 0xD7A3}, {0xF900, 0xFAFF}, {0xFE10, 0xFE19}, {0xFE30, 0xFE52},
        {0xFE54, 0xFE66}, {0xFE68, 0xFE6B}, {0xFF01, 0xFF60}, {0xFFE0, 0xFFE6},
        {0x16FE0, 0x16FE4}, {0x17000, 0x187F7}, {0x18800, 0x18CD5}, {0x1B000, 0x1B122},
        {0x1F004, 0x1F004}, {0x1F0CF, 0x1F0CF}, {0x1F18E, 0x1F18E}, {0x1F191, 0x1F19A},
        {0x1F200, 0x1F202}, {0x1F210, 0x1F23B}, {0x1F240, 0x1F248}, {0x1F250, 0x1F251},
        {0x1F260, 0x1F265}, {0x1F300, 0x1F320}, {0x1F32D, 0x1F335}, {0x1F337, 0x1F37C},
        {0x1F37E, 0x1F393}, {0x1F3A0, 0x1F3CA}, {0x1F3CF, 0x1F3D3}, {0x1F3E0, 0x1F3F0},
        {0x1F3F4, 0x1F3F4}, {0x1F3F8, 0x1F43E}, {0x1F440, 0x1F440}, {0x1F442, 0x1F4FC},
        {0x1F4FF, 0x1F53D}, {0x1F54B, 0x1F54E}, {0x1F550, 0x1F567}, {0x1F57A, 0x1F57A},
        {0x1F595, 0x1F596}, {0x1F5A4, 0x1F5A4}, {0x1F5FB, 0x1F64F}, {0x1F680, 0x1F6C5},
        {0x1F6CC, 0x1F6CC}, {0x1F6D0, 0x1F6D2}, {0x1F6D5, 0x1F6D7}, {0x1F6EB, 0x1F6EC},
        {0x1F6F4, 0x1F6FC}, {0x1F7E0, 0x1F7EB}, {0x1F90C, 0x1F93A}, {0x1F93C, 0x1F945},
        {0x1F947, 0x1F9FF}, {0x1FA70, 0x1FA7C}, {0x1FA80, 0x1FA88}, {0x1FA90, 0x1FABD},
        {0x1FABF, 0x1FAC5}, {0x1FACE, 0x1FADB}, {0x1FAE0, 0x1FAE8}, {0x1FAF0, 0x1FAF8},
        {0x20000, 0x2FFFD}, {0x30000, 0x3FFFD}};

    template <size_t N>
    bool bisearch(char32_t codepoint, const Interval (&table)[N]) {
        if (codepoint < table[0].first || codepoint > table[N - 1].last) {
            return false;
        }
        size_t lo = 0;
        size_t hi = N - 1;
        while (lo <= hi) {
            size_t mid = lo + (hi - lo) / 2;
            if (codepoint > table[mid].last) {
                lo = mid + 1;
            } else if (codepoint < table[mid].first) {
                if (mid == 0) {
                    return false;
                }
                hi = mid - 1;
            } else {
                return true;
            }
        }
        return false;
    }

    bool is_continuation(unsigned char c) {
        return (c & 0xC0) == 0x80;
    }
}

char32_t next_codepoint(const std::string& text, size_t& pos) {
    unsigned char c = static_cast<unsigned char>(text[pos]);

    if ((c & 0x80) == 0) {
        // ASCII (1 byte)
        pos++;
        return c;
    }

    size_t length = 0;
    char32_t codepoint = 0;
    char32_t minimum = 0;
    if ((c & 0xE0) == 0xC0) {
        length = 2;
        codepoint = c & 0x1F;
        minimum = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
        length = 3;
        codepoint = c & 0x0F;
        minimum = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
        length = 4;
        codepoint = c & 0x07;
        minimum = 0x10000;
    } else {
        // Stray continuation byte or invalid lead byte
        pos++;
        return 0xFFFD;
    }

    if (pos + length > text.size()) {
        pos++;
        return 0xFFFD;
    }
    for (size_t i = 1; i < length; i++) {
        unsigned char cc = static_cast<unsigned char>(text[pos + i]);
        if (!is_continuation(cc)) {
            pos++;
            return 0xFFFD;
        }
        codepoint = (codepoint << 6) | (cc & 0x3F);
    }

    // Overlong forms, surrogates and out-of-range values
    if (codepoint < minimum || codepoint > 0x10FFFF ||
        (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
        pos++;
        return 0xFFFD;
    }

    pos += length;
    return codepoint;
}

std::vector<char32_t> decode_utf8(const std::string& text) {
    std::vector<char32_t> result;
    result.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        result.push_back(next_codepoint(text, pos));
    }
    return result;
}

std::string encode_utf8(char32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

int get_character_cell_size(char32_t codepoint) {
    // Printable ASCII fast path
    if (codepoint >= 0x20 && codepoint < 0x7F) {
        return 1;
    }
    if (codepoint < 0x20 || (codepoint >= 0x7F && codepoint < 0xA0)) {
        return 0;
    }
    if (bisearch(codepoint, kZeroWidth)) {
        return 0;
    }
    if (bisearch(codepoint, kDoubleWidth)) {
        return 2;
    }
    return 1;
}

size_t cell_len(const std::string& text) {
    size_t width = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[pos]);
        if (c >= 0x20 && c < 0x7F) {
            width++;
            pos++;
            continue;
        }
        width += static_cast<size_t>(get_character_cell_size(next_codepoint(text, pos)));
    }
    return width;
}

std::string fit_to_width(const std::string& text, size_t width) {
    size_t current = cell_len(text);
    if (current == width) {
        return text;
    }
    if (current < width) {
        return text + std::string(width - current, ' ');
    }

    auto [head, tail] = chop_cells(text, width);
    size_t head_width = cell_len(head);
    if (head_width < width) {
        // A wide character straddled the boundary; fill its visible half with a space.
        head += std::string(width - head_width, ' ');
    }
    return head;
}

std::pair<std::string, std::string> chop_cells(const std::string& text, size_t max_cells) {
    size_t width = 0;
    size_t pos = 0;
    size_t cut = 0;
    while (pos < text.size()) {
        size_t next = pos;
        int char_width = get_character_cell_size(next_codepoint(text, next));
        if (width + static_cast<size_t>(char_width) > max_cells) {
            break;
        }
        width += static_cast<size_t>(char_width);
        pos = next;
        cut = pos;
    }
    return {text.substr(0, cut), text.substr(cut)};
}

size_t cell_to_byte_index(const std::string& text, size_t cell_pos) {
    size_t current = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        if (current >= cell_pos) {
            return pos;
        }
        current += static_cast<size_t>(get_character_cell_size(next_codepoint(text, pos)));
    }
    return current >= cell_pos ? text.size() : std::string::npos;
}

bool has_wide_chars(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size()) {
        if (get_character_cell_size(next_codepoint(text, pos)) > 1) {
            return true;
        }
    }
    return false;
}

} // namespace rich

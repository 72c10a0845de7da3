#include "text.hpp"
#include "cells.hpp"
#include "parse_cache.hpp"

#include <algorithm>
#include <map>
#include <regex>

namespace rich {

namespace {
    bool is_space(char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }

    bool is_continuation(const std::string& s, size_t i) {
        return i < s.size() && (static_cast<unsigned char>(s[i]) & 0xC0) == 0x80;
    }

    // Nearest character boundary at or before `i` (clamped to the string).
    size_t floor_boundary(const std::string& s, size_t i) {
        i = std::min(i, s.size());
        while (i > 0 && is_continuation(s, i)) {
            i--;
        }
        return i;
    }

    // Nearest character boundary at or after `i` (clamped to the string).
    size_t ceil_boundary(const std::string& s, size_t i) {
        i = std::min(i, s.size());
        while (is_continuation(s, i)) {
            i++;
        }
        return i;
    }

    std::string ascii_lower(std::string s) {
        for (char& c : s) {
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c - 'A' + 'a');
            }
        }
        return s;
    }

    // Byte length of the longest prefix of `s` that fits in `width` cells.
    size_t fit_prefix(const std::string& s, size_t width) {
        return chop_cells(s, width).first.size();
    }
}

std::optional<JustifyMethod> parse_justify(const std::string& name) {
    std::string key = normalize_key(name);
    if (key == "default") return JustifyMethod::Default;
    if (key == "left") return JustifyMethod::Left;
    if (key == "center") return JustifyMethod::Center;
    if (key == "right") return JustifyMethod::Right;
    if (key == "full") return JustifyMethod::Full;
    return std::nullopt;
}

std::optional<OverflowMethod> parse_overflow(const std::string& name) {
    std::string key = normalize_key(name);
    if (key == "fold") return OverflowMethod::Fold;
    if (key == "crop") return OverflowMethod::Crop;
    if (key == "ellipsis") return OverflowMethod::Ellipsis;
    if (key == "ignore") return OverflowMethod::Ignore;
    return std::nullopt;
}

// ========== Span ==========

Span::Span(size_t start, size_t end, Style style)
    : start(std::min(start, end)), end(std::max(start, end)), style(std::move(style)) {}

Span Span::move_right(size_t offset, size_t max) const {
    return Span(std::min(start + offset, max), std::min(end + offset, max), style);
}

Span Span::adjust(size_t offset) const {
    return Span(start > offset ? start - offset : 0, end > offset ? end - offset : 0, style);
}

// ========== Text ==========

Text::Text(std::string plain, Style style) : plain_(std::move(plain)), style_(std::move(style)) {}

Text Text::styled(const std::string& plain, const Style& style) {
    Text text(plain);
    text.stylize_all(style);
    return text;
}

Text Text::assemble(const std::vector<std::pair<std::string, std::optional<Style>>>& pieces) {
    Text text;
    for (const auto& [content, style] : pieces) {
        if (style) {
            text.append_styled(content, *style);
        } else {
            text.append(content);
        }
    }
    return text;
}

size_t Text::cell_len() const {
    return rich::cell_len(plain_);
}

Text Text::with_content(std::string plain, std::vector<Span> spans) const {
    Text text(std::move(plain), style_);
    text.spans_ = std::move(spans);
    text.justify = justify;
    text.overflow = overflow;
    text.no_wrap = no_wrap;
    text.end = end;
    text.tab_size = tab_size;
    return text;
}

void Text::append(const std::string& text) {
    plain_ += text;
}

void Text::append_styled(const std::string& text, const Style& style) {
    size_t start = plain_.size();
    plain_ += text;
    if (!text.empty()) {
        spans_.emplace_back(start, plain_.size(), style);
    }
}

void Text::append_text(const Text& other) {
    size_t offset = plain_.size();
    plain_ += other.plain_;

    // Keep the other text's base style when it differs from ours
    if (!other.empty() && !other.style_.is_null() && other.style_ != Style() &&
        other.style_ != style_) {
        spans_.emplace_back(offset, plain_.size(), other.style_);
    }
    for (const auto& span : other.spans_) {
        spans_.push_back(span.move_right(offset, plain_.size()));
    }
}

void Text::stylize(size_t start, size_t end, const Style& style) {
    size_t s = floor_boundary(plain_, start);
    size_t e = ceil_boundary(plain_, end);
    if (s < e) {
        spans_.emplace_back(s, e, style);
    }
}

void Text::stylize_all(const Style& style) {
    if (!plain_.empty()) {
        spans_.emplace_back(0, plain_.size(), style);
    }
}

size_t Text::highlight_words(const std::vector<std::string>& words, const Style& style,
                             bool case_sensitive) {
    size_t count = 0;
    const std::string haystack = case_sensitive ? plain_ : ascii_lower(plain_);

    for (const auto& word : words) {
        if (word.empty()) {
            continue;
        }
        const std::string needle = case_sensitive ? word : ascii_lower(word);
        size_t pos = haystack.find(needle);
        while (pos != std::string::npos) {
            stylize(pos, pos + needle.size(), style);
            count++;
            pos = haystack.find(needle, pos + needle.size());
        }
    }
    return count;
}

size_t Text::highlight_regex(const std::string& pattern, const Style& style) {
    std::regex re(pattern);
    size_t count = 0;
    std::vector<std::pair<size_t, size_t>> matches;
    for (auto it = std::sregex_iterator(plain_.begin(), plain_.end(), re);
         it != std::sregex_iterator(); ++it) {
        if (it->length() > 0) {
            matches.emplace_back(static_cast<size_t>(it->position()),
                                 static_cast<size_t>(it->position() + it->length()));
        }
    }
    for (const auto& [start, stop] : matches) {
        stylize(start, stop, style);
        count++;
    }
    return count;
}

Text Text::slice(size_t start, size_t end) const {
    size_t s = floor_boundary(plain_, start);
    size_t e = std::max(s, floor_boundary(plain_, end));

    std::vector<Span> spans;
    for (const auto& span : spans_) {
        if (span.end <= s || span.start >= e) {
            continue;
        }
        size_t new_start = std::max(span.start, s) - s;
        size_t new_end = std::min(span.end, e) - s;
        if (new_start < new_end) {
            spans.emplace_back(new_start, new_end, span.style);
        }
    }
    return with_content(plain_.substr(s, e - s), std::move(spans));
}

Text Text::join(const std::vector<Text>& items) const {
    Text result = with_content("", {});
    bool first = true;
    for (const auto& item : items) {
        if (!first) {
            result.append_text(*this);
        }
        first = false;
        result.append_text(item);
    }
    return result;
}

std::vector<Text> Text::split_lines() const {
    std::vector<Text> lines;
    size_t start = 0;
    size_t newline = plain_.find('\n');
    while (newline != std::string::npos) {
        lines.push_back(slice(start, newline));
        start = newline + 1;
        newline = plain_.find('\n', start);
    }
    lines.push_back(slice(start, plain_.size()));
    return lines;
}

std::vector<Text> Text::divide(const std::vector<size_t>& offsets) const {
    if (offsets.empty()) {
        return {*this};
    }

    std::vector<Text> result;
    size_t previous = 0;
    for (size_t offset : offsets) {
        size_t cut = std::max(previous, floor_boundary(plain_, offset));
        result.push_back(slice(previous, cut));
        previous = cut;
    }
    result.push_back(slice(previous, plain_.size()));
    return result;
}

Text Text::expand_tabs(size_t tab_size) const {
    if (tab_size == 0 || plain_.find('\t') == std::string::npos) {
        return *this;
    }

    std::string expanded;
    std::vector<size_t> offset_map(plain_.size() + 1, 0);
    size_t column = 0;
    size_t pos = 0;

    while (pos < plain_.size()) {
        size_t char_start = pos;
        char32_t cp = next_codepoint(plain_, pos);
        for (size_t i = char_start; i < pos; i++) {
            offset_map[i] = expanded.size();
        }

        if (cp == '\t') {
            size_t spaces = tab_size - (column % tab_size);
            expanded.append(spaces, ' ');
            column += spaces;
        } else {
            expanded.append(plain_, char_start, pos - char_start);
            if (cp == '\n') {
                column = 0;
            } else {
                column += static_cast<size_t>(get_character_cell_size(cp));
            }
        }
    }
    offset_map[plain_.size()] = expanded.size();

    std::vector<Span> spans;
    for (const auto& span : spans_) {
        size_t new_start = offset_map[std::min(span.start, plain_.size())];
        size_t new_end = offset_map[std::min(span.end, plain_.size())];
        if (new_start < new_end) {
            spans.emplace_back(new_start, new_end, span.style);
        }
    }
    return with_content(std::move(expanded), std::move(spans));
}

Text Text::strip() const {
    size_t start = 0;
    while (start < plain_.size() && is_space(plain_[start])) {
        start++;
    }
    size_t stop = plain_.size();
    while (stop > start && is_space(plain_[stop - 1])) {
        stop--;
    }
    return slice(start, stop);
}

Text Text::strip_right() const {
    size_t stop = plain_.size();
    while (stop > 0 && is_space(plain_[stop - 1])) {
        stop--;
    }
    return slice(0, stop);
}

// ========== Layout ==========

void Text::truncate(size_t width, OverflowMethod overflow, bool pad) {
    size_t current = cell_len();

    if (current > width) {
        switch (overflow) {
            case OverflowMethod::Ignore:
                return;
            case OverflowMethod::Fold:
            case OverflowMethod::Crop:
                *this = slice(0, fit_prefix(plain_, width));
                break;
            case OverflowMethod::Ellipsis:
                if (width == 0) {
                    *this = slice(0, 0);
                    return;
                }
                *this = slice(0, fit_prefix(plain_, width - 1));
                append(ELLIPSIS);
                break;
        }
        current = cell_len();
    }

    if (pad && current < width) {
        pad_right(width - current);
    }
}

void Text::pad(size_t width, JustifyMethod justify) {
    size_t current = cell_len();
    if (current >= width) {
        return;
    }
    size_t padding = width - current;

    switch (justify) {
        case JustifyMethod::Default:
        case JustifyMethod::Left:
        case JustifyMethod::Full:
            pad_right(padding);
            break;
        case JustifyMethod::Right:
            pad_left(padding);
            break;
        case JustifyMethod::Center: {
            size_t left = padding / 2;
            pad_left(left);
            pad_right(padding - left);
            break;
        }
    }
}

void Text::pad_left(size_t count) {
    if (count == 0) {
        return;
    }
    plain_.insert(0, count, ' ');
    for (auto& span : spans_) {
        span = span.move_right(count, plain_.size());
    }
}

void Text::pad_right(size_t count) {
    plain_.append(count, ' ');
}

void Text::rstrip_end(size_t size) {
    size_t text_length = cell_len();
    if (text_length <= size) {
        return;
    }
    size_t stop = plain_.size();
    while (stop > 0 && is_space(plain_[stop - 1])) {
        stop--;
    }
    size_t whitespace = plain_.size() - stop;
    size_t excess = std::min(whitespace, text_length - size);
    if (excess > 0) {
        *this = slice(0, plain_.size() - excess);
    }
}

void Text::justify_lines(std::vector<Text>& lines, size_t width, JustifyMethod justify,
                         OverflowMethod overflow) {
    switch (justify) {
        case JustifyMethod::Default:
            return;

        case JustifyMethod::Left:
            for (auto& line : lines) {
                line.truncate(width, overflow, true);
            }
            return;

        case JustifyMethod::Center:
            for (auto& line : lines) {
                line = line.strip_right();
                line.truncate(width, overflow);
                line.pad(width, JustifyMethod::Center);
            }
            return;

        case JustifyMethod::Right:
            for (auto& line : lines) {
                line = line.strip_right();
                line.truncate(width, overflow);
                line.pad(width, JustifyMethod::Right);
            }
            return;

        case JustifyMethod::Full:
            for (size_t index = 0; index < lines.size(); index++) {
                Text& line = lines[index];
                if (index + 1 == lines.size()) {
                    line.truncate(width, overflow, true);
                    break;
                }

                Text stripped = line.strip_right();
                std::vector<Text> words;
                const std::string& plain = stripped.plain();
                size_t pos = 0;
                while (pos < plain.size()) {
                    while (pos < plain.size() && plain[pos] == ' ') {
                        pos++;
                    }
                    size_t word_start = pos;
                    while (pos < plain.size() && plain[pos] != ' ') {
                        pos++;
                    }
                    if (pos > word_start) {
                        words.push_back(stripped.slice(word_start, pos));
                    }
                }

                if (words.size() < 2) {
                    line.truncate(width, overflow, true);
                    continue;
                }

                size_t gaps = words.size() - 1;
                std::vector<size_t> spaces(gaps, 1);
                size_t total = gaps;
                for (const auto& word : words) {
                    total += word.cell_len();
                }
                // Extra spaces go to the rightmost gaps first
                size_t cursor = 0;
                while (total < width) {
                    spaces[gaps - cursor - 1]++;
                    total++;
                    cursor = (cursor + 1) % gaps;
                }

                Text justified = line.slice(0, 0);
                for (size_t i = 0; i < words.size(); i++) {
                    justified.append_text(words[i]);
                    if (i < gaps) {
                        justified.append(std::string(spaces[i], ' '));
                    }
                }
                line = justified;
            }
            return;
    }
}

std::vector<Text> Text::wrap_line(const Text& line, size_t width) const {
    switch (line.overflow) {
        case OverflowMethod::Crop:
        case OverflowMethod::Ellipsis: {
            Text truncated = line;
            truncated.truncate(width, line.overflow);
            return {truncated};
        }
        case OverflowMethod::Ignore:
            return {line};
        case OverflowMethod::Fold:
            break;
    }

    const std::string& s = line.plain();
    std::vector<size_t> breaks;
    size_t line_position = 0;
    size_t pos = 0;

    auto add_break = [&breaks](size_t offset) {
        if (offset > 0 && (breaks.empty() || breaks.back() < offset)) {
            breaks.push_back(offset);
        }
    };

    while (pos < s.size()) {
        // Each chunk is leading whitespace, a word, then its trailing whitespace
        size_t start = pos;
        while (pos < s.size() && is_space(s[pos])) pos++;
        size_t word_end = pos;
        while (word_end < s.size() && !is_space(s[word_end])) word_end++;
        pos = word_end;
        while (pos < s.size() && is_space(s[pos])) pos++;

        std::string chunk = s.substr(start, pos - start);
        size_t word_length = rich::cell_len(s.substr(start, word_end - start));
        size_t chunk_length = rich::cell_len(chunk);

        if (line_position + word_length <= width) {
            line_position += chunk_length;
            continue;
        }

        if (word_length > width) {
            // Fold the word across as many lines as it needs
            size_t piece_start = start;
            std::string rest = chunk;
            while (true) {
                size_t piece_bytes = fit_prefix(rest, width);
                if (piece_bytes == 0) {
                    // A character wider than the whole line still gets a line of its own
                    size_t one = 0;
                    next_codepoint(rest, one);
                    piece_bytes = one;
                }
                add_break(piece_start);
                if (piece_bytes >= rest.size()) {
                    line_position = rich::cell_len(rest);
                    break;
                }
                piece_start += piece_bytes;
                rest = rest.substr(piece_bytes);
            }
        } else if (line_position > 0) {
            add_break(start);
            line_position = chunk_length;
        }
    }

    return line.divide(breaks);
}

std::vector<Text> Text::wrap(size_t width) const {
    if (width == 0) {
        return {with_content("", {})};
    }

    Text expanded = expand_tabs(tab_size);
    std::vector<Text> lines;

    for (const auto& line : expanded.split_lines()) {
        std::vector<Text> new_lines;
        if (no_wrap || line.cell_len() <= width) {
            new_lines.push_back(line);
        } else {
            new_lines = wrap_line(line, width);
        }
        for (auto& new_line : new_lines) {
            new_line.rstrip_end(width);
        }
        justify_lines(new_lines, width, justify, overflow);
        lines.insert(lines.end(), new_lines.begin(), new_lines.end());
    }

    return lines;
}

// ========== Rendering ==========

std::vector<Segment> Text::render(const std::string& end) const {
    std::vector<Segment> result;

    if (!plain_.empty()) {
        // position -> (span index, is_start)
        std::map<size_t, std::vector<std::pair<size_t, bool>>> events;
        for (size_t i = 0; i < spans_.size(); i++) {
            const Span& span = spans_[i];
            size_t stop = std::min(span.end, plain_.size());
            if (span.start >= stop) {
                continue;
            }
            events[span.start].emplace_back(i, true);
            events[stop].emplace_back(i, false);
        }

        std::map<std::vector<size_t>, Style> style_cache;
        std::vector<size_t> active;  // Span indices, ascending = application order

        auto current_style = [&]() -> Style {
            auto it = style_cache.find(active);
            if (it != style_cache.end()) {
                return it->second;
            }
            Style combined = style_;
            for (size_t index : active) {
                combined = combined.combine(spans_[index].style);
            }
            style_cache.emplace(active, combined);
            return combined;
        };

        size_t pos = 0;
        for (const auto& [at, span_events] : events) {
            if (at > pos) {
                result.emplace_back(plain_.substr(pos, at - pos), current_style());
                pos = at;
            }
            // Ends before starts so adjacent spans do not overlap
            for (const auto& [index, is_start] : span_events) {
                if (!is_start) {
                    active.erase(std::remove(active.begin(), active.end(), index), active.end());
                }
            }
            for (const auto& [index, is_start] : span_events) {
                if (is_start) {
                    active.insert(std::lower_bound(active.begin(), active.end(), index), index);
                }
            }
        }
        if (pos < plain_.size()) {
            result.emplace_back(plain_.substr(pos), current_style());
        }
    }

    if (!end.empty()) {
        result.emplace_back(end);
    }
    return result;
}

Text Text::operator+(const Text& other) const {
    Text result = *this;
    result.append_text(other);
    return result;
}

Text& Text::operator+=(const Text& other) {
    append_text(other);
    return *this;
}

} // namespace rich

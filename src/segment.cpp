#include "segment.hpp"
#include "cells.hpp"

#include <algorithm>

namespace rich {

namespace {
    SegmentLine pad_to_width(SegmentLine line, size_t width, const Style& style) {
        size_t current = segment::line_length(line);
        if (current < width) {
            line.emplace_back(std::string(width - current, ' '), style);
        }
        return line;
    }

    SegmentLine blank_line(size_t width, const Style& style) {
        return {Segment(std::string(width, ' '), style)};
    }
}

Segment Segment::control_codes(std::vector<ControlCode> codes, std::string payload) {
    Segment seg(std::move(payload));
    seg.control = std::move(codes);
    return seg;
}

size_t Segment::cell_length() const {
    if (is_control()) {
        return 0;
    }
    return cell_len(text);
}

std::pair<Segment, Segment> Segment::split_at_cell(size_t cell_pos) const {
    if (is_control()) {
        return {*this, Segment()};
    }

    size_t width = 0;
    size_t pos = 0;
    size_t cut = 0;
    while (pos < text.size()) {
        size_t next = pos;
        size_t char_width = static_cast<size_t>(get_character_cell_size(next_codepoint(text, next)));
        if (width + char_width > cell_pos) {
            break;
        }
        width += char_width;
        pos = next;
        cut = pos;
    }

    return {Segment(text.substr(0, cut), style), Segment(text.substr(cut), style)};
}

namespace segment {

std::vector<Segment> apply_style(const std::vector<Segment>& segments,
                                 const std::optional<Style>& style,
                                 const std::optional<Style>& post_style) {
    std::vector<Segment> result;
    result.reserve(segments.size());
    for (const auto& seg : segments) {
        Segment styled = seg;
        if (!styled.is_control()) {
            if (style) {
                styled.style = styled.style ? style->combine(*styled.style) : *style;
            }
            if (post_style) {
                styled.style = styled.style ? styled.style->combine(*post_style) : *post_style;
            }
        }
        result.push_back(std::move(styled));
    }
    return result;
}

std::vector<SegmentLine> split_lines(const std::vector<Segment>& segments) {
    std::vector<SegmentLine> lines(1);

    for (const auto& seg : segments) {
        if (seg.is_control()) {
            lines.back().push_back(seg);
            continue;
        }

        size_t start = 0;
        while (true) {
            size_t newline = seg.text.find('\n', start);
            std::string part = seg.text.substr(start, newline == std::string::npos
                                                          ? std::string::npos
                                                          : newline - start);
            if (!part.empty()) {
                lines.back().emplace_back(part, seg.style);
            }
            if (newline == std::string::npos) {
                break;
            }
            lines.emplace_back();
            start = newline + 1;
        }
    }

    return lines;
}

SegmentLine adjust_line_length(const SegmentLine& line, size_t length,
                               const std::optional<Style>& style, bool pad) {
    size_t current = line_length(line);

    if (current < length && pad) {
        SegmentLine result = line;
        result.emplace_back(std::string(length - current, ' '), style);
        return result;
    }
    if (current > length) {
        return truncate_line(line, length);
    }
    return line;
}

SegmentLine truncate_line(const SegmentLine& line, size_t max_width) {
    SegmentLine result;
    size_t remaining = max_width;

    for (const auto& seg : line) {
        if (seg.is_control()) {
            result.push_back(seg);
            continue;
        }

        size_t width = seg.cell_length();
        if (width <= remaining) {
            result.push_back(seg);
            remaining -= width;
        } else {
            if (remaining > 0) {
                result.push_back(seg.split_at_cell(remaining).first);
            }
            break;
        }
    }

    return result;
}

std::vector<Segment> simplify(const std::vector<Segment>& segments) {
    std::vector<Segment> result;

    for (const auto& seg : segments) {
        if (seg.is_control()) {
            result.push_back(seg);
            continue;
        }
        if (seg.text.empty()) {
            continue;
        }
        if (!result.empty() && !result.back().is_control() && result.back().style == seg.style) {
            result.back().text += seg.text;
            continue;
        }
        result.push_back(seg);
    }

    return result;
}

std::vector<SegmentLine> divide(const SegmentLine& segments, const std::vector<size_t>& cuts) {
    if (cuts.empty()) {
        return {segments};
    }

    std::vector<SegmentLine> result(cuts.size() + 1);
    size_t position = 0;
    size_t cut_index = 0;

    for (const auto& seg : segments) {
        if (seg.is_control()) {
            result[cut_index].push_back(seg);
            continue;
        }

        size_t seg_end = position + seg.cell_length();
        while (cut_index < cuts.size() && cuts[cut_index] <= position) {
            cut_index++;
        }

        if (cut_index >= cuts.size() || seg_end <= cuts[cut_index]) {
            result[std::min(cut_index, result.size() - 1)].push_back(seg);
        } else {
            // Segment straddles one or more cuts
            Segment remaining = seg;
            size_t pos = position;
            while (cut_index < cuts.size() && pos + remaining.cell_length() > cuts[cut_index]) {
                auto [left, right] = remaining.split_at_cell(cuts[cut_index] - pos);
                if (!left.text.empty()) {
                    result[cut_index].push_back(left);
                }
                pos = cuts[cut_index];
                cut_index++;
                remaining = right;
            }
            if (!remaining.text.empty()) {
                result[std::min(cut_index, result.size() - 1)].push_back(remaining);
            }
        }

        position = seg_end;
    }

    return result;
}

std::vector<SegmentLine> align_top(std::vector<SegmentLine> lines, size_t width, size_t height,
                                   const Style& style) {
    std::vector<SegmentLine> result;
    for (auto& line : lines) {
        result.push_back(pad_to_width(std::move(line), width, style));
    }
    while (result.size() < height) {
        result.push_back(blank_line(width, style));
    }
    return result;
}

std::vector<SegmentLine> align_bottom(std::vector<SegmentLine> lines, size_t width, size_t height,
                                      const Style& style) {
    std::vector<SegmentLine> result;
    size_t padding = height > lines.size() ? height - lines.size() : 0;
    for (size_t i = 0; i < padding; i++) {
        result.push_back(blank_line(width, style));
    }
    for (auto& line : lines) {
        result.push_back(pad_to_width(std::move(line), width, style));
    }
    return result;
}

std::vector<SegmentLine> align_middle(std::vector<SegmentLine> lines, size_t width, size_t height,
                                      const Style& style) {
    if (lines.size() >= height) {
        return align_top(std::move(lines), width, height, style);
    }

    size_t total_padding = height - lines.size();
    size_t top = total_padding / 2;
    size_t bottom = total_padding - top;

    std::vector<SegmentLine> result;
    for (size_t i = 0; i < top; i++) {
        result.push_back(blank_line(width, style));
    }
    for (auto& line : lines) {
        result.push_back(pad_to_width(std::move(line), width, style));
    }
    for (size_t i = 0; i < bottom; i++) {
        result.push_back(blank_line(width, style));
    }
    return result;
}

size_t line_length(const SegmentLine& line) {
    size_t total = 0;
    for (const auto& seg : line) {
        total += seg.cell_length();
    }
    return total;
}

} // namespace segment

} // namespace rich

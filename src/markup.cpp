#include "markup.hpp"
#include "parse_cache.hpp"
#include "verbose.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace rich {

MarkupError::MarkupError(Kind kind, const std::string& message, std::optional<std::string> tag)
    : std::runtime_error(message), kind_(kind), tag_(std::move(tag)) {}

namespace markup {

namespace {
    // A bracketed tag found in markup: an optional run of backslashes, then
    // "[content]" where content starts with a-z, '#', '/' or '@' and holds no
    // nested bracket.
    struct TagMatch {
        size_t start;        // First backslash, or the '[' when there are none.
        size_t backslashes;
        std::string content;
        size_t end;          // One past the closing ']'.
    };

    bool can_start_tag(char c) {
        return (c >= 'a' && c <= 'z') || c == '#' || c == '/' || c == '@';
    }

    // Returns the position of the ']' closing the tag opened at `open`, or npos.
    size_t tag_close(const std::string& s, size_t open) {
        if (open + 1 >= s.size() || !can_start_tag(s[open + 1])) {
            return std::string::npos;
        }
        size_t stop = s.find_first_of("[]", open + 2);
        if (stop == std::string::npos || s[stop] != ']') {
            return std::string::npos;
        }
        return stop;
    }

    size_t backslashes_before(const std::string& s, size_t pos, size_t floor) {
        size_t count = 0;
        while (pos - count > floor && s[pos - count - 1] == '\\') {
            count++;
        }
        return count;
    }

    std::optional<TagMatch> find_tag(const std::string& s, size_t from) {
        for (size_t open = s.find('[', from); open != std::string::npos; open = s.find('[', open + 1)) {
            size_t close = tag_close(s, open);
            if (close == std::string::npos) {
                continue;
            }
            size_t backslashes = backslashes_before(s, open, from);
            return TagMatch{open - backslashes, backslashes,
                            s.substr(open + 1, close - open - 1), close + 1};
        }
        return std::nullopt;
    }

    std::string trim(const std::string& s) {
        size_t start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) {
            return "";
        }
        size_t end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }

    std::string unescape(const std::string& text) {
        std::string result;
        result.reserve(text.size());
        for (size_t i = 0; i < text.size(); i++) {
            if (text[i] == '\\' && i + 1 < text.size() && text[i + 1] == '[') {
                continue;
            }
            result += text[i];
        }
        return result;
    }

    bool is_handler(const std::string& name) {
        return name.rfind("@", 0) == 0 || name.rfind("/@", 0) == 0;
    }

    bool balanced_parentheses(const std::string& s) {
        int depth = 0;
        for (char c : s) {
            if (c == '(') {
                depth++;
            } else if (c == ')') {
                if (--depth < 0) {
                    return false;
                }
            }
        }
        return depth == 0;
    }

    Style resolve_style(const Tag& tag, const Theme* theme) {
        if (normalize_key(tag.name) == "link") {
            if (!tag.parameters || trim(*tag.parameters).empty()) {
                throw MarkupError(MarkupError::Kind::InvalidTag, "invalid tag: link requires a URL");
            }
            return Style().link(trim(*tag.parameters));
        }

        if (is_handler(tag.name)) {
            return Style();
        }

        if (theme) {
            if (auto style = theme->get(tag.name)) {
                return *style;
            }
        }

        try {
            return Style::parse(tag.name);
        } catch (const StyleParseError& e) {
            verbose_log("MARKUP", "Unknown style '" + tag.name + "': " + e.what());
            return Style();
        }
    }

    struct OpenTag {
        size_t start;
        Tag tag;
        Style style;
    };

    std::optional<OpenTag> pop_matching(std::vector<OpenTag>& stack, const std::string& name) {
        std::string search = normalize_key(name);
        for (size_t i = stack.size(); i-- > 0;) {
            std::string tag_name = normalize_key(stack[i].tag.name);
            std::string first_word = tag_name.substr(0, tag_name.find_first_of(" \t"));
            if (tag_name == search || first_word == search) {
                OpenTag found = stack[i];
                stack.erase(stack.begin() + static_cast<std::ptrdiff_t>(i));
                return found;
            }
        }
        return std::nullopt;
    }

    void close_tag(Text& text, const OpenTag& open) {
        if (open.start < text.size()) {
            text.stylize(open.start, text.size(), open.style);
        }
    }
}

Tag parse_tag(const std::string& content) {
    std::string trimmed = trim(content);

    if (is_handler(trimmed) && trimmed.find('(') != std::string::npos) {
        if (!balanced_parentheses(trimmed) || trimmed.back() != ')') {
            throw MarkupError(MarkupError::Kind::InvalidTag,
                              "invalid tag: unbalanced parentheses in '" + trimmed + "'");
        }
        size_t open = trimmed.find('(');
        return Tag{trimmed.substr(0, open), trimmed.substr(open + 1, trimmed.size() - open - 2)};
    }

    size_t eq = trimmed.find('=');
    if (eq != std::string::npos) {
        return Tag{trim(trimmed.substr(0, eq)), trim(trimmed.substr(eq + 1))};
    }

    return Tag{trimmed, std::nullopt};
}

Text render(const std::string& markup, const Theme* theme) {
    if (markup.find('[') == std::string::npos) {
        return Text(markup);
    }

    Text text;
    std::vector<OpenTag> stack;
    size_t last_end = 0;

    while (auto match = find_tag(markup, last_end)) {
        if (match->start > last_end) {
            text.append(unescape(markup.substr(last_end, match->start - last_end)));
        }
        last_end = match->end;

        size_t backslashes = match->backslashes;
        const std::string& content = match->content;

        if (backslashes / 2 > 0) {
            text.append(std::string(backslashes / 2, '\\'));
        }
        if (backslashes % 2 == 1) {
            text.append("[" + content + "]");
            continue;
        }

        Tag tag = parse_tag(content);
        if (!tag.is_closing()) {
            Style style = resolve_style(tag, theme);
            stack.push_back(OpenTag{text.size(), std::move(tag), std::move(style)});
            continue;
        }

        std::string name = trim(tag.base_name());
        std::optional<OpenTag> open;
        if (name.empty()) {
            if (stack.empty()) {
                throw MarkupError(MarkupError::Kind::UnmatchedClosingTag,
                                  "closing tag '[/]' has nothing to close");
            }
            open = stack.back();
            stack.pop_back();
        } else {
            open = pop_matching(stack, name);
            if (!open) {
                throw MarkupError(MarkupError::Kind::UnmatchedClosingTag,
                                  "closing tag '[/" + name + "]' doesn't match any open tag", name);
            }
        }
        close_tag(text, *open);
    }

    if (last_end < markup.size()) {
        text.append(unescape(markup.substr(last_end)));
    }

    while (!stack.empty()) {
        close_tag(text, stack.back());
        stack.pop_back();
    }

    return text;
}

Text render_or_plain(const std::string& markup, const Theme* theme) {
    try {
        return render(markup, theme);
    } catch (const MarkupError& e) {
        verbose_err("MARKUP", std::string(e.what()) + "; rendering as plain text");
        return Text(markup);
    }
}

std::string escape(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] == '[') {
            // A tag-like bracket collapses backslash pairs when rendered, so the
            // run before it is doubled. Elsewhere only the backslash right
            // before '[' is consumed.
            if (tag_close(text, i) != std::string::npos) {
                result.append(backslashes_before(text, i, 0), '\\');
            }
            result += "\\[";
        } else {
            result += text[i];
        }
    }
    return result;
}

} // namespace markup

} // namespace rich

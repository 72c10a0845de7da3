#pragma once

/**
 * Console markup: "[bold red]hello[/] world" to styled Text.
 *
 * Tags open styles that apply until the matching closing tag, an implicit
 * "[/]", or the end of the input. A backslash before a tag makes it literal.
 */

#include "text.hpp"
#include "theme.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace rich {

class MarkupError : public std::runtime_error {
public:
    enum class Kind {
        UnmatchedClosingTag,  // Closing tag with no matching open tag
        InvalidTag            // Tag that cannot be interpreted
    };

    MarkupError(Kind kind, const std::string& message, std::optional<std::string> tag = std::nullopt);

    Kind kind() const { return kind_; }

    // Tag name for UnmatchedClosingTag("[/name]"); empty for "[/]".
    const std::optional<std::string>& tag() const { return tag_; }

private:
    Kind kind_;
    std::optional<std::string> tag_;
};

namespace markup {

/**
 * Tag as written between brackets, split into name and parameter
 * ("link=https://x" or "@click(arg)").
 */
struct Tag {
    std::string name;
    std::optional<std::string> parameters;

    bool is_closing() const { return !name.empty() && name[0] == '/'; }

    // Name without the leading '/'.
    std::string base_name() const { return is_closing() ? name.substr(1) : name; }
};

// Split tag content into name and parameters.
Tag parse_tag(const std::string& content);

/**
 * Parse markup into Text.
 *
 * Tag names are looked up in `theme` first (exact match), then parsed as a
 * style definition. Names that are neither produce an empty style.
 *
 * @throws MarkupError on unmatched closing tags or malformed tags
 */
Text render(const std::string& markup, const Theme* theme = nullptr);

// Like render(), but returns the markup as plain text if it is malformed.
Text render_or_plain(const std::string& markup, const Theme* theme = nullptr);

// Escape text so render() reproduces it literally.
std::string escape(const std::string& text);

} // namespace markup

} // namespace rich

#pragma once

/**
 * Text style model.
 *
 * A Style pairs optional foreground/background colors with a set of boolean
 * attributes and an optional hyperlink. Attributes are tracked in two
 * bitsets: the attribute values and which attributes were stated explicitly.
 * Combining styles lets the overlay's explicit choices win while inheriting
 * everything else from the base.
 */

#include "color.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace rich {

using Attributes = uint16_t;

// Attribute bits; bit order matches the SGR code table in style.cpp.
enum Attribute : Attributes {
    BOLD = 1 << 0,
    DIM = 1 << 1,
    ITALIC = 1 << 2,
    UNDERLINE = 1 << 3,
    BLINK = 1 << 4,
    BLINK2 = 1 << 5,
    REVERSE = 1 << 6,
    CONCEAL = 1 << 7,
    STRIKE = 1 << 8,
    UNDERLINE2 = 1 << 9,
    FRAME = 1 << 10,
    ENCIRCLE = 1 << 11,
    OVERLINE = 1 << 12
};

constexpr int ATTRIBUTE_COUNT = 13;

// Looks up an attribute by name or alias ("bold", "b", "uu", ...).
std::optional<Attribute> parse_attribute(const std::string& name);

// Canonical attribute name ("bold", "underline2", ...).
const char* attribute_name(Attribute attribute);

/**
 * Error raised when a style definition cannot be parsed.
 */
class StyleParseError : public std::runtime_error {
public:
    enum class Kind {
        InvalidFormat,
        UnknownAttribute,
        UnknownToken,
        ColorError
    };

    StyleParseError(Kind kind, const std::string& detail);

    // Wraps a color failure, keeping its kind.
    explicit StyleParseError(const ColorParseError& color_error);

    Kind kind() const { return kind_; }
    const std::string& detail() const { return detail_; }

    // Set only for Kind::ColorError.
    std::optional<ColorParseError::Kind> color_kind() const { return color_kind_; }

private:
    Kind kind_;
    std::string detail_;
    std::optional<ColorParseError::Kind> color_kind_;
};

class Style {
public:
    // An empty, non-null style.
    Style() = default;

    // The null style: the identity for combine().
    static Style null();

    /**
     * Parse a style definition such as "bold red on white".
     *
     * Grammar: whitespace separated tokens; "not <attr>", "on <color>",
     * "link <url>", attribute names and aliases, or a foreground color.
     * "" and "none" give the null style. Results are cached.
     *
     * @throws StyleParseError on malformed input
     */
    static Style parse(const std::string& definition);

    // ========== Builders ==========
    // Each returns a copy with the attribute and its explicit bit set.

    Style bold() const { return set(BOLD, true); }
    Style dim() const { return set(DIM, true); }
    Style italic() const { return set(ITALIC, true); }
    Style underline() const { return set(UNDERLINE, true); }
    Style blink() const { return set(BLINK, true); }
    Style blink2() const { return set(BLINK2, true); }
    Style reverse() const { return set(REVERSE, true); }
    Style conceal() const { return set(CONCEAL, true); }
    Style strike() const { return set(STRIKE, true); }
    Style underline2() const { return set(UNDERLINE2, true); }
    Style frame() const { return set(FRAME, true); }
    Style encircle() const { return set(ENCIRCLE, true); }
    Style overline() const { return set(OVERLINE, true); }

    // Explicitly disables an attribute.
    Style not_(Attribute attribute) const { return set(attribute, false); }

    Style set(Attribute attribute, bool enabled) const;
    Style color(const Color& color) const;
    Style bgcolor(const Color& color) const;
    Style link(const std::string& url) const;

    // ========== Accessors ==========

    bool is_null() const { return null_; }
    const std::optional<Color>& color() const { return color_; }
    const std::optional<Color>& bgcolor() const { return bgcolor_; }
    const std::optional<std::string>& link() const { return link_; }
    Attributes attributes() const { return attributes_; }
    Attributes set_attributes() const { return set_attributes_; }

    // Attribute value (false when never stated).
    bool has(Attribute attribute) const { return (attributes_ & attribute) != 0; }

    // Whether the attribute was stated explicitly, on or off.
    bool is_set(Attribute attribute) const { return (set_attributes_ & attribute) != 0; }

    // ========== Composition ==========

    /**
     * Overlay `other` on this style.
     *
     * Null operands are identities. Colors and link come from the overlay
     * when present. Attributes the overlay states explicitly replace the
     * base's; the explicit set is the union of both.
     */
    Style combine(const Style& other) const;

    Style operator+(const Style& other) const { return combine(other); }

    // ========== ANSI Rendering ==========

    // SGR parameters: attributes, then foreground, then background.
    std::string make_ansi_codes(ColorSystem system) const;

    /**
     * Split rendering: (prefix, suffix) to wrap already-segmented text.
     * A link wraps the SGR sequence in an OSC 8 open/close pair.
     */
    std::pair<std::string, std::string> render_ansi(ColorSystem system) const;

    // Wrap a whole string; null or empty styles return it unchanged.
    std::string render(const std::string& text, ColorSystem system) const;

    // Canonical definition, e.g. "bold red on white"; "none" for the null style.
    std::string to_string() const;

    bool operator==(const Style& other) const;
    bool operator!=(const Style& other) const { return !(*this == other); }

private:
    static Style parse_uncached(const std::string& definition);

    std::optional<Color> color_;
    std::optional<Color> bgcolor_;
    Attributes attributes_ = 0;
    Attributes set_attributes_ = 0;
    std::optional<std::string> link_;
    bool null_ = false;
};

/**
 * Stack of cumulatively combined styles for nested scopes.
 * The base entry is never popped.
 */
class StyleStack {
public:
    explicit StyleStack(Style base = Style::null());

    const Style& current() const { return stack_.back(); }

    // Push `style` combined with the current style.
    void push(const Style& style);

    // Pop the innermost scope and return the new current style.
    const Style& pop();

    size_t size() const { return stack_.size(); }

    // True when only the base style remains.
    bool empty() const { return stack_.size() <= 1; }

private:
    std::vector<Style> stack_;
};

// ========== Parse Cache ==========

void clear_style_cache();
size_t style_cache_size();

} // namespace rich

#pragma once

/**
 * Terminal color model.
 *
 * A Color is one of four kinds: the terminal default, a 4-bit standard ANSI
 * index, an 8-bit palette index, or a 24-bit RGB triplet. Colors are
 * immutable values; downgrading to a lower-capability color system yields a
 * new Color.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

namespace rich {

/**
 * Terminal color capability, ordered so that `a <= b` means b can display
 * everything a can.
 */
enum class ColorSystem {
    Standard = 1,   // 16 colors
    EightBit = 2,   // 256 colors
    TrueColor = 3   // 24-bit RGB
};

// Name used by the CLI and settings file ("standard", "256", "truecolor").
const char* color_system_name(ColorSystem system);

// Parses a color system name; returns nullopt for anything unrecognized.
std::optional<ColorSystem> parse_color_system(const std::string& name);

enum class ColorType {
    Default,
    Standard,
    EightBit,
    TrueColor
};

/**
 * RGB color triplet with values 0-255.
 */
struct ColorTriplet {
    uint8_t red = 0;
    uint8_t green = 0;
    uint8_t blue = 0;

    // CSS-style "#rrggbb".
    std::string hex() const;

    // CSS-style "rgb(r,g,b)".
    std::string rgb() const;

    // Hue, lightness, saturation, each in [0, 1].
    std::tuple<double, double, double> to_hls() const;

    bool operator==(const ColorTriplet& other) const {
        return red == other.red && green == other.green && blue == other.blue;
    }
    bool operator!=(const ColorTriplet& other) const { return !(*this == other); }
};

/**
 * Error raised when a color string cannot be parsed.
 */
class ColorParseError : public std::runtime_error {
public:
    enum class Kind {
        Empty,
        InvalidHex,
        InvalidColorNumber,
        InvalidRgb,
        UnknownColor
    };

    ColorParseError(Kind kind, const std::string& input);

    Kind kind() const { return kind_; }
    const std::string& input() const { return input_; }

private:
    Kind kind_;
    std::string input_;
};

class Color {
public:
    // The terminal default color.
    Color();

    static Color default_color();

    // Index < 16 gives a Standard color, otherwise EightBit.
    static Color from_ansi(uint8_t number);
    static Color from_triplet(const ColorTriplet& triplet);
    static Color from_rgb(uint8_t red, uint8_t green, uint8_t blue);

    /**
     * Parse a color definition.
     *
     * Accepts "default", "#rrggbb", "#rgb", "color(N)", "rgb(r,g,b)" and the
     * named colors. Input is trimmed and lower-cased first. Results are
     * memoized in a bounded LRU cache.
     *
     * @throws ColorParseError on malformed or unknown input
     */
    static Color parse(const std::string& definition);

    ColorType type() const { return type_; }
    const std::string& name() const { return name_; }
    std::optional<uint8_t> number() const { return number_; }
    std::optional<ColorTriplet> triplet() const { return triplet_; }

    // Native color system (the default color reports Standard).
    ColorSystem system() const;

    bool is_default() const { return type_ == ColorType::Default; }
    bool is_system_defined() const { return type_ == ColorType::Standard; }

    // RGB value, resolving indexed colors through the fixed palettes.
    ColorTriplet get_truecolor() const;

    /**
     * SGR parameters for this color, e.g. {"31"} or {"38", "2", "255", "0", "0"}.
     */
    std::vector<std::string> get_ansi_codes(bool foreground = true) const;

    /**
     * Convert to a color displayable with `target`.
     * A no-op for the default color and for colors already within `target`.
     */
    Color downgrade(ColorSystem target) const;

    // Structural equality; the display name does not participate.
    bool operator==(const Color& other) const;
    bool operator!=(const Color& other) const { return !(*this == other); }

    size_t hash() const;

private:
    static Color parse_uncached(const std::string& normalized);

    std::string name_;
    ColorType type_ = ColorType::Default;
    std::optional<uint8_t> number_;
    std::optional<ColorTriplet> triplet_;
};

// ========== Palettes ==========

const std::array<ColorTriplet, 16>& standard_palette();
const std::array<ColorTriplet, 256>& eight_bit_palette();

// Nearest 256-color index (grayscale ramp or 6x6x6 cube).
uint8_t rgb_to_eight_bit(const ColorTriplet& triplet);

// Nearest 16-color index by weighted RGB distance.
uint8_t rgb_to_standard(const ColorTriplet& triplet);

// ========== Parse Cache ==========

// Drops every memoized color.
void clear_color_cache();

// Entries currently held by the color cache.
size_t color_cache_size();

} // namespace rich

namespace std {
template <>
struct hash<rich::Color> {
    size_t operator()(const rich::Color& color) const { return color.hash(); }
};
} // namespace std

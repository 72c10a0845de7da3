#include "color.hpp"
#include "config.hpp"
#include "parse_cache.hpp"

#include <algorithm>
#include <charconv>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <unordered_map>

namespace rich {

namespace {
    const char* kind_message(ColorParseError::Kind kind) {
        switch (kind) {
            case ColorParseError::Kind::Empty: return "Empty color definition";
            case ColorParseError::Kind::InvalidHex: return "Invalid hex color: ";
            case ColorParseError::Kind::InvalidColorNumber: return "Invalid color number: ";
            case ColorParseError::Kind::InvalidRgb: return "Invalid RGB color: ";
            case ColorParseError::Kind::UnknownColor: return "Unknown color: ";
        }
        return "Invalid color: ";
    }

    LruCache<std::string, Color>& color_cache() {
        static LruCache<std::string, Color> cache(COLOR_CACHE_CAPACITY);
        return cache;
    }

    // Named colors map to palette indices; later palette names shadow the
    // 4-bit "dark_*" aliases.
    const std::unordered_map<std::string, uint8_t>& named_colors() {
        static const std::unordered_map<std::string, uint8_t> names = {
            {"black", 0}, {"red", 1}, {"green", 2}, {"yellow", 3},
            {"blue", 4}, {"magenta", 5}, {"cyan", 6}, {"white", 7},
            {"bright_black", 8}, {"bright_red", 9}, {"bright_green", 10},
            {"bright_yellow", 11}, {"bright_blue", 12}, {"bright_magenta", 13},
            {"bright_cyan", 14}, {"bright_white", 15},
            {"grey", 8}, {"gray", 8}, {"dark_yellow", 3},
            {"navy_blue", 17}, {"dark_blue", 18}, {"blue3", 20}, {"blue1", 21},
            {"dark_green", 22}, {"deep_sky_blue4", 23}, {"dodger_blue3", 26},
            {"dodger_blue2", 27}, {"green4", 28}, {"spring_green4", 29},
            {"turquoise4", 30}, {"deep_sky_blue3", 31}, {"dodger_blue1", 33},
            {"green3", 34}, {"spring_green3", 35}, {"dark_cyan", 36},
            {"light_sea_green", 37}, {"deep_sky_blue2", 38}, {"deep_sky_blue1", 39},
            {"spring_green2", 42}, {"cyan3", 43}, {"dark_turquoise", 44},
            {"turquoise2", 45}, {"green1", 46}, {"spring_green1", 48},
            {"medium_spring_green", 49}, {"cyan2", 50}, {"cyan1", 51},
            {"dark_red", 52}, {"deep_pink4", 53}, {"purple4", 54}, {"purple3", 56},
            {"blue_violet", 57}, {"orange4", 58}, {"grey37", 59},
            {"medium_purple4", 60}, {"slate_blue3", 62}, {"royal_blue1", 63},
            {"chartreuse4", 64}, {"dark_sea_green4", 65}, {"pale_turquoise4", 66},
            {"steel_blue", 67}, {"steel_blue3", 68}, {"cornflower_blue", 69},
            {"chartreuse3", 70}, {"cadet_blue", 72}, {"sky_blue3", 74},
            {"steel_blue1", 75}, {"pale_green3", 77}, {"sea_green3", 78},
            {"aquamarine3", 79}, {"medium_turquoise", 80}, {"chartreuse2", 82},
            {"sea_green2", 83}, {"sea_green1", 85}, {"aquamarine1", 86},
            {"dark_slate_gray2", 87}, {"dark_magenta", 90}, {"light_pink4", 95},
            {"plum4", 96}, {"medium_purple3", 98}, {"slate_blue1", 99},
            {"wheat4", 101}, {"grey53", 102}, {"light_slate_grey", 103},
            {"medium_purple", 104}, {"light_slate_blue", 105},
            {"dark_olive_green3", 107}, {"dark_sea_green", 108},
            {"light_sky_blue3", 110}, {"sky_blue2", 111}, {"dark_sea_green3", 115},
            {"dark_slate_gray3", 116}, {"sky_blue1", 117}, {"chartreuse1", 118},
            {"light_green", 119}, {"pale_green1", 121}, {"dark_slate_gray1", 123},
            {"red3", 124}, {"medium_violet_red", 126}, {"magenta3", 127},
            {"dark_violet", 128}, {"purple", 129}, {"dark_orange3", 130},
            {"indian_red", 131}, {"hot_pink3", 132}, {"medium_orchid3", 133},
            {"medium_orchid", 134}, {"medium_purple2", 135}, {"dark_goldenrod", 136},
            {"light_salmon3", 137}, {"rosy_brown", 138}, {"grey63", 139},
            {"medium_purple1", 141}, {"gold3", 142}, {"dark_khaki", 143},
            {"navajo_white3", 144}, {"grey69", 145}, {"light_steel_blue3", 146},
            {"light_steel_blue", 147}, {"yellow3", 148}, {"light_cyan3", 152},
            {"light_sky_blue1", 153}, {"green_yellow", 154}, {"dark_olive_green2", 155},
            {"dark_sea_green2", 157}, {"dark_sea_green1", 158}, {"pale_turquoise1", 159},
            {"deep_pink3", 162}, {"magenta2", 165}, {"hot_pink2", 169},
            {"orchid", 170}, {"medium_orchid1", 171}, {"orange3", 172},
            {"light_pink3", 174}, {"pink3", 175}, {"plum3", 176}, {"violet", 177},
            {"light_goldenrod3", 179}, {"tan", 180}, {"misty_rose3", 181},
            {"thistle3", 182}, {"plum2", 183}, {"khaki3", 185},
            {"light_goldenrod2", 186}, {"light_yellow3", 187}, {"grey84", 188},
            {"light_steel_blue1", 189}, {"yellow2", 190}, {"dark_olive_green1", 192},
            {"honeydew2", 194}, {"light_cyan1", 195}, {"red1", 196},
            {"deep_pink2", 197}, {"deep_pink1", 199}, {"magenta1", 201},
            {"orange_red1", 202}, {"indian_red1", 204}, {"hot_pink", 206},
            {"dark_orange", 208}, {"salmon1", 209}, {"light_coral", 210},
            {"pale_violet_red1", 211}, {"orchid2", 212}, {"orchid1", 213},
            {"orange1", 214}, {"sandy_brown", 215}, {"light_salmon1", 216},
            {"light_pink1", 217}, {"pink1", 218}, {"plum1", 219}, {"gold1", 220},
            {"navajo_white1", 223}, {"misty_rose1", 224}, {"thistle1", 225},
            {"yellow1", 226}, {"light_goldenrod1", 227}, {"khaki1", 228},
            {"wheat1", 229}, {"cornsilk1", 230}, {"grey100", 231},
            {"grey3", 232}, {"grey7", 233}, {"grey11", 234}, {"grey15", 235},
            {"grey19", 236}, {"grey23", 237}, {"grey27", 238}, {"grey30", 239},
            {"grey35", 240}, {"grey39", 241}, {"grey42", 242}, {"grey46", 243},
            {"grey50", 244}, {"grey54", 245}, {"grey58", 246}, {"grey62", 247},
            {"grey66", 248}, {"grey70", 249}, {"grey74", 250}, {"grey78", 251},
            {"grey82", 252}, {"grey85", 253}, {"grey89", 254}, {"grey93", 255}};
        return names;
    }

    int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    // Parses up to three decimal digits; anything longer is out of range.
    std::optional<int> parse_channel(const std::string& digits) {
        if (digits.empty() || digits.size() > 3) {
            return std::nullopt;
        }
        int value = 0;
        auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (ec != std::errc() || end != digits.data() + digits.size() || value > 255) {
            return std::nullopt;
        }
        return value;
    }

    // Splits "name(a, b, c)" into its comma-separated arguments. Each argument
    // must be a run of digits with optional surrounding whitespace.
    std::optional<std::vector<std::string>> numeric_arguments(const std::string& call,
                                                              const std::string& prefix) {
        if (call.size() <= prefix.size() || call.back() != ')') {
            return std::nullopt;
        }
        std::string inner = call.substr(prefix.size(), call.size() - prefix.size() - 1);

        std::vector<std::string> args;
        size_t start = 0;
        while (true) {
            size_t comma = inner.find(',', start);
            size_t stop = comma == std::string::npos ? inner.size() : comma;

            size_t first = start;
            size_t last = stop;
            while (first < last && std::isspace(static_cast<unsigned char>(inner[first]))) first++;
            while (last > first && std::isspace(static_cast<unsigned char>(inner[last - 1]))) last--;
            if (first == last) {
                return std::nullopt;
            }
            for (size_t i = first; i < last; i++) {
                if (inner[i] < '0' || inner[i] > '9') {
                    return std::nullopt;
                }
            }
            args.push_back(inner.substr(first, last - first));

            if (comma == std::string::npos) {
                break;
            }
            start = comma + 1;
        }
        return args;
    }

    // Weighted RGB distance biased toward human red/blue sensitivity.
    uint32_t color_distance(const ColorTriplet& a, const ColorTriplet& b) {
        uint32_t r1 = a.red, g1 = a.green, b1 = a.blue;
        uint32_t r2 = b.red, g2 = b.green, b2 = b.blue;

        uint32_t red_mean = (r1 + r2) / 2;
        uint32_t red_diff = r1 > r2 ? r1 - r2 : r2 - r1;
        uint32_t green_diff = g1 > g2 ? g1 - g2 : g2 - g1;
        uint32_t blue_diff = b1 > b2 ? b1 - b2 : b2 - b1;

        uint32_t red_weight = ((512 + red_mean) * red_diff * red_diff) >> 8;
        uint32_t green_weight = 4 * green_diff * green_diff;
        uint32_t blue_weight = ((767 - red_mean) * blue_diff * blue_diff) >> 8;

        return red_weight + green_weight + blue_weight;
    }

    bool starts_with(const std::string& s, const char* prefix) {
        return s.rfind(prefix, 0) == 0;
    }
}

// ========== ColorSystem ==========

const char* color_system_name(ColorSystem system) {
    switch (system) {
        case ColorSystem::Standard: return "standard";
        case ColorSystem::EightBit: return "256";
        case ColorSystem::TrueColor: return "truecolor";
    }
    return "standard";
}

std::optional<ColorSystem> parse_color_system(const std::string& name) {
    std::string key = normalize_key(name);
    if (key == "standard" || key == "16") return ColorSystem::Standard;
    if (key == "256" || key == "eight_bit") return ColorSystem::EightBit;
    if (key == "truecolor" || key == "24bit") return ColorSystem::TrueColor;
    return std::nullopt;
}

// ========== ColorTriplet ==========

std::string ColorTriplet::hex() const {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", red, green, blue);
    return buf;
}

std::string ColorTriplet::rgb() const {
    return "rgb(" + std::to_string(red) + "," + std::to_string(green) + "," +
           std::to_string(blue) + ")";
}

std::tuple<double, double, double> ColorTriplet::to_hls() const {
    double r = red / 255.0;
    double g = green / 255.0;
    double b = blue / 255.0;
    double max = std::max({r, g, b});
    double min = std::min({r, g, b});
    double lightness = (max + min) / 2.0;

    if (max == min) {
        return {0.0, lightness, 0.0};
    }

    double delta = max - min;
    double saturation = lightness <= 0.5 ? delta / (max + min) : delta / (2.0 - max - min);

    double hue;
    if (max == r) {
        hue = (g - b) / delta + (g < b ? 6.0 : 0.0);
    } else if (max == g) {
        hue = (b - r) / delta + 2.0;
    } else {
        hue = (r - g) / delta + 4.0;
    }

    return {hue / 6.0, lightness, saturation};
}

// ========== ColorParseError ==========

ColorParseError::ColorParseError(Kind kind, const std::string& input)
    : std::runtime_error(kind == Kind::Empty ? std::string(kind_message(kind))
                                             : kind_message(kind) + input),
      kind_(kind),
      input_(input) {}

// ========== Color ==========

Color::Color() : name_("default") {}

Color Color::default_color() {
    return Color();
}

Color Color::from_ansi(uint8_t number) {
    Color color;
    color.name_ = "color(" + std::to_string(number) + ")";
    color.type_ = number < 16 ? ColorType::Standard : ColorType::EightBit;
    color.number_ = number;
    return color;
}

Color Color::from_triplet(const ColorTriplet& triplet) {
    Color color;
    color.name_ = triplet.hex();
    color.type_ = ColorType::TrueColor;
    color.triplet_ = triplet;
    return color;
}

Color Color::from_rgb(uint8_t red, uint8_t green, uint8_t blue) {
    return from_triplet(ColorTriplet{red, green, blue});
}

Color Color::parse(const std::string& definition) {
    std::string normalized = normalize_key(definition);

    auto& cache = color_cache();
    if (auto cached = cache.get(normalized)) {
        return *cached;
    }

    Color color = parse_uncached(normalized);
    cache.put(normalized, color);
    return color;
}

Color Color::parse_uncached(const std::string& color) {
    if (color.empty()) {
        throw ColorParseError(ColorParseError::Kind::Empty, color);
    }
    if (color == "default") {
        return default_color();
    }

    if (color[0] == '#') {
        std::string digits = color.substr(1);
        bool all_hex = !digits.empty() &&
            std::all_of(digits.begin(), digits.end(), [](char c) { return hex_value(c) >= 0; });
        if (all_hex && digits.size() == 6) {
            return from_rgb(static_cast<uint8_t>(hex_value(digits[0]) * 16 + hex_value(digits[1])),
                            static_cast<uint8_t>(hex_value(digits[2]) * 16 + hex_value(digits[3])),
                            static_cast<uint8_t>(hex_value(digits[4]) * 16 + hex_value(digits[5])));
        }
        if (all_hex && digits.size() == 3) {
            // Shorthand: each digit is duplicated (#f80 -> #ff8800)
            return from_rgb(static_cast<uint8_t>(hex_value(digits[0]) * 17),
                            static_cast<uint8_t>(hex_value(digits[1]) * 17),
                            static_cast<uint8_t>(hex_value(digits[2]) * 17));
        }
        throw ColorParseError(ColorParseError::Kind::InvalidHex, color);
    }

    if (starts_with(color, "color(")) {
        auto args = numeric_arguments(color, "color(");
        if (args && args->size() == 1) {
            if (auto number = parse_channel((*args)[0])) {
                return from_ansi(static_cast<uint8_t>(*number));
            }
        }
        throw ColorParseError(ColorParseError::Kind::InvalidColorNumber, color);
    }

    if (starts_with(color, "rgb(")) {
        auto args = numeric_arguments(color, "rgb(");
        if (args && args->size() == 3) {
            auto r = parse_channel((*args)[0]);
            auto g = parse_channel((*args)[1]);
            auto b = parse_channel((*args)[2]);
            if (r && g && b) {
                return from_rgb(static_cast<uint8_t>(*r), static_cast<uint8_t>(*g),
                                static_cast<uint8_t>(*b));
            }
        }
        throw ColorParseError(ColorParseError::Kind::InvalidRgb, color);
    }

    const auto& names = named_colors();
    auto it = names.find(color);
    if (it != names.end()) {
        Color named = from_ansi(it->second);
        named.name_ = color;
        return named;
    }

    throw ColorParseError(ColorParseError::Kind::UnknownColor, color);
}

ColorSystem Color::system() const {
    switch (type_) {
        case ColorType::Default:
        case ColorType::Standard:
            return ColorSystem::Standard;
        case ColorType::EightBit:
            return ColorSystem::EightBit;
        case ColorType::TrueColor:
            return ColorSystem::TrueColor;
    }
    return ColorSystem::Standard;
}

ColorTriplet Color::get_truecolor() const {
    switch (type_) {
        case ColorType::Default:
            return ColorTriplet{};
        case ColorType::Standard:
            return standard_palette()[number_.value_or(0) % 16];
        case ColorType::EightBit:
            return eight_bit_palette()[number_.value_or(0)];
        case ColorType::TrueColor:
            return triplet_.value_or(ColorTriplet{});
    }
    return ColorTriplet{};
}

std::vector<std::string> Color::get_ansi_codes(bool foreground) const {
    switch (type_) {
        case ColorType::Default:
            return {foreground ? "39" : "49"};
        case ColorType::Standard: {
            int number = number_.value_or(0);
            int code = number < 8 ? (foreground ? 30 : 40) + number
                                  : (foreground ? 82 : 92) + number;
            return {std::to_string(code)};
        }
        case ColorType::EightBit:
            return {foreground ? "38" : "48", "5", std::to_string(number_.value_or(0))};
        case ColorType::TrueColor: {
            ColorTriplet t = triplet_.value_or(ColorTriplet{});
            return {foreground ? "38" : "48", "2", std::to_string(t.red),
                    std::to_string(t.green), std::to_string(t.blue)};
        }
    }
    return {};
}

Color Color::downgrade(ColorSystem target) const {
    if (is_default() || system() <= target) {
        return *this;
    }

    if (type_ == ColorType::TrueColor && target == ColorSystem::EightBit) {
        return from_ansi(rgb_to_eight_bit(get_truecolor()));
    }

    // TrueColor or EightBit down to Standard
    return from_ansi(rgb_to_standard(get_truecolor()));
}

bool Color::operator==(const Color& other) const {
    return type_ == other.type_ && number_ == other.number_ && triplet_ == other.triplet_;
}

size_t Color::hash() const {
    size_t h = static_cast<size_t>(type_);
    if (number_) {
        h = h * 31 + *number_;
    }
    if (triplet_) {
        h = h * 31 + ((static_cast<size_t>(triplet_->red) << 16) |
                      (static_cast<size_t>(triplet_->green) << 8) | triplet_->blue);
    }
    return h;
}

// ========== Palettes ==========

const std::array<ColorTriplet, 16>& standard_palette() {
    static const std::array<ColorTriplet, 16> palette = {{
        {0, 0, 0},        // black
        {170, 0, 0},      // red
        {0, 170, 0},      // green
        {170, 85, 0},     // yellow
        {0, 0, 170},      // blue
        {170, 0, 170},    // magenta
        {0, 170, 170},    // cyan
        {170, 170, 170},  // white
        {85, 85, 85},     // bright black
        {255, 85, 85},    // bright red
        {85, 255, 85},    // bright green
        {255, 255, 85},   // bright yellow
        {85, 85, 255},    // bright blue
        {255, 85, 255},   // bright magenta
        {85, 255, 255},   // bright cyan
        {255, 255, 255},  // bright white
    }};
    return palette;
}

const std::array<ColorTriplet, 256>& eight_bit_palette() {
    static const std::array<ColorTriplet, 256> palette = [] {
        std::array<ColorTriplet, 256> p{};
        const auto& standard = standard_palette();
        std::copy(standard.begin(), standard.end(), p.begin());

        // 6x6x6 color cube (16-231)
        const uint8_t levels[6] = {0, 95, 135, 175, 215, 255};
        for (int r = 0; r < 6; r++) {
            for (int g = 0; g < 6; g++) {
                for (int b = 0; b < 6; b++) {
                    p[16 + r * 36 + g * 6 + b] = ColorTriplet{levels[r], levels[g], levels[b]};
                }
            }
        }

        // Grayscale ramp (232-255)
        for (int i = 0; i < 24; i++) {
            uint8_t gray = static_cast<uint8_t>(8 + i * 10);
            p[232 + i] = ColorTriplet{gray, gray, gray};
        }
        return p;
    }();
    return palette;
}

uint8_t rgb_to_eight_bit(const ColorTriplet& triplet) {
    auto [hue, lightness, saturation] = triplet.to_hls();
    (void)hue;

    // Low saturation maps onto the grayscale ramp
    if (saturation < 0.15) {
        if (lightness < 0.04) {
            return 16;
        }
        if (lightness > 0.96) {
            return 231;
        }
        int gray_index = static_cast<int>(std::round((lightness - 0.04) / 0.92 * 24.0));
        return static_cast<uint8_t>(232 + std::min(gray_index, 23));
    }

    auto quantize = [](uint8_t v) {
        int index = v < 95 ? static_cast<int>(std::round(v / 95.0))
                           : 1 + static_cast<int>(std::round((v - 95.0) / 40.0));
        return std::min(index, 5);
    };

    return static_cast<uint8_t>(16 + quantize(triplet.red) * 36 + quantize(triplet.green) * 6 +
                                quantize(triplet.blue));
}

uint8_t rgb_to_standard(const ColorTriplet& triplet) {
    uint8_t best_index = 0;
    uint32_t best_distance = UINT32_MAX;
    const auto& palette = standard_palette();
    for (size_t i = 0; i < palette.size(); i++) {
        uint32_t distance = color_distance(triplet, palette[i]);
        if (distance < best_distance) {
            best_distance = distance;
            best_index = static_cast<uint8_t>(i);
        }
    }
    return best_index;
}

// ========== Parse Cache ==========

void clear_color_cache() {
    color_cache().clear();
}

size_t color_cache_size() {
    return color_cache().size();
}

} // namespace rich

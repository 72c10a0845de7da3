#include "style.hpp"
#include "config.hpp"
#include "parse_cache.hpp"

#include <sstream>

namespace rich {

namespace {
    struct AttributeInfo {
        Attribute bit;
        const char* name;
        int sgr;
    };

    // Bit order, canonical name and SGR code for each attribute.
    const AttributeInfo kAttributeTable[ATTRIBUTE_COUNT] = {
        {BOLD, "bold", 1},
        {DIM, "dim", 2},
        {ITALIC, "italic", 3},
        {UNDERLINE, "underline", 4},
        {BLINK, "blink", 5},
        {BLINK2, "blink2", 6},
        {REVERSE, "reverse", 7},
        {CONCEAL, "conceal", 8},
        {STRIKE, "strike", 9},
        {UNDERLINE2, "underline2", 21},
        {FRAME, "frame", 51},
        {ENCIRCLE, "encircle", 52},
        {OVERLINE, "overline", 53},
    };

    const char* kind_prefix(StyleParseError::Kind kind) {
        switch (kind) {
            case StyleParseError::Kind::InvalidFormat: return "Invalid style format: ";
            case StyleParseError::Kind::UnknownAttribute: return "Unknown attribute: ";
            case StyleParseError::Kind::UnknownToken: return "Unknown token: ";
            case StyleParseError::Kind::ColorError: return "Color error: ";
        }
        return "Invalid style: ";
    }

    LruCache<std::string, Style>& style_cache() {
        static LruCache<std::string, Style> cache(STYLE_CACHE_CAPACITY);
        return cache;
    }

    std::string to_lower(std::string s) {
        for (char& c : s) {
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c - 'A' + 'a');
            }
        }
        return s;
    }

    std::vector<std::string> split_whitespace(const std::string& s) {
        std::vector<std::string> words;
        std::istringstream stream(s);
        std::string word;
        while (stream >> word) {
            words.push_back(word);
        }
        return words;
    }

    // Cache key: case-insensitive, except that link URLs keep their case.
    std::string cache_key(const std::string& definition) {
        std::string key = normalize_key(definition);
        for (const auto& word : split_whitespace(key)) {
            if (word == "link") {
                std::string trimmed = definition;
                size_t start = trimmed.find_first_not_of(" \t\n\r\f\v");
                size_t end = trimmed.find_last_not_of(" \t\n\r\f\v");
                return trimmed.substr(start, end - start + 1);
            }
        }
        return key;
    }

    // Color forms that should report their own error rather than UnknownToken.
    bool looks_like_color_literal(const std::string& word) {
        return word[0] == '#' || word.rfind("color(", 0) == 0 || word.rfind("rgb(", 0) == 0;
    }
}

std::optional<Attribute> parse_attribute(const std::string& name) {
    if (name == "b") return BOLD;
    if (name == "d") return DIM;
    if (name == "i") return ITALIC;
    if (name == "u") return UNDERLINE;
    if (name == "r") return REVERSE;
    if (name == "c") return CONCEAL;
    if (name == "s") return STRIKE;
    if (name == "uu") return UNDERLINE2;
    if (name == "o") return OVERLINE;
    for (const auto& info : kAttributeTable) {
        if (name == info.name) {
            return info.bit;
        }
    }
    return std::nullopt;
}

const char* attribute_name(Attribute attribute) {
    for (const auto& info : kAttributeTable) {
        if (info.bit == attribute) {
            return info.name;
        }
    }
    return "";
}

// ========== StyleParseError ==========

StyleParseError::StyleParseError(Kind kind, const std::string& detail)
    : std::runtime_error(kind_prefix(kind) + detail), kind_(kind), detail_(detail) {}

StyleParseError::StyleParseError(const ColorParseError& color_error)
    : std::runtime_error(std::string(kind_prefix(Kind::ColorError)) + color_error.what()),
      kind_(Kind::ColorError),
      detail_(color_error.input()),
      color_kind_(color_error.kind()) {}

// ========== Style ==========

Style Style::null() {
    Style style;
    style.null_ = true;
    return style;
}

Style Style::set(Attribute attribute, bool enabled) const {
    Style style = *this;
    if (enabled) {
        style.attributes_ |= attribute;
    } else {
        style.attributes_ &= static_cast<Attributes>(~attribute);
    }
    style.set_attributes_ |= attribute;
    style.null_ = false;
    return style;
}

Style Style::color(const Color& color) const {
    Style style = *this;
    style.color_ = color;
    style.null_ = false;
    return style;
}

Style Style::bgcolor(const Color& color) const {
    Style style = *this;
    style.bgcolor_ = color;
    style.null_ = false;
    return style;
}

Style Style::link(const std::string& url) const {
    Style style = *this;
    style.link_ = url;
    style.null_ = false;
    return style;
}

Style Style::combine(const Style& other) const {
    if (other.null_) {
        return *this;
    }
    if (null_) {
        return other;
    }

    Style result;
    result.color_ = other.color_ ? other.color_ : color_;
    result.bgcolor_ = other.bgcolor_ ? other.bgcolor_ : bgcolor_;
    result.link_ = other.link_ ? other.link_ : link_;
    result.attributes_ = static_cast<Attributes>((attributes_ & ~other.set_attributes_) |
                                                 (other.attributes_ & other.set_attributes_));
    result.set_attributes_ = static_cast<Attributes>(set_attributes_ | other.set_attributes_);
    return result;
}

std::string Style::make_ansi_codes(ColorSystem system) const {
    std::string codes;
    auto append = [&codes](const std::string& code) {
        if (!codes.empty()) {
            codes += ';';
        }
        codes += code;
    };

    for (const auto& info : kAttributeTable) {
        if (attributes_ & info.bit) {
            append(std::to_string(info.sgr));
        }
    }
    if (color_) {
        for (const auto& code : color_->downgrade(system).get_ansi_codes(true)) {
            append(code);
        }
    }
    if (bgcolor_) {
        for (const auto& code : bgcolor_->downgrade(system).get_ansi_codes(false)) {
            append(code);
        }
    }
    return codes;
}

std::pair<std::string, std::string> Style::render_ansi(ColorSystem system) const {
    if (null_) {
        return {"", ""};
    }

    std::string codes = make_ansi_codes(system);
    if (codes.empty() && !link_) {
        return {"", ""};
    }

    std::string prefix;
    std::string suffix;
    if (link_) {
        prefix += "\033]8;;" + *link_ + "\033\\";
    }
    if (!codes.empty()) {
        prefix += "\033[" + codes + "m";
        suffix += "\033[0m";
    }
    if (link_) {
        suffix += "\033]8;;\033\\";
    }
    return {prefix, suffix};
}

std::string Style::render(const std::string& text, ColorSystem system) const {
    auto [prefix, suffix] = render_ansi(system);
    if (prefix.empty()) {
        return text;
    }
    return prefix + text + suffix;
}

std::string Style::to_string() const {
    if (null_) {
        return "none";
    }

    std::string result;
    auto append = [&result](const std::string& part) {
        if (!result.empty()) {
            result += ' ';
        }
        result += part;
    };

    for (const auto& info : kAttributeTable) {
        if (!(set_attributes_ & info.bit)) {
            continue;
        }
        if (attributes_ & info.bit) {
            append(info.name);
        } else {
            append(std::string("not ") + info.name);
        }
    }
    if (color_) {
        append(color_->name());
    }
    if (bgcolor_) {
        append("on " + bgcolor_->name());
    }
    if (link_) {
        append("link " + *link_);
    }
    return result;
}

bool Style::operator==(const Style& other) const {
    return null_ == other.null_ && color_ == other.color_ && bgcolor_ == other.bgcolor_ &&
           attributes_ == other.attributes_ && set_attributes_ == other.set_attributes_ &&
           link_ == other.link_;
}

Style Style::parse(const std::string& definition) {
    std::string key = cache_key(definition);

    auto& cache = style_cache();
    if (auto cached = cache.get(key)) {
        return *cached;
    }

    Style style = parse_uncached(definition);
    cache.put(key, style);
    return style;
}

Style Style::parse_uncached(const std::string& definition) {
    std::vector<std::string> words = split_whitespace(definition);
    if (words.empty()) {
        return null();
    }
    if (words.size() == 1 && to_lower(words[0]) == "none") {
        return null();
    }

    Style result;
    size_t i = 0;
    while (i < words.size()) {
        std::string word = to_lower(words[i]);

        if (word == "not") {
            if (i + 1 >= words.size()) {
                throw StyleParseError(StyleParseError::Kind::InvalidFormat,
                                      "'not' requires an attribute");
            }
            std::string name = to_lower(words[i + 1]);
            auto attribute = parse_attribute(name);
            if (!attribute) {
                throw StyleParseError(StyleParseError::Kind::UnknownAttribute, name);
            }
            result = result.not_(*attribute);
            i += 2;
            continue;
        }

        if (word == "on") {
            if (i + 1 >= words.size()) {
                throw StyleParseError(StyleParseError::Kind::InvalidFormat, "'on' requires a color");
            }
            try {
                result = result.bgcolor(Color::parse(words[i + 1]));
            } catch (const ColorParseError& e) {
                throw StyleParseError(e);
            }
            i += 2;
            continue;
        }

        if (word == "link") {
            if (i + 1 >= words.size()) {
                throw StyleParseError(StyleParseError::Kind::InvalidFormat, "'link' requires a URL");
            }
            result = result.link(words[i + 1]);
            i += 2;
            continue;
        }

        if (auto attribute = parse_attribute(word)) {
            result = result.set(*attribute, true);
            i++;
            continue;
        }

        try {
            result = result.color(Color::parse(word));
        } catch (const ColorParseError& e) {
            if (looks_like_color_literal(word)) {
                throw StyleParseError(e);
            }
            throw StyleParseError(StyleParseError::Kind::UnknownToken, word);
        }
        i++;
    }

    return result;
}

// ========== StyleStack ==========

StyleStack::StyleStack(Style base) {
    stack_.push_back(std::move(base));
}

void StyleStack::push(const Style& style) {
    stack_.push_back(current().combine(style));
}

const Style& StyleStack::pop() {
    if (stack_.size() > 1) {
        stack_.pop_back();
    }
    return current();
}

// ========== Parse Cache ==========

void clear_style_cache() {
    style_cache().clear();
}

size_t style_cache_size() {
    return style_cache().size();
}

} // namespace rich

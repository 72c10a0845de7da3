#include "console.hpp"
#include "terminal.hpp"
#include "verbose.hpp"

#ifdef _WIN32
#include <windows.h>
#endif

namespace rich {

Console::Console()
    : color_system_(terminal::detect_color_system()),
      width_(static_cast<size_t>(terminal::get_width())),
      out_(&std::cout) {
    enable_colors();
    if (!terminal::is_tty()) {
        color_system_ = std::nullopt;
    }
}

Console::Console(std::optional<ColorSystem> color_system, size_t width, std::ostream& out)
    : color_system_(color_system), width_(width == 0 ? 1 : width), out_(&out) {}

void Console::enable_colors() {
#ifdef _WIN32
    // Enable ANSI escape codes on Windows 10+
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut != INVALID_HANDLE_VALUE) {
        DWORD mode = 0;
        if (GetConsoleMode(hOut, &mode)) {
            mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
            SetConsoleMode(hOut, mode);
        }
    }
#endif
}

Style Console::get_style(const std::string& name) const {
    if (auto style = theme_.get(name)) {
        return *style;
    }
    return Style::parse(name);
}

// ========== Rendering ==========

std::string Console::control_sequence(const ControlCode& code, const std::string& payload) {
    auto param = [&code](size_t index, int fallback) {
        return index < code.params.size() ? code.params[index] : fallback;
    };

    switch (code.type) {
        case ControlType::Bell:               return "\007";
        case ControlType::CarriageReturn:     return "\r";
        case ControlType::Home:               return terminal::cursor::home();
        case ControlType::Clear:              return terminal::clear::screen();
        case ControlType::ShowCursor:         return terminal::cursor::show();
        case ControlType::HideCursor:         return terminal::cursor::hide();
        case ControlType::EnableAltScreen:    return terminal::enable_alt_screen();
        case ControlType::DisableAltScreen:   return terminal::disable_alt_screen();
        case ControlType::CursorUp:           return terminal::cursor::up(param(0, 1));
        case ControlType::CursorDown:         return terminal::cursor::down(param(0, 1));
        case ControlType::CursorForward:      return terminal::cursor::forward(param(0, 1));
        case ControlType::CursorBackward:     return terminal::cursor::backward(param(0, 1));
        case ControlType::CursorMoveToColumn: return terminal::cursor::column(param(0, 0) + 1);
        case ControlType::CursorMoveTo:       return terminal::cursor::move_to(param(0, 0), param(1, 0));
        case ControlType::EraseInLine:        return terminal::clear::in_line(param(0, 2));
        case ControlType::SetWindowTitle:     return terminal::set_title(payload);
    }
    return "";
}

std::string Console::render_segments(const std::vector<Segment>& segments) const {
    std::string output;

    for (const auto& seg : segments) {
        if (seg.is_control()) {
            for (const auto& code : *seg.control) {
                output += control_sequence(code, seg.text);
            }
            continue;
        }

        if (!color_system_ || !seg.style) {
            output += seg.text;
            continue;
        }
        output += seg.style->render(seg.text, *color_system_);
    }

    return output;
}

std::vector<Segment> Console::render_text(const Text& text) const {
    std::vector<Segment> segments;
    std::vector<Text> lines = text.wrap(width_);

    for (size_t i = 0; i < lines.size(); i++) {
        std::vector<Segment> rendered = lines[i].render();
        segments.insert(segments.end(), rendered.begin(), rendered.end());
        if (i + 1 < lines.size()) {
            segments.push_back(Segment::line());
        }
    }
    if (!text.end.empty()) {
        segments.emplace_back(text.end);
    }

    return segment::simplify(segments);
}

std::string Console::render_markup(const std::string& markup) const {
    Text text = strict_ ? markup::render(markup, &theme_) : markup::render_or_plain(markup, &theme_);
    return render_segments(render_text(text));
}

// ========== Output ==========

void Console::print(const std::string& markup) const {
    *out_ << render_markup(markup);
}

void Console::print_text(const Text& text) const {
    *out_ << render_segments(render_text(text));
}

void Console::print_segments(const std::vector<Segment>& segments) const {
    *out_ << render_segments(segments);
}

void Console::control(const std::vector<ControlCode>& codes, const std::string& payload) const {
    if (!color_system_) {
        verbose_log("CONSOLE", "Skipping control codes on a terminal without ANSI support");
        return;
    }
    *out_ << render_segments({Segment::control_codes(codes, payload)}) << std::flush;
}

void Console::print_themed(const std::string& style_name, const std::string& text) const {
    Style style = theme_.get(style_name).value_or(Style());
    print_text(Text::styled(text, style));
}

void Console::print_error(const std::string& text) const {
    print_themed("error", text);
}

void Console::print_warning(const std::string& text) const {
    print_themed("warning", text);
}

void Console::print_success(const std::string& text) const {
    print_themed("success", text);
}

void Console::print_info(const std::string& text) const {
    print_themed("info", text);
}

void Console::flush() const {
    *out_ << std::flush;
}

} // namespace rich

#include "ui/widgets/StatusBar.hpp"
#include "ui/Formatting.hpp"
#include <format>

namespace lyre::ui::widgets {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

StatusBar::StatusBar(const std::optional<std::string>& accent) {
    if (accent) {
        accent_ = accent_escape(*accent);
    }
}

std::optional<std::string> StatusBar::accent_escape(const std::string& hex) {
    if (hex.size() != 7 || hex[0] != '#') {
        return std::nullopt;
    }
    int rgb[3];
    for (int i = 0; i < 3; ++i) {
        int hi = hex_digit(hex[1 + 2 * i]);
        int lo = hex_digit(hex[2 + 2 * i]);
        if (hi < 0 || lo < 0) return std::nullopt;
        rgb[i] = hi * 16 + lo;
    }
    return std::format("\033[38;2;{};{};{}m", rgb[0], rgb[1], rgb[2]);
}

std::string StatusBar::render(const StatusView& view, int width) const {
    if (view.alert) {
        return "\033[1;33m" + trunc_pad("! " + *view.alert, width) + "\033[0m";
    }

    // LEFT SIDE: state + track
    std::string icon = view.paused ? "⏸" : "▶";
    if (accent_) {
        icon = *accent_ + icon + "\033[0m";
    }
    std::string left = icon + " " + (view.title.empty() ? std::string("nothing playing") : view.title);

    // RIGHT SIDE: flags, time, volume
    std::string right;
    if (view.resampling) right += "~ ";
    if (view.shuffle) right += "shuf ";
    if (view.elapsed) {
        right += format_time(*view.elapsed);
        right += " / ";
        right += view.duration ? format_time(*view.duration) : std::string("--:--");
        right += " ";
    }
    right += view.muted ? std::string("vol muted") : std::format("vol {}%", view.volume);

    return lr_align(width, left, right);
}

}  // namespace lyre::ui::widgets

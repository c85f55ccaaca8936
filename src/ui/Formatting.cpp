#include "ui/Formatting.hpp"
#include <algorithm>
#include <format>

namespace lyre::ui {

namespace {

// Length of the CSI escape (ESC [ ... final) starting at i, or 0
size_t escape_length(const std::string& s, size_t i) {
    if (s[i] != '\x1B' || i + 1 >= s.size() || s[i + 1] != '[') {
        return 0;
    }
    size_t j = i + 2;
    while (j < s.size() && (s[j] < '@' || s[j] > '~')) {
        ++j;
    }
    return j < s.size() ? j + 1 - i : s.size() - i;
}

// Byte length of the UTF-8 sequence starting at i; stray bytes count as one
size_t glyph_length(const std::string& s, size_t i) {
    const unsigned char c = static_cast<unsigned char>(s[i]);
    size_t len = 1;
    if ((c & 0xE0) == 0xC0) len = 2;
    else if ((c & 0xF0) == 0xE0) len = 3;
    else if ((c & 0xF8) == 0xF0) len = 4;
    return i + len <= s.size() ? len : 1;
}

}  // namespace

int display_cols(const std::string& s) {
    int cols = 0;
    size_t i = 0;
    while (i < s.size()) {
        if (size_t esc = escape_length(s, i)) {
            i += esc;
            continue;
        }
        i += glyph_length(s, i);
        ++cols;
    }
    return cols;
}

std::string take_cols(const std::string& s, int cols) {
    if (cols <= 0) return "";

    std::string out;
    out.reserve(s.size());
    int seen = 0;
    size_t i = 0;
    while (i < s.size() && seen < cols) {
        // Escapes are kept so colors survive truncation
        size_t len = escape_length(s, i);
        if (len == 0) {
            len = glyph_length(s, i);
            ++seen;
        }
        out.append(s, i, len);
        i += len;
    }
    return out;
}

std::string trunc_pad(const std::string& s, int w) {
    if (w <= 0) return "";

    const int cols = display_cols(s);
    if (cols <= w) {
        return s + std::string(w - cols, ' ');
    }
    if (w == 1) {
        return take_cols(s, 1);
    }
    return take_cols(s, w - 1) + "…";
}

std::string lr_align(int width, const std::string& left, const std::string& right) {
    if (width <= 0) return "";

    const int right_cols = display_cols(right);
    // At least one space between the two sides
    const int left_max = std::max(0, width - right_cols - 1);

    std::string l = trunc_pad(left, left_max);
    const int gap = std::max(0, width - display_cols(l) - right_cols);
    return l + std::string(gap, ' ') + right;
}

std::string format_time(double seconds) {
    if (seconds < 0.0) seconds = 0.0;
    const long total = static_cast<long>(seconds);
    const long hours = total / 3600;
    const long minutes = (total / 60) % 60;
    const long secs = total % 60;
    if (hours > 0) {
        return std::format("{}:{:02}:{:02}", hours, minutes, secs);
    }
    return std::format("{}:{:02}", minutes, secs);
}

}  // namespace lyre::ui

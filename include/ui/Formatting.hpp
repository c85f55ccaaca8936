#pragma once

#include <string>

namespace lyre::ui {

// Column helpers for the status line. Every UTF-8 code point counts as one
// column; CSI escape sequences (colors) count as none.

int display_cols(const std::string& s);

// First `width` columns of s, escapes included
std::string take_cols(const std::string& s, int width);

// Exactly `width` columns: padded with spaces, or cut with a trailing "…"
std::string trunc_pad(const std::string& s, int width);

// left and right pushed to opposite edges of `width` columns; left is
// truncated first. lr_align(20, "song", "1:02") -> "song            1:02"
std::string lr_align(int width, const std::string& left, const std::string& right);

// "m:ss", or "h:mm:ss" from an hour up
std::string format_time(double seconds);

}  // namespace lyre::ui

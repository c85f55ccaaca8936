#pragma once

#include <optional>
#include <string>

namespace lyre::ui::widgets {

// Everything the status line shows, gathered once per tick
struct StatusView {
    bool paused = true;
    bool muted = false;
    bool shuffle = false;
    bool resampling = false;
    int volume = 0;
    std::optional<double> elapsed;
    std::optional<double> duration;
    std::string title;  // empty when nothing is loaded
    std::optional<std::string> alert;
};

class StatusBar {
public:
    // accent: "#rrggbb", applied to the play state icon; ignored if malformed
    explicit StatusBar(const std::optional<std::string>& accent = std::nullopt);

    // One line, exactly width display columns (plus escape codes)
    [[nodiscard]] std::string render(const StatusView& view, int width) const;

    // "#rrggbb" -> truecolor foreground escape
    [[nodiscard]] static std::optional<std::string> accent_escape(const std::string& hex);

private:
    std::optional<std::string> accent_;
};

}  // namespace lyre::ui::widgets

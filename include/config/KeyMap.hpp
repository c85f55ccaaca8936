#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace lyre::config {

enum class Action {
    TogglePause,
    Next,
    Last,
    ToggleMute,
    VolumeUp,
    VolumeDown,
    SeekForward,
    SeekBackward,
    Restart,
    ToggleShuffle,
    Quit,
};

class KeyMap {
public:
    KeyMap();

    void load_default_keybinds();
    // key_name as produced by ui::InputEvent ("space", "n", "+", "right", ...)
    [[nodiscard]] std::optional<Action> lookup_action(const std::string& key_name) const;

private:
    std::unordered_map<std::string, Action> bindings_;
};

[[nodiscard]] const char* action_name(Action action);

}  // namespace lyre::config

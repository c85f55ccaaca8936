#include "config/KeyMap.hpp"

namespace lyre::config {

KeyMap::KeyMap() {
    load_default_keybinds();
}

void KeyMap::load_default_keybinds() {
    bindings_["space"] = Action::TogglePause;
    bindings_["n"] = Action::Next;
    bindings_["p"] = Action::Last;
    bindings_["m"] = Action::ToggleMute;
    bindings_["+"] = Action::VolumeUp;
    bindings_["="] = Action::VolumeUp;
    bindings_["-"] = Action::VolumeDown;
    bindings_["l"] = Action::SeekForward;
    bindings_["right"] = Action::SeekForward;
    bindings_["h"] = Action::SeekBackward;
    bindings_["left"] = Action::SeekBackward;
    bindings_["r"] = Action::Restart;
    bindings_["s"] = Action::ToggleShuffle;
    bindings_["q"] = Action::Quit;
}

std::optional<Action> KeyMap::lookup_action(const std::string& key_name) const {
    auto it = bindings_.find(key_name);
    if (it != bindings_.end()) {
        return it->second;
    }
    return std::nullopt;
}

const char* action_name(Action action) {
    switch (action) {
        case Action::TogglePause: return "toggle_pause";
        case Action::Next: return "next";
        case Action::Last: return "last";
        case Action::ToggleMute: return "toggle_mute";
        case Action::VolumeUp: return "volume_up";
        case Action::VolumeDown: return "volume_down";
        case Action::SeekForward: return "seek_forward";
        case Action::SeekBackward: return "seek_backward";
        case Action::Restart: return "restart";
        case Action::ToggleShuffle: return "toggle_shuffle";
        case Action::Quit: return "quit";
    }
    return "unknown";
}

}  // namespace lyre::config

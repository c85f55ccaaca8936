#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace lyre::backend {

// What survives a restart
struct SessionState {
    int volume = 50;
    bool muted = false;
    bool shuffle = true;
    std::optional<std::string> queue;
    std::optional<std::string> track;
    int elapsed = 0;  // whole seconds into track
};

class StateStore {
public:
    // Defaults when the file is missing or unreadable
    static SessionState load();
    static SessionState load_from_file(const std::filesystem::path& path);

    static bool save(const SessionState& state);
    // Writes to a temp file and renames so a crash never leaves half a file
    static bool save_to_file(const SessionState& state, const std::filesystem::path& path);

    static std::filesystem::path get_state_file();
};

}  // namespace lyre::backend

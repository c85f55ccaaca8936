#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lyre::backend {

struct Config {
    // Playback settings
    int volume_step = 5;
    int seek_seconds = 5;
    int output_rate = 48000;

    // UI settings
    std::optional<std::string> accent;

    // Directories offered as queues
    std::vector<std::filesystem::path> lists;
};

class ConfigLoader {
public:
    using EntryHandler = std::function<void(const std::string& section,
                                            const std::string& key,
                                            const std::string& value)>;

    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static bool save_config(const Config& cfg, const std::filesystem::path& path);

    // ~/.config/lyre
    static std::filesystem::path get_config_dir();

    // Parses a "[section]\nkey = value" file, calling handler per entry with
    // whitespace trimmed and surrounding quotes removed. False if unreadable.
    static bool for_each_entry(const std::filesystem::path& path, const EntryHandler& handler);

    // Lenient integer parse; fallback when the value isn't a number
    static int parse_int(const std::string& value, int fallback);

private:
    static std::filesystem::path get_config_file();
};

}  // namespace lyre::backend

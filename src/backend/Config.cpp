#include "backend/Config.hpp"
#include "util/Logger.hpp"
#include <charconv>
#include <cstdlib>
#include <fstream>

namespace lyre::backend {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

std::filesystem::path expand_home(const std::string& value) {
    if (value.starts_with("~/")) {
        if (const char* home = std::getenv("HOME")) {
            return std::filesystem::path(home) / value.substr(2);
        }
    }
    return value;
}

}  // namespace

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    std::error_code ec;
    if (!std::filesystem::exists(config_file, ec)) {
        util::Logger::info("Config: No config at " + config_file.string() + ", using defaults");
        return Config{};
    }
    return load_from_file(config_file);
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    Config cfg;
    bool ok = for_each_entry(path, [&cfg](const std::string& section,
                                          const std::string& key,
                                          const std::string& value) {
        if (section == "playback") {
            if (key == "volume_step") cfg.volume_step = parse_int(value, cfg.volume_step);
            else if (key == "seek_seconds") cfg.seek_seconds = parse_int(value, cfg.seek_seconds);
            else if (key == "output_rate") cfg.output_rate = parse_int(value, cfg.output_rate);
        }
        else if (section == "ui") {
            if (key == "accent" && !value.empty()) cfg.accent = value;
        }
        else if (section == "paths") {
            if (key == "list" && !value.empty()) cfg.lists.push_back(expand_home(value));
        }
        else {
            util::Logger::debug("Config: Ignoring [" + section + "] " + key);
        }
    });

    if (!ok) {
        util::Logger::warn("Config: Could not read " + path.string() + ", using defaults");
    }

    if (cfg.output_rate <= 0) {
        util::Logger::warn("Config: Invalid output_rate, using 48000");
        cfg.output_rate = 48000;
    }
    return cfg;
}

bool ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration");

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);

    std::ofstream file(path);
    if (!file) {
        util::Logger::error("Config: Cannot write " + path.string());
        return false;
    }

    file << "# lyre config\n\n";

    file << "[playback]\n";
    file << "# Volume change per keypress (0-100 scale)\n";
    file << "volume_step = " << cfg.volume_step << "\n";
    file << "# Seek distance in seconds\n";
    file << "seek_seconds = " << cfg.seek_seconds << "\n";
    file << "# Device sample rate; sources at other rates are resampled\n";
    file << "output_rate = " << cfg.output_rate << "\n\n";

    file << "[ui]\n";
    if (cfg.accent) {
        file << "accent = \"" << *cfg.accent << "\"\n\n";
    } else {
        file << "# accent = \"#89b4fa\"\n\n";
    }

    file << "[paths]\n";
    if (cfg.lists.empty()) {
        file << "# list = \"~/Music\"\n";
    }
    for (const auto& list : cfg.lists) {
        file << "list = \"" << list.string() << "\"\n";
    }
    return static_cast<bool>(file);
}

bool ConfigLoader::for_each_entry(const std::filesystem::path& path, const EntryHandler& handler) {
    std::ifstream file(path);
    if (!file) return false;

    std::string line, current_section;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            util::Logger::debug("Config: Skipping malformed line: " + line);
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        handler(current_section, key, value);
    }
    return true;
}

int ConfigLoader::parse_int(const std::string& value, int fallback) {
    int result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        util::Logger::warn("Config: Not a number: \"" + value + "\"");
        return fallback;
    }
    return result;
}

std::filesystem::path ConfigLoader::get_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "lyre";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".config" / "lyre";
    }
    return ".config/lyre";
}

std::filesystem::path ConfigLoader::get_config_file() {
    return get_config_dir() / "config.toml";
}

}  // namespace lyre::backend

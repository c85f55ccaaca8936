#include "backend/StateStore.hpp"
#include "backend/Config.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <fstream>

namespace lyre::backend {

SessionState StateStore::load() {
    return load_from_file(get_state_file());
}

SessionState StateStore::load_from_file(const std::filesystem::path& path) {
    SessionState state;

    bool ok = ConfigLoader::for_each_entry(path, [&state](const std::string&,
                                                          const std::string& key,
                                                          const std::string& value) {
        if (key == "volume") state.volume = std::clamp(ConfigLoader::parse_int(value, state.volume), 0, 100);
        else if (key == "muted") state.muted = (value == "true");
        else if (key == "shuffle") state.shuffle = (value == "true");
        else if (key == "queue" && !value.empty()) state.queue = value;
        else if (key == "track" && !value.empty()) state.track = value;
        else if (key == "elapsed") state.elapsed = std::max(0, ConfigLoader::parse_int(value, 0));
    });

    if (ok) {
        util::Logger::info("StateStore: Loaded state from " + path.string());
    } else {
        util::Logger::info("StateStore: No saved state, using defaults");
    }
    return state;
}

bool StateStore::save(const SessionState& state) {
    return save_to_file(state, get_state_file());
}

bool StateStore::save_to_file(const SessionState& state, const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            util::Logger::error("StateStore: Cannot write " + tmp.string());
            return false;
        }

        file << "volume = " << state.volume << "\n";
        file << "muted = " << (state.muted ? "true" : "false") << "\n";
        file << "shuffle = " << (state.shuffle ? "true" : "false") << "\n";
        if (state.queue) file << "queue = \"" << *state.queue << "\"\n";
        if (state.track) file << "track = \"" << *state.track << "\"\n";
        file << "elapsed = " << state.elapsed << "\n";

        if (!file.flush()) {
            util::Logger::error("StateStore: Write failed for " + tmp.string());
            return false;
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        util::Logger::error("StateStore: Rename failed: " + ec.message());
        return false;
    }
    util::Logger::debug("StateStore: Saved state");
    return true;
}

std::filesystem::path StateStore::get_state_file() {
    return ConfigLoader::get_config_dir() / "state.toml";
}

}  // namespace lyre::backend

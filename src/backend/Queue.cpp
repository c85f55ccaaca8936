#include "backend/Queue.hpp"
#include "backend/MetadataParser.hpp"
#include "backend/QueueError.hpp"
#include "backend/StateStore.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include "util/TimSort.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace lyre::backend {

Queue::Queue() : rng_(std::random_device{}()) {}

Queue Queue::with_state(const SessionState& state) {
    Queue q;
    q.shuffle_ = state.shuffle;

    if (!state.queue) {
        return q;
    }

    std::error_code ec;
    if (!fs::is_directory(*state.queue, ec)) {
        util::Logger::warn("Queue: Saved queue path no longer exists: " + *state.queue);
        return q;
    }

    try {
        q.queue(*state.queue);
    } catch (const QueueError& e) {
        util::Logger::warn(std::string("Queue: Could not restore queue: ") + e.what());
        return q;
    }

    if (state.track) {
        for (size_t i = 0; i < q.tracks_.size(); ++i) {
            if (q.tracks_[i] == *state.track) {
                q.current_ = i;
                break;
            }
        }
        if (q.current_) {
            q.history_.push(*q.current_);
        } else {
            util::Logger::info("Queue: Saved track is not in the queue: " + *state.track);
        }
    }
    return q;
}

std::vector<model::Track> Queue::read_directory(const std::string& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        throw QueueError::not_a_directory(path);
    }

    // Scanner returns paths sorted, which makes the tag sort deterministic
    auto files = util::DirectoryScanner::scan_audio_files(path);

    std::vector<model::Track> tracks;
    tracks.reserve(files.size());
    for (const auto& file : files) {
        try {
            tracks.push_back(MetadataParser::parse_file(file));
        } catch (const QueueError& e) {
            // Raced with a delete or a rename; skip it
            util::Logger::debug(std::string("Queue: Skipping ") + e.what());
        }
    }

    util::timsort(tracks, [](const model::Track& a, const model::Track& b) {
        return model::Track::compare(a, b) < 0;
    });

    util::Logger::info("Queue: Read " + std::to_string(tracks.size()) + " tracks from " + path);
    return tracks;
}

void Queue::queue(const std::string& path) {
    auto tracks = read_directory(path);

    tracks_ = std::move(tracks);
    path_ = path;
    current_.reset();
    history_.clear();
    stalled_ = false;
}

const model::Track* Queue::track() const {
    if (current_ && *current_ < tracks_.size()) {
        return &tracks_[*current_];
    }
    return nullptr;
}

bool Queue::replace(size_t index, Playable& player) {
    if (!player.replace(tracks_[index])) {
        util::Logger::warn("Queue: Player refused index " + std::to_string(index) + ", staying put");
        return false;
    }
    current_ = index;
    util::Logger::debug("Queue: Playing index " + std::to_string(index));
    return true;
}

void Queue::select_idx(size_t index, Playable& player) {
    if (tracks_.empty()) {
        throw QueueError::no_tracks();
    }
    if (index >= tracks_.size()) {
        throw QueueError::out_of_bounds();
    }
    if (replace(index, player)) {
        history_.clear();
    }
}

void Queue::select_path(const std::string& path, Playable& player) {
    for (size_t i = 0; i < tracks_.size(); ++i) {
        if (tracks_[i] == path) {
            if (replace(i, player)) {
                history_.clear();
            }
            return;
        }
    }
    throw QueueError::no_track(path);
}

std::optional<size_t> Queue::next_track_sequential() const {
    if (tracks_.empty()) {
        return std::nullopt;
    }
    return current_ ? (*current_ + 1) % tracks_.size() : 0;
}

std::optional<size_t> Queue::next_track_shuffle() {
    const size_t len = tracks_.size();
    if (len == 0) {
        return std::nullopt;
    }
    if (len == 1) {
        return 0;
    }
    if (!current_) {
        std::uniform_int_distribution<size_t> dist(0, len - 1);
        return dist(rng_);
    }

    // Draw from len-1 slots and skip over the current one
    std::uniform_int_distribution<size_t> dist(0, len - 2);
    size_t pick = dist(rng_);
    if (pick >= *current_) {
        ++pick;
    }
    return pick;
}

std::optional<size_t> Queue::last_track_sequential() const {
    if (tracks_.empty()) {
        return std::nullopt;
    }
    if (!current_ || *current_ == 0) {
        return tracks_.size() - 1;
    }
    return *current_ - 1;
}

// History moves only once the player has accepted the track
bool Queue::play_next(Playable& player) {
    if (auto forward = history_.peek_forward()) {
        if (!replace(*forward, player)) {
            return false;
        }
        history_.advance();
        return true;
    }

    auto chosen = shuffle_ ? next_track_shuffle() : next_track_sequential();
    if (!chosen || !replace(*chosen, player)) {
        return false;
    }
    history_.push(*chosen);
    return true;
}

void Queue::next(Playable& player) {
    play_next(player);
}

void Queue::last(Playable& player) {
    if (auto back = history_.peek_back()) {
        if (replace(*back, player)) {
            history_.retreat();
        }
        return;
    }
    if (shuffle_) {
        return;
    }

    // Recorded so the cursor stays on the playing track
    auto index = last_track_sequential();
    if (index && replace(*index, player)) {
        history_.push(*index);
    }
}

void Queue::toggle_shuffle() {
    shuffle_ = !shuffle_;
    history_.clear();
    util::Logger::info(std::string("Queue: Shuffle ") + (shuffle_ ? "on" : "off"));
}

void Queue::set_shuffle(bool shuffle) {
    if (shuffle != shuffle_) {
        toggle_shuffle();
    }
}

void Queue::restart(Playable& player) const {
    if (track()) {
        player.seek(Duration::zero());
    }
}

void Queue::seek_forward(Playable& player, Duration amount) {
    if (!track()) {
        return;
    }
    auto elapsed = player.elapsed();
    auto duration = player.duration();
    if (!elapsed || !duration) {
        return;
    }

    const Duration target = *elapsed + amount;
    if (target >= *duration) {
        next(player);
    } else {
        player.seek(target);
    }
}

void Queue::seek_backward(Playable& player, Duration amount) const {
    if (!track()) {
        return;
    }
    auto elapsed = player.elapsed();
    if (!elapsed) {
        return;
    }
    player.seek(*elapsed > amount ? *elapsed - amount : Duration::zero());
}

void Queue::on_track_finished(Playable& player) {
    if (!player.done()) {
        stalled_ = false;
        return;
    }
    // Not retried every tick: the finished track keeps done() set, so wait
    // until something plays again before advancing on our own
    if (!stalled_) {
        stalled_ = !play_next(player);
    }
}

}  // namespace lyre::backend

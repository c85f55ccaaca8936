#pragma once

#include "backend/History.hpp"
#include "backend/Playable.hpp"
#include "model/Track.hpp"
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace lyre::backend {

struct SessionState;

/// Queue: the track list of one directory plus navigation state.
///
/// Owned by the control thread. Selection order for next():
///   1. replay a forward history entry (after the user went back)
///   2. shuffle off: (current + 1) mod len
///   3. shuffle on: uniform pick excluding the current track
/// Operations that change the playing track take the Playable to drive. If
/// the player refuses a track, the current index and history stay as they were.
class Queue {
public:
    Queue();

    // Rebuild from persisted session state. A queue path that no longer
    // exists yields an empty queue; a saved track outside the list leaves
    // nothing current. A restored track starts the history.
    static Queue with_state(const SessionState& state);

    // Recursively read all audio files below path, sorted by tags.
    // Throws QueueError::NotADirectory.
    static std::vector<model::Track> read_directory(const std::string& path);

    // Replace the track list with the contents of path and reset navigation.
    // Throws QueueError::NotADirectory.
    void queue(const std::string& path);

    // Manual selection; clears history. Throw NoTracks / OutOfBounds / NoTrack.
    void select_idx(size_t index, Playable& player);
    void select_path(const std::string& path, Playable& player);

    void next(Playable& player);
    void last(Playable& player);

    // Both clear history
    void toggle_shuffle();
    void set_shuffle(bool shuffle);

    void restart(Playable& player) const;
    void seek_forward(Playable& player, Duration amount);
    void seek_backward(Playable& player, Duration amount) const;

    // Advance when the player has run off the end of the current track
    void on_track_finished(Playable& player);

    [[nodiscard]] bool is_shuffle() const { return shuffle_; }
    [[nodiscard]] const std::optional<std::string>& path() const { return path_; }
    [[nodiscard]] const std::vector<model::Track>& tracks() const { return tracks_; }
    [[nodiscard]] std::optional<size_t> index() const { return current_; }
    [[nodiscard]] const model::Track* track() const;
    [[nodiscard]] const History& history() const { return history_; }

    // Fixed seed for reproducible shuffle in tests
    void seed(uint64_t seed) { rng_.seed(seed); }

private:
    std::optional<size_t> next_track_sequential() const;
    std::optional<size_t> next_track_shuffle();
    std::optional<size_t> last_track_sequential() const;
    bool play_next(Playable& player);
    // Commits index as current only if the player accepted the track
    bool replace(size_t index, Playable& player);

    std::optional<std::string> path_;
    std::vector<model::Track> tracks_;
    History history_;
    std::optional<size_t> current_;
    bool shuffle_ = false;
    bool stalled_ = false;  // auto-advance failed on the finished track
    std::mt19937_64 rng_;
};

}  // namespace lyre::backend

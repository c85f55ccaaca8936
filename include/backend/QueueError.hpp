#pragma once

#include <stdexcept>
#include <string>

namespace lyre::backend {

/// User-facing queue/track errors. Never fatal: the UI catches these and
/// shows what() as a transient message.
class QueueError : public std::runtime_error {
public:
    enum class Kind {
        NoTrack,        // path doesn't exist or isn't in the track list
        NoTracks,       // track list is empty
        IsDirectory,    // expected a file
        OutOfBounds,    // index outside [0, len)
        NotADirectory,  // expected a directory
    };

    QueueError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] Kind kind() const { return kind_; }

    static QueueError no_track(const std::string& path) {
        return {Kind::NoTrack, "couldn't find track \"" + path + "\""};
    }
    static QueueError no_tracks() {
        return {Kind::NoTracks, "queue is empty"};
    }
    static QueueError is_directory(const std::string& path) {
        return {Kind::IsDirectory, "is directory: \"" + path + "\""};
    }
    static QueueError out_of_bounds() {
        return {Kind::OutOfBounds, "index out of bounds"};
    }
    static QueueError not_a_directory(const std::string& path) {
        return {Kind::NotADirectory, "not a directory \"" + path + "\""};
    }

private:
    Kind kind_;
};

}  // namespace lyre::backend

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace lyre::model {

enum class AudioFormat {
    Unknown,
    MP3,
    FLAC,
    OGG,
    WAV,
    M4A,
};

// Tag fields as read from the file. Every field is optional: a file without
// tags is still playable and sorts by whatever it has.
struct TrackTags {
    std::optional<int> track_number;
    std::optional<std::string> title;
    std::optional<std::string> artist;
    std::optional<std::string> album;
    std::optional<std::string> lyrics;
};

/// Track: immutable, reference-counted handle to one audio file.
///
/// Copies share the same underlying data, so Queue, Player and UI can hold
/// the same track without duplicating tags. Identity is the path.
class Track {
public:
    Track() = default;
    Track(std::string path, TrackTags tags);

    [[nodiscard]] bool valid() const { return inner_ != nullptr; }
    explicit operator bool() const { return valid(); }

    [[nodiscard]] const std::string& path() const;
    [[nodiscard]] AudioFormat format() const;
    [[nodiscard]] const TrackTags& tags() const;

    [[nodiscard]] const std::optional<int>& track_number() const { return tags().track_number; }
    [[nodiscard]] const std::optional<std::string>& title() const { return tags().title; }
    [[nodiscard]] const std::optional<std::string>& artist() const { return tags().artist; }
    [[nodiscard]] const std::optional<std::string>& album() const { return tags().album; }
    [[nodiscard]] const std::optional<std::string>& lyrics() const { return tags().lyrics; }

    // "01 title ~ artist", with "unknown title" / "unknown artist" fallbacks
    [[nodiscard]] std::string display() const;

    // Orders by (track number, title, artist, album). Titles, artists and
    // albums compare case-insensitively; a field missing on either side
    // compares equal, so this is not a strict weak ordering and must only be
    // used with a stable, bounds-safe sort (util::timsort).
    [[nodiscard]] static int compare(const Track& a, const Track& b);

    bool operator==(const Track& other) const;
    bool operator==(std::string_view path) const;

private:
    struct Inner {
        std::string path;
        TrackTags tags;
        AudioFormat format;
    };

    std::shared_ptr<const Inner> inner_;
};

[[nodiscard]] AudioFormat detect_format(const std::string& path);
[[nodiscard]] const char* format_to_string(AudioFormat format);

}  // namespace lyre::model

#pragma once

#include "model/Track.hpp"
#include <string>
#include <optional>

namespace lyre::backend {

class MetadataParser {
public:
    // Open a track by path and read its tags.
    // Throws QueueError (NoTrack, IsDirectory) if the path isn't a file.
    static model::Track parse_file(const std::string& path);

    // Best-effort tag read. Unreadable files yield empty tags, not errors:
    // the decoder decides later whether the file is actually playable.
    static model::TrackTags read_tags(const std::string& path);

    // "01/12", "1 of 12", "7" -> first number
    static std::optional<int> parse_track_number(const std::string& text);

private:
    static bool parse_mp3(const std::string& path, model::TrackTags& tags);
    static bool parse_sndfile(const std::string& path, model::TrackTags& tags);
    static bool parse_m4a(const std::string& path, model::TrackTags& tags);
};

}  // namespace lyre::backend

#include "model/Track.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>

namespace lyre::model {

namespace {

const TrackTags& empty_tags() {
    static const TrackTags tags;
    return tags;
}

const std::string& empty_path() {
    static const std::string path;
    return path;
}

int compare_text(const std::optional<std::string>& a, const std::optional<std::string>& b) {
    if (!a || !b) return 0;
    return util::case_insensitive_compare(*a, *b);
}

}  // namespace

Track::Track(std::string path, TrackTags tags) {
    AudioFormat format = detect_format(path);
    inner_ = std::make_shared<const Inner>(Inner{std::move(path), std::move(tags), format});
}

const std::string& Track::path() const {
    return inner_ ? inner_->path : empty_path();
}

AudioFormat Track::format() const {
    return inner_ ? inner_->format : AudioFormat::Unknown;
}

const TrackTags& Track::tags() const {
    return inner_ ? inner_->tags : empty_tags();
}

std::string Track::display() const {
    std::string out;
    if (track_number()) {
        out = std::format("{:02} ", *track_number());
    }
    out += title().value_or("unknown title");
    out += " ~ ";
    out += artist().value_or("unknown artist");
    return out;
}

int Track::compare(const Track& a, const Track& b) {
    const auto& ta = a.tags();
    const auto& tb = b.tags();

    if (ta.track_number && tb.track_number && *ta.track_number != *tb.track_number) {
        return *ta.track_number < *tb.track_number ? -1 : 1;
    }
    if (int c = compare_text(ta.title, tb.title); c != 0) return c;
    if (int c = compare_text(ta.artist, tb.artist); c != 0) return c;
    return compare_text(ta.album, tb.album);
}

bool Track::operator==(const Track& other) const {
    return path() == other.path();
}

bool Track::operator==(std::string_view path) const {
    return valid() && this->path() == path;
}

AudioFormat detect_format(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".mp3") return AudioFormat::MP3;
    if (ext == ".flac") return AudioFormat::FLAC;
    if (ext == ".ogg") return AudioFormat::OGG;
    if (ext == ".wav") return AudioFormat::WAV;
    if (ext == ".m4a") return AudioFormat::M4A;

    return AudioFormat::Unknown;
}

const char* format_to_string(AudioFormat format) {
    switch (format) {
        case AudioFormat::MP3: return "MP3";
        case AudioFormat::FLAC: return "FLAC";
        case AudioFormat::OGG: return "OGG/Vorbis";
        case AudioFormat::WAV: return "WAV";
        case AudioFormat::M4A: return "M4A/AAC";
        default: return "Unknown";
    }
}

}  // namespace lyre::model

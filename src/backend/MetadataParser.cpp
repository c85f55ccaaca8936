#include "backend/MetadataParser.hpp"
#include "backend/QueueError.hpp"
#include "util/Logger.hpp"
#include <filesystem>
#include <algorithm>
#include <cstring>
#include <mutex>
#include <mpg123.h>
#include <sndfile.h>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
}

/*
 * Tags are read with the same libraries that decode the audio:
 * - mpg123 for ID3v1/ID3v2 (MP3), including USLT lyrics
 * - libsndfile string chunks for FLAC, OGG/Vorbis and WAV
 * - libavformat metadata for M4A/AAC
 */

namespace lyre::backend {

namespace {

std::string trim(const std::string& str) {
    if (str.empty()) return "";
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

// Empty or whitespace-only tags count as missing
std::optional<std::string> tag_value(const char* raw) {
    if (!raw) return std::nullopt;
    std::string value = trim(raw);
    if (value.empty()) return std::nullopt;
    return value;
}

std::optional<std::string> tag_value(const mpg123_string* s) {
    if (!s || !s->p || s->fill == 0) return std::nullopt;
    return tag_value(s->p);
}

// ID3v1 fields are fixed-width and not null-terminated
std::optional<std::string> fixed_field(const char* data, size_t len) {
    std::string value(data, strnlen(data, len));
    return tag_value(value.c_str());
}

void init_mpg123() {
    static std::once_flag flag;
    std::call_once(flag, [] { mpg123_init(); });
}

}  // namespace

model::Track MetadataParser::parse_file(const std::string& path) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw QueueError::no_track(path);
    }
    if (fs::is_directory(path, ec)) {
        throw QueueError::is_directory(path);
    }

    return model::Track(path, read_tags(path));
}

model::TrackTags MetadataParser::read_tags(const std::string& path) {
    model::TrackTags tags;

    bool parsed = false;
    switch (model::detect_format(path)) {
        case model::AudioFormat::MP3:
            parsed = parse_mp3(path, tags);
            break;
        case model::AudioFormat::M4A:
            parsed = parse_m4a(path, tags);
            break;
        default:
            parsed = parse_sndfile(path, tags);
            break;
    }

    if (!parsed) {
        util::Logger::debug("MetadataParser: No readable tags in " + path);
        return {};
    }
    return tags;
}

std::optional<int> MetadataParser::parse_track_number(const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) return std::nullopt;

    size_t end_pos = std::min(value.find('/'), value.find(' '));
    if (end_pos != std::string::npos) {
        value = value.substr(0, end_pos);
    }

    try {
        size_t consumed = 0;
        int number = std::stoi(value, &consumed);
        if (consumed != value.size()) return std::nullopt;
        return number;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool MetadataParser::parse_mp3(const std::string& path, model::TrackTags& tags) {
    init_mpg123();
    mpg123_handle* mh = mpg123_new(nullptr, nullptr);
    if (!mh) return false;

    // Untagged or broken files are common here; don't spam stderr
    mpg123_param(mh, MPG123_ADD_FLAGS, MPG123_QUIET, 0.0);

    if (mpg123_open(mh, path.c_str()) != MPG123_OK) {
        mpg123_delete(mh);
        return false;
    }

    // Scanning reads the whole stream once; tags are parsed on the way
    mpg123_scan(mh);

    mpg123_id3v1* v1 = nullptr;
    mpg123_id3v2* v2 = nullptr;
    bool found = false;
    if (mpg123_id3(mh, &v1, &v2) == MPG123_OK) {
        if (v2) {
            found = true;
            tags.title = tag_value(v2->title);
            tags.artist = tag_value(v2->artist);
            tags.album = tag_value(v2->album);

            // TRCK (track number) and USLT (lyrics) live in the text frame list
            for (size_t i = 0; i < v2->texts; ++i) {
                const mpg123_text& frame = v2->text[i];
                if (std::strncmp(frame.id, "TRCK", 4) == 0 && !tags.track_number) {
                    if (auto value = tag_value(&frame.text)) {
                        tags.track_number = parse_track_number(*value);
                    }
                } else if (std::strncmp(frame.id, "USLT", 4) == 0 && !tags.lyrics) {
                    tags.lyrics = tag_value(&frame.text);
                }
            }
        } else if (v1) {
            found = true;
            tags.title = fixed_field(v1->title, sizeof(v1->title));
            tags.artist = fixed_field(v1->artist, sizeof(v1->artist));
            tags.album = fixed_field(v1->album, sizeof(v1->album));

            // ID3v1.1: track number is in comment[29] if comment[28] is null
            if (v1->comment[28] == 0 && v1->comment[29] != 0) {
                tags.track_number = static_cast<unsigned char>(v1->comment[29]);
            }
        }
    }

    mpg123_close(mh);
    mpg123_delete(mh);
    return found;
}

bool MetadataParser::parse_sndfile(const std::string& path, model::TrackTags& tags) {
    SF_INFO sfinfo;
    std::memset(&sfinfo, 0, sizeof(sfinfo));

    SNDFILE* sndfile = sf_open(path.c_str(), SFM_READ, &sfinfo);
    if (!sndfile) return false;

    tags.title = tag_value(sf_get_string(sndfile, SF_STR_TITLE));
    tags.artist = tag_value(sf_get_string(sndfile, SF_STR_ARTIST));
    tags.album = tag_value(sf_get_string(sndfile, SF_STR_ALBUM));
    if (auto number = tag_value(sf_get_string(sndfile, SF_STR_TRACKNUMBER))) {
        tags.track_number = parse_track_number(*number);
    }

    sf_close(sndfile);
    return true;
}

bool MetadataParser::parse_m4a(const std::string& path, model::TrackTags& tags) {
    AVFormatContext* format_ctx = nullptr;
    if (avformat_open_input(&format_ctx, path.c_str(), nullptr, nullptr) < 0) {
        return false;
    }

    auto get_tag = [&](const char* key) -> std::optional<std::string> {
        const AVDictionaryEntry* entry = av_dict_get(format_ctx->metadata, key, nullptr, 0);
        return entry ? tag_value(entry->value) : std::nullopt;
    };

    tags.title = get_tag("title");
    tags.artist = get_tag("artist");
    tags.album = get_tag("album");
    tags.lyrics = get_tag("lyrics");
    if (auto number = get_tag("track")) {
        tags.track_number = parse_track_number(*number);
    }

    avformat_close_input(&format_ctx);
    return true;
}

}  // namespace lyre::backend

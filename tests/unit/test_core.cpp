#include "../framework/SimpleTest.hpp"
#include "backend/Config.hpp"
#include "backend/MetadataParser.hpp"
#include "backend/QueueError.hpp"
#include "backend/StateStore.hpp"
#include "config/KeyMap.hpp"
#include "events/Scheduler.hpp"
#include "model/Track.hpp"
#include "ui/Formatting.hpp"
#include "ui/widgets/StatusBar.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace lyre;
using model::Track;
using model::TrackTags;

namespace {

Track make_track(std::optional<int> number,
                 std::optional<std::string> title = std::nullopt,
                 std::optional<std::string> artist = std::nullopt,
                 std::optional<std::string> album = std::nullopt) {
    TrackTags tags;
    tags.track_number = number;
    tags.title = std::move(title);
    tags.artist = std::move(artist);
    tags.album = std::move(album);
    return Track("/music/track.flac", std::move(tags));
}

std::filesystem::path temp_file(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("lyre_core_" + std::to_string(getpid()));
    std::filesystem::create_directories(dir);
    return dir / name;
}

}  // namespace

// ============================================================================
// Track ordering
// ============================================================================

TEST_CASE(test_track_order_numbers_and_missing_fields) {
    auto one = make_track(0);
    auto two = make_track(std::nullopt, "00", "00");
    auto thr = make_track(1, "01");
    auto fou = make_track(std::nullopt, std::nullopt, "01");
    auto fiv = make_track(0, "00", "02");

    ASSERT_EQ(Track::compare(one, two), 0);
    ASSERT_TRUE(Track::compare(one, thr) < 0);
    ASSERT_TRUE(Track::compare(two, thr) < 0);
    ASSERT_EQ(Track::compare(one, fou), 0);
    ASSERT_TRUE(Track::compare(two, fou) < 0);
    ASSERT_TRUE(Track::compare(fou, fiv) < 0);
    ASSERT_TRUE(Track::compare(thr, fiv) > 0);
    ASSERT_EQ(Track::compare(one, fiv), 0);
}

TEST_CASE(test_track_order_ignores_case) {
    auto one = make_track(0, "a");
    auto two = make_track(std::nullopt, "B", "c");
    auto thr = make_track(1, std::nullopt, "D");
    auto fou = make_track(std::nullopt, "c");

    ASSERT_TRUE(Track::compare(one, two) < 0);
    ASSERT_TRUE(Track::compare(two, one) > 0);
    ASSERT_TRUE(Track::compare(two, thr) < 0);
    ASSERT_TRUE(Track::compare(thr, two) > 0);
    ASSERT_TRUE(Track::compare(two, fou) < 0);
    ASSERT_TRUE(Track::compare(fou, two) > 0);
}

TEST_CASE(test_track_order_unicode_folding) {
    auto one = make_track(std::nullopt, "ä");
    auto two = make_track(std::nullopt, "Ü", "ẞ");
    auto thr = make_track(std::nullopt, "Ä");
    auto fou = make_track(std::nullopt, "ü", "ss");

    ASSERT_TRUE(Track::compare(one, two) < 0);
    ASSERT_TRUE(Track::compare(thr, fou) < 0);
    ASSERT_EQ(Track::compare(one, thr), 0);
    ASSERT_EQ(Track::compare(two, fou), 0);
}

TEST_CASE(test_track_album_breaks_ties) {
    auto a = make_track(3, "Song", "Band", "Alpha");
    auto b = make_track(3, "song", "BAND", "beta");
    ASSERT_TRUE(Track::compare(a, b) < 0);
}

TEST_CASE(test_track_identity_is_path) {
    Track a("/music/a.mp3", TrackTags{});
    TrackTags other_tags;
    other_tags.title = "retagged";
    Track b("/music/a.mp3", other_tags);
    Track c("/music/c.mp3", TrackTags{});

    ASSERT_TRUE(a == b);
    ASSERT_FALSE(a == c);
    ASSERT_TRUE(a == std::string_view("/music/a.mp3"));
    ASSERT_FALSE(Track() == std::string_view(""));
}

TEST_CASE(test_track_copies_share_data) {
    auto a = make_track(1, "title");
    Track b = a;
    ASSERT_EQ(&a.tags(), &b.tags());
}

TEST_CASE(test_track_display) {
    ASSERT_EQ(make_track(3, "Song", "Band").display(), "03 Song ~ Band");
    ASSERT_EQ(make_track(std::nullopt).display(), "unknown title ~ unknown artist");
}

TEST_CASE(test_detect_format) {
    ASSERT_TRUE(model::detect_format("/a/b.MP3") == model::AudioFormat::MP3);
    ASSERT_TRUE(model::detect_format("b.flac") == model::AudioFormat::FLAC);
    ASSERT_TRUE(model::detect_format("b.ogg") == model::AudioFormat::OGG);
    ASSERT_TRUE(model::detect_format("b.wav") == model::AudioFormat::WAV);
    ASSERT_TRUE(model::detect_format("b.m4a") == model::AudioFormat::M4A);
    ASSERT_TRUE(model::detect_format("cover.jpg") == model::AudioFormat::Unknown);
}

// ============================================================================
// MetadataParser
// ============================================================================

TEST_CASE(test_parse_track_number) {
    using backend::MetadataParser;
    ASSERT_EQ(MetadataParser::parse_track_number("7"), std::optional<int>(7));
    ASSERT_EQ(MetadataParser::parse_track_number(" 01/12 "), std::optional<int>(1));
    ASSERT_EQ(MetadataParser::parse_track_number("4 of 10"), std::optional<int>(4));
    ASSERT_FALSE(MetadataParser::parse_track_number("").has_value());
    ASSERT_FALSE(MetadataParser::parse_track_number("side A").has_value());
    ASSERT_FALSE(MetadataParser::parse_track_number("3b").has_value());
}

TEST_CASE(test_parse_file_errors) {
    using backend::MetadataParser;
    using backend::QueueError;

    try {
        (void)MetadataParser::parse_file("/nonexistent/song.mp3");
        throw test::AssertionFailure("expected NoTrack");
    } catch (const QueueError& e) {
        ASSERT_TRUE(e.kind() == QueueError::Kind::NoTrack);
    }

    try {
        (void)MetadataParser::parse_file(std::filesystem::temp_directory_path().string());
        throw test::AssertionFailure("expected IsDirectory");
    } catch (const QueueError& e) {
        ASSERT_TRUE(e.kind() == QueueError::Kind::IsDirectory);
    }
}

TEST_CASE(test_parse_file_garbage_has_no_tags) {
    auto path = temp_file("garbage.mp3");
    std::ofstream(path) << "dummy content";

    auto track = backend::MetadataParser::parse_file(path.string());
    ASSERT_TRUE(track.valid());
    ASSERT_EQ(track.path(), path.string());
    ASSERT_FALSE(track.title().has_value());
    ASSERT_FALSE(track.track_number().has_value());
}

// ============================================================================
// Config and session state
// ============================================================================

TEST_CASE(test_config_defaults_when_missing) {
    auto cfg = backend::ConfigLoader::load_from_file(temp_file("does_not_exist.toml"));
    ASSERT_EQ(cfg.volume_step, 5);
    ASSERT_EQ(cfg.seek_seconds, 5);
    ASSERT_EQ(cfg.output_rate, 48000);
    ASSERT_FALSE(cfg.accent.has_value());
    ASSERT_TRUE(cfg.lists.empty());
}

TEST_CASE(test_config_parses_sections) {
    auto path = temp_file("config.toml");
    {
        std::ofstream f(path);
        f << "# comment\n"
          << "[playback]\n"
          << "volume_step = 10\n"
          << "seek_seconds = abc\n"
          << "output_rate = 44100\n"
          << "\n"
          << "[ui]\n"
          << "accent = \"#89b4fa\"\n"
          << "[paths]\n"
          << "list = \"/srv/music\"\n"
          << "list = \"/srv/podcasts\"\n"
          << "not a key value line\n";
    }

    auto cfg = backend::ConfigLoader::load_from_file(path);
    ASSERT_EQ(cfg.volume_step, 10);
    ASSERT_EQ(cfg.seek_seconds, 5);
    ASSERT_EQ(cfg.output_rate, 44100);
    ASSERT_EQ(cfg.accent, std::optional<std::string>("#89b4fa"));
    ASSERT_EQ(cfg.lists.size(), 2u);
    ASSERT_EQ(cfg.lists[1], std::filesystem::path("/srv/podcasts"));
}

TEST_CASE(test_config_rejects_bad_output_rate) {
    auto path = temp_file("bad_rate.toml");
    std::ofstream(path) << "[playback]\noutput_rate = -5\n";
    ASSERT_EQ(backend::ConfigLoader::load_from_file(path).output_rate, 48000);
}

TEST_CASE(test_config_save_then_load) {
    backend::Config cfg;
    cfg.volume_step = 2;
    cfg.accent = "#ff0000";
    cfg.lists.push_back("/srv/music");

    auto path = temp_file("saved_config.toml");
    ASSERT_TRUE(backend::ConfigLoader::save_config(cfg, path));

    auto loaded = backend::ConfigLoader::load_from_file(path);
    ASSERT_EQ(loaded.volume_step, 2);
    ASSERT_EQ(loaded.accent, cfg.accent);
    ASSERT_EQ(loaded.lists.size(), 1u);
}

TEST_CASE(test_state_save_then_load) {
    backend::SessionState state;
    state.volume = 73;
    state.muted = true;
    state.shuffle = false;
    state.queue = "/srv/music/album one";
    state.track = "/srv/music/album one/02 - b.flac";
    state.elapsed = 95;

    auto path = temp_file("state.toml");
    ASSERT_TRUE(backend::StateStore::save_to_file(state, path));
    ASSERT_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    auto loaded = backend::StateStore::load_from_file(path);
    ASSERT_EQ(loaded.volume, 73);
    ASSERT_TRUE(loaded.muted);
    ASSERT_FALSE(loaded.shuffle);
    ASSERT_EQ(loaded.queue, state.queue);
    ASSERT_EQ(loaded.track, state.track);
    ASSERT_EQ(loaded.elapsed, 95);
}

TEST_CASE(test_state_clamps_values) {
    auto path = temp_file("clamped_state.toml");
    std::ofstream(path) << "volume = 250\nelapsed = -4\n";

    auto loaded = backend::StateStore::load_from_file(path);
    ASSERT_EQ(loaded.volume, 100);
    ASSERT_EQ(loaded.elapsed, 0);
    ASSERT_TRUE(loaded.shuffle);
    ASSERT_FALSE(loaded.queue.has_value());
}

// ============================================================================
// Scheduler
// ============================================================================

TEST_CASE(test_scheduler_fires_after_interval) {
    events::Scheduler scheduler;
    int runs = 0;
    scheduler.schedule("tick", std::chrono::milliseconds(100), [&runs] { ++runs; });
    auto start = events::Scheduler::Clock::now();

    scheduler.process(start);
    ASSERT_EQ(runs, 0);

    scheduler.process(start + std::chrono::milliseconds(150));
    ASSERT_EQ(runs, 1);

    scheduler.process(start + std::chrono::milliseconds(200));
    ASSERT_EQ(runs, 1);

    scheduler.process(start + std::chrono::milliseconds(260));
    ASSERT_EQ(runs, 2);
}

TEST_CASE(test_scheduler_run_now_and_unschedule) {
    events::Scheduler scheduler;
    int runs = 0;
    scheduler.schedule("save", std::chrono::seconds(5), [&runs] { ++runs; });

    ASSERT_TRUE(scheduler.has("save"));
    ASSERT_TRUE(scheduler.run_now("save"));
    ASSERT_EQ(runs, 1);

    scheduler.unschedule("save");
    ASSERT_FALSE(scheduler.has("save"));
    ASSERT_FALSE(scheduler.run_now("save"));
    ASSERT_EQ(runs, 1);
}

// ============================================================================
// Key bindings
// ============================================================================

TEST_CASE(test_keymap_defaults) {
    config::KeyMap keys;
    ASSERT_TRUE(keys.lookup_action("space") == config::Action::TogglePause);
    ASSERT_TRUE(keys.lookup_action("n") == config::Action::Next);
    ASSERT_TRUE(keys.lookup_action("p") == config::Action::Last);
    ASSERT_TRUE(keys.lookup_action("=") == config::Action::VolumeUp);
    ASSERT_TRUE(keys.lookup_action("right") == config::Action::SeekForward);
    ASSERT_TRUE(keys.lookup_action("h") == config::Action::SeekBackward);
    ASSERT_TRUE(keys.lookup_action("q") == config::Action::Quit);
    ASSERT_FALSE(keys.lookup_action("z").has_value());
    ASSERT_EQ(std::string(config::action_name(config::Action::ToggleShuffle)), "toggle_shuffle");
}

// ============================================================================
// Status line
// ============================================================================

TEST_CASE(test_format_time) {
    ASSERT_EQ(ui::format_time(0.0), "0:00");
    ASSERT_EQ(ui::format_time(65.9), "1:05");
    ASSERT_EQ(ui::format_time(3725.0), "1:02:05");
    ASSERT_EQ(ui::format_time(-3.0), "0:00");
}

TEST_CASE(test_lr_align_width) {
    auto line = ui::lr_align(20, "song", "1:02");
    ASSERT_EQ(ui::display_cols(line), 20);
    ASSERT_EQ(line, "song            1:02");
    ASSERT_EQ(ui::display_cols(ui::trunc_pad("a very long title indeed", 10)), 10);
}

TEST_CASE(test_status_bar_render) {
    ui::widgets::StatusBar bar;
    ui::widgets::StatusView view;
    view.paused = false;
    view.shuffle = true;
    view.volume = 40;
    view.elapsed = 61.0;
    view.duration = 200.0;
    view.title = "03 Song ~ Band";

    auto line = bar.render(view, 60);
    ASSERT_EQ(ui::display_cols(line), 60);
    ASSERT_TRUE(line.find("03 Song ~ Band") != std::string::npos);
    ASSERT_TRUE(line.find("shuf 1:01 / 3:20 vol 40%") != std::string::npos);

    view.muted = true;
    ASSERT_TRUE(bar.render(view, 60).find("vol muted") != std::string::npos);

    view.alert = "couldn't find track";
    line = bar.render(view, 60);
    ASSERT_TRUE(line.find("! couldn't find track") != std::string::npos);
}

TEST_CASE(test_status_bar_accent_escape) {
    using ui::widgets::StatusBar;
    ASSERT_EQ(StatusBar::accent_escape("#ff8000"), std::optional<std::string>("\033[38;2;255;128;0m"));
    ASSERT_FALSE(StatusBar::accent_escape("ff8000").has_value());
    ASSERT_FALSE(StatusBar::accent_escape("#ff80zz").has_value());
}

int main() {
    return lyre::test::TestRunner::instance().run_all();
}

#include "../framework/SimpleTest.hpp"
#include "audio/AudioEngine.hpp"
#include "audio/AudioOutput.hpp"
#include "audio/Resampler.hpp"
#include "audio/StreamSource.hpp"
#include "backend/MetadataParser.hpp"
#include "backend/Player.hpp"
#include <sndfile.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <functional>
#include <thread>
#include <unistd.h>
#include <variant>
#include <vector>

using namespace lyre;
using backend::Duration;

namespace {

constexpr double PI = 3.14159265358979323846;

// Device stand-in: the test thread plays the role of the audio callback
class ManualOutput : public audio::AudioOutput {
public:
    explicit ManualOutput(int rate) : rate_(rate) {}

    bool start(RenderCallback render) override {
        render_ = std::move(render);
        return true;
    }
    void stop() override { render_ = nullptr; }
    int sample_rate() const override { return rate_; }
    bool is_running() const override { return static_cast<bool>(render_); }

    // Interleaved stereo
    std::vector<float> pump(size_t frames) {
        std::vector<float> data(frames * 2, -1.0f);
        if (render_) {
            render_(data.data(), frames);
        }
        return data;
    }

private:
    int rate_;
    RenderCallback render_;
};

std::string fixture_path(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("lyre_pipeline_" + std::to_string(getpid()));
    std::filesystem::create_directories(dir);
    return (dir / name).string();
}

// Float WAV where every channel of frame i holds sample(i)
std::string write_wav(const std::string& name, int rate, int channels, long frames,
                      const std::function<float(long)>& sample) {
    std::string path = fixture_path(name);

    SF_INFO info{};
    info.samplerate = rate;
    info.channels = channels;
    info.format = SF_FORMAT_WAV | SF_FORMAT_FLOAT;

    SNDFILE* file = sf_open(path.c_str(), SFM_WRITE, &info);
    if (!file) {
        throw test::AssertionFailure("cannot create fixture " + path + ": " + sf_strerror(nullptr));
    }

    std::vector<float> interleaved(static_cast<size_t>(frames) * channels);
    for (long i = 0; i < frames; ++i) {
        for (int c = 0; c < channels; ++c) {
            interleaved[static_cast<size_t>(i) * channels + c] = sample(i);
        }
    }
    sf_writef_float(file, interleaved.data(), frames);
    sf_close(file);
    return path;
}

std::string write_sine(const std::string& name, int rate, double seconds, double freq = 440.0) {
    return write_wav(name, rate, 2, static_cast<long>(seconds * rate), [rate, freq](long i) {
        return static_cast<float>(0.5 * std::sin(2.0 * PI * freq * i / rate));
    });
}

std::string write_dc(const std::string& name, int rate, double seconds) {
    return write_wav(name, rate, 2, static_cast<long>(seconds * rate), [](long) { return 0.5f; });
}

float peak(const std::vector<float>& data) {
    float m = 0.0f;
    for (float s : data) m = std::max(m, std::abs(s));
    return m;
}

struct Rig {
    explicit Rig(int rate) {
        auto out = std::make_unique<ManualOutput>(rate);
        output = out.get();
        player = std::make_unique<backend::Player>(std::move(out));
        if (!player->start()) {
            throw test::AssertionFailure("manual output refused to start");
        }
    }

    // Pumps until the callback delivers sound, giving the stream worker time
    std::vector<float> pump_until_audible(size_t frames) {
        for (int attempt = 0; attempt < 500; ++attempt) {
            auto data = output->pump(frames);
            if (peak(data) > 0.0f) return data;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        throw test::AssertionFailure("stream never became audible");
    }

    ManualOutput* output = nullptr;
    std::unique_ptr<backend::Player> player;
};

model::Track load_track(const std::string& path) {
    return backend::MetadataParser::parse_file(path);
}

}  // namespace

// ============================================================================
// Player and engine
// ============================================================================

TEST_CASE(test_no_stream_renders_silence) {
    Rig rig(48000);
    auto data = rig.output->pump(512);
    ASSERT_EQ(peak(data), 0.0f);

    rig.player->update();
    ASSERT_FALSE(rig.player->elapsed().has_value());
    ASSERT_FALSE(rig.player->done());
}

TEST_CASE(test_plays_at_device_rate) {
    Rig rig(48000);
    rig.player->set_volume(100);
    rig.player->replace(load_track(write_sine("sine48.wav", 48000, 0.5)));

    ASSERT_FALSE(rig.player->resampling());
    ASSERT_FALSE(rig.player->paused());
    ASSERT_TRUE(rig.player->duration().has_value());
    ASSERT_NEAR(rig.player->duration()->count(), 0.5, 1e-3);

    auto data = rig.pump_until_audible(1024);
    ASSERT_NEAR(peak(data), 0.5f, 0.01f);
}

TEST_CASE(test_other_rates_are_resampled) {
    Rig rig(48000);
    rig.player->replace(load_track(write_sine("sine44.wav", 44100, 0.5)));

    ASSERT_TRUE(rig.player->resampling());
    auto data = rig.pump_until_audible(1024);
    ASSERT_TRUE(peak(data) > 0.0f);
}

TEST_CASE(test_gain_curve) {
    Rig rig(48000);
    auto& player = *rig.player;

    player.set_volume(100);
    ASSERT_NEAR(player.effective_amplitude(), 1.0f, 1e-6f);
    player.set_volume(50);
    ASSERT_NEAR(player.effective_amplitude(), 0.125f, 1e-6f);
    player.set_volume(150);
    ASSERT_EQ(player.volume(), 100);
    player.volume_down(200);
    ASSERT_EQ(player.volume(), 0);

    player.set_volume(50);
    player.mute();
    ASSERT_EQ(player.effective_amplitude(), 0.0f);
    player.volume_up(10);
    ASSERT_EQ(player.effective_amplitude(), 0.0f);
    player.unmute();
    ASSERT_EQ(player.volume(), 60);
    ASSERT_NEAR(player.effective_amplitude(), 0.216f, 1e-5f);
}

TEST_CASE(test_gain_applied_to_samples) {
    Rig rig(48000);
    auto& player = *rig.player;
    player.replace(load_track(write_dc("dc.wav", 48000, 2.0)));

    // Volume 50 -> 0.5^3
    auto data = rig.pump_until_audible(256);
    ASSERT_NEAR(data[10], 0.0625f, 1e-6f);

    player.mute();
    data = rig.output->pump(256);
    ASSERT_EQ(peak(data), 0.0f);

    player.unmute();
    data = rig.pump_until_audible(256);
    ASSERT_NEAR(data[10], 0.0625f, 1e-6f);
}

TEST_CASE(test_paused_revive_is_silent) {
    Rig rig(48000);
    auto& player = *rig.player;
    player.revive(load_track(write_dc("revive.wav", 48000, 1.0)), Duration(0.25));

    ASSERT_TRUE(player.paused());
    auto data = rig.output->pump(512);
    ASSERT_EQ(peak(data), 0.0f);

    player.update();
    ASSERT_TRUE(player.elapsed().has_value());
    ASSERT_NEAR(player.elapsed()->count(), 0.25, 1e-3);

    player.toggle();
    ASSERT_FALSE(player.paused());
    data = rig.pump_until_audible(512);
    ASSERT_TRUE(peak(data) > 0.0f);
}

TEST_CASE(test_seek_moves_playhead) {
    Rig rig(48000);
    auto& player = *rig.player;
    player.replace(load_track(write_sine("seek.wav", 48000, 1.0)));
    rig.pump_until_audible(512);

    player.seek(Duration(0.6));
    ASSERT_NEAR(player.elapsed()->count(), 0.6, 1e-9);

    rig.output->pump(256);
    player.update();
    ASSERT_TRUE(player.elapsed()->count() >= 0.6 - 1e-6);
    ASSERT_TRUE(player.elapsed()->count() <= 0.6 + 256.0 / 48000 + 1e-6);
}

TEST_CASE(test_end_of_stream_reports_done) {
    Rig rig(48000);
    auto& player = *rig.player;
    player.replace(load_track(write_sine("short.wav", 48000, 0.1)));

    for (int i = 0; i < 2000 && !player.done(); ++i) {
        rig.output->pump(1024);
        player.update();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ASSERT_TRUE(player.done());

    // Silence after the end, and done sticks until something new loads
    ASSERT_EQ(peak(rig.output->pump(512)), 0.0f);
    player.update();
    ASSERT_TRUE(player.done());
}

TEST_CASE(test_stale_reports_ignored_after_switch) {
    Rig rig(48000);
    auto& player = *rig.player;
    player.replace(load_track(write_sine("first.wav", 48000, 1.0)));
    rig.pump_until_audible(2048);

    // Reports about the first track are still queued when the second loads
    player.replace(load_track(write_sine("second.wav", 48000, 1.0)));
    player.update();
    ASSERT_NEAR(player.elapsed()->count(), 0.0, 1e-9);
    ASSERT_FALSE(player.done());
}

TEST_CASE(test_unplayable_file_raises_alert) {
    Rig rig(48000);
    auto& player = *rig.player;

    auto path = fixture_path("broken.flac");
    std::ofstream(path) << "not audio";
    ASSERT_FALSE(player.replace(load_track(path)));

    ASSERT_FALSE(player.track().valid());
    auto alert = player.take_alert();
    ASSERT_TRUE(alert.has_value());
    ASSERT_FALSE(player.take_alert().has_value());
}

TEST_CASE(test_unplayable_file_keeps_current_track) {
    Rig rig(48000);
    auto& player = *rig.player;
    auto good = write_dc("keeps.wav", 48000, 2.0);
    ASSERT_TRUE(player.replace(load_track(good)));
    rig.pump_until_audible(512);

    auto broken = fixture_path("broken.ogg");
    std::ofstream(broken) << "not audio";
    ASSERT_FALSE(player.replace(load_track(broken)));

    ASSERT_EQ(player.track().path(), good);
    ASSERT_TRUE(player.take_alert().has_value());
    ASSERT_TRUE(peak(rig.pump_until_audible(512)) > 0.0f);
}

TEST_CASE(test_engine_holds_back_commands_until_retired_voices_drain) {
    util::Channel<audio::ToProcess> commands(16);
    util::Channel<audio::FromProcess> reports(1);
    audio::AudioEngine engine(commands.consumer(), reports.producer(), 48000);
    auto to_engine = commands.producer();
    auto from_engine = reports.consumer();

    // More replacements than the engine can park while nobody reads reports
    constexpr uint64_t STREAMS = audio::AudioEngine::RETIRED_BACKLOG + 4;
    auto path = write_dc("backlog.wav", 48000, 0.5);
    for (uint64_t i = 1; i <= STREAMS; ++i) {
        auto source = audio::StreamSource::open(path, 0.0);
        ASSERT_TRUE(source != nullptr);
        auto voice = audio::Voice::make(std::move(source), nullptr);
        voice->generation = i;
        ASSERT_TRUE(to_engine.push(audio::UseStream{std::move(voice), audio::PlaybackStatus::Paused}));
    }

    std::vector<float> data(256 * audio::AudioEngine::CHANNELS);
    size_t retired = 0;
    uint64_t live_generation = 0;
    for (int round = 0; round < 200; ++round) {
        engine.process(data.data(), 256);
        audio::FromProcess report;
        while (from_engine.pop(report)) {
            if (auto* r = std::get_if<audio::Retired>(&report)) {
                ASSERT_TRUE(r->voice != nullptr);
                ++retired;
                r->voice.reset();
            } else if (auto* playhead = std::get_if<audio::Playhead>(&report)) {
                live_generation = playhead->generation;
            }
        }
        if (retired == STREAMS - 1 && live_generation == STREAMS) break;
    }

    // Every replaced voice comes back to be destroyed here; none is dropped
    ASSERT_EQ(retired, static_cast<size_t>(STREAMS - 1));
    ASSERT_EQ(live_generation, STREAMS);
}

// ============================================================================
// StreamSource
// ============================================================================

TEST_CASE(test_stream_source_rejects_bad_input) {
    ASSERT_TRUE(audio::StreamSource::open(fixture_path("missing.wav"), 0.0) == nullptr);

    auto surround = write_wav("three.wav", 48000, 3, 4800, [](long) { return 0.1f; });
    ASSERT_TRUE(audio::StreamSource::open(surround, 0.0) == nullptr);
}

TEST_CASE(test_stream_source_duplicates_mono) {
    auto path = write_wav("mono.wav", 22050, 1, 22050, [](long i) {
        return static_cast<float>(i % 100) / 100.0f;
    });
    auto source = audio::StreamSource::open(path, 0.0);
    ASSERT_TRUE(source != nullptr);
    ASSERT_EQ(source->channels(), 1);
    ASSERT_EQ(source->sample_rate(), 22050);
    ASSERT_EQ(source->total_frames(), 22050L);

    std::vector<float> left(1024), right(1024);
    auto result = source->read(left.data(), right.data(), left.size());
    ASSERT_EQ(result.frames, 1024u);
    ASSERT_TRUE(result.status == audio::ReadStatus::Ok);
    ASSERT_TRUE(left == right);
    ASSERT_NEAR(left[150], 0.5f, 1e-6f);
    ASSERT_EQ(source->position(), 1024L);
}

TEST_CASE(test_stream_source_start_offset_and_seek_clamp) {
    auto path = write_wav("offset.wav", 48000, 2, 48000, [](long i) {
        return static_cast<float>(i) / 48000.0f;
    });
    auto source = audio::StreamSource::open(path, 0.5);
    ASSERT_TRUE(source != nullptr);
    ASSERT_EQ(source->position(), 24000L);

    std::vector<float> left(16), right(16);
    auto result = source->read(left.data(), right.data(), left.size());
    ASSERT_EQ(result.frames, 16u);
    ASSERT_NEAR(left[0], 0.5f, 1e-6f);

    source->seek(-10);
    ASSERT_EQ(source->position(), 0L);
    source->seek(10'000'000);
    ASSERT_EQ(source->position(), 48000L);
}

// ============================================================================
// Resampler
// ============================================================================

TEST_CASE(test_resampler_rejects_invalid_rates) {
    ASSERT_TRUE(audio::Resampler::create(0, 48000, 2048) == nullptr);
    ASSERT_TRUE(audio::Resampler::create(44100, 48000, 0) == nullptr);
}

namespace {

// Frequency of a sine from its zero crossings, skipping the filter warm-up
double measure_frequency(const std::vector<float>& samples, int rate) {
    size_t crossings = 0;
    size_t first = 0;
    size_t last = 0;
    for (size_t i = 256; i < samples.size(); ++i) {
        if ((samples[i - 1] < 0.0f) != (samples[i] < 0.0f)) {
            if (crossings == 0) first = i;
            last = i;
            ++crossings;
        }
    }
    if (crossings < 100) {
        throw test::AssertionFailure("too few zero crossings: " + std::to_string(crossings));
    }
    const double cycles = (crossings - 1) / 2.0;
    return cycles * rate / static_cast<double>(last - first);
}

}  // namespace

TEST_CASE(test_resampler_round_trip_preserves_pitch) {
    constexpr int SOURCE_RATE = 44100;
    constexpr int DEVICE_RATE = 48000;
    constexpr size_t BLOCK = 2048;
    constexpr double FREQ = 1000.0;

    auto up = audio::Resampler::create(SOURCE_RATE, DEVICE_RATE, BLOCK);
    ASSERT_TRUE(up != nullptr);
    ASSERT_TRUE(up->max_output_frames() >= BLOCK * DEVICE_RATE / SOURCE_RATE);

    auto down = audio::Resampler::create(DEVICE_RATE, SOURCE_RATE, up->max_output_frames());
    ASSERT_TRUE(down != nullptr);

    std::vector<float> input(BLOCK);
    std::vector<float> upsampled;
    std::vector<float> restored;
    long n = 0;
    for (int block = 0; block < 40; ++block) {
        for (auto& s : input) {
            s = static_cast<float>(std::sin(2.0 * PI * FREQ * n++ / SOURCE_RATE));
        }
        size_t produced = up->process(input.data(), input.data(), BLOCK);
        ASSERT_TRUE(produced <= up->max_output_frames());
        upsampled.insert(upsampled.end(), up->left(), up->left() + produced);

        size_t back = down->process(up->left(), up->right(), produced);
        restored.insert(restored.end(), down->left(), down->left() + back);
    }

    // Output length stays in proportion to the rate ratio
    ASSERT_NEAR(static_cast<double>(upsampled.size()), 40.0 * BLOCK * DEVICE_RATE / SOURCE_RATE, 64.0);
    ASSERT_NEAR(static_cast<double>(restored.size()), 40.0 * BLOCK, 128.0);

    ASSERT_NEAR(measure_frequency(upsampled, DEVICE_RATE), FREQ, 5.0);
    ASSERT_NEAR(measure_frequency(restored, SOURCE_RATE), FREQ, 5.0);
}

TEST_CASE(test_resampler_reset_keeps_working) {
    auto resampler = audio::Resampler::create(48000, 44100, 1024);
    ASSERT_TRUE(resampler != nullptr);

    std::vector<float> input(1024, 0.25f);
    (void)resampler->process(input.data(), input.data(), input.size());
    resampler->reset();

    size_t total = 0;
    for (int i = 0; i < 8; ++i) {
        total += resampler->process(input.data(), input.data(), input.size());
    }
    ASSERT_NEAR(static_cast<double>(total), 8.0 * 1024 * 44100 / 48000, 64.0);
}

int main() {
    return lyre::test::TestRunner::instance().run_all();
}

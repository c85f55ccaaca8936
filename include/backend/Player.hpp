#pragma once

#include "audio/AudioEngine.hpp"
#include "audio/AudioOutput.hpp"
#include "audio/Messages.hpp"
#include "backend/Playable.hpp"
#include "model/Track.hpp"
#include "util/SpscQueue.hpp"
#include <memory>
#include <optional>
#include <string>

namespace lyre::backend {

/**
 * Player: control-thread façade over the audio engine.
 *
 * Owns both channel ends, the engine and the device output. Mutators are
 * fire-and-forget messages; what the engine actually did comes back through
 * update(), which the UI calls once per tick. Getters return the state as
 * of the last update().
 *
 * Not thread-safe: call everything from the control thread.
 */
class Player : public Playable {
public:
    static constexpr size_t COMMAND_CAPACITY = 64;
    static constexpr size_t REPORT_CAPACITY = 256;
    // Live voice plus the retired ones the engine can hold back. Past this
    // the engine would stall commands, so load() refuses instead.
    static constexpr size_t MAX_VOICES = audio::AudioEngine::RETIRED_BACKLOG + 1;

    explicit Player(std::unique_ptr<audio::AudioOutput> output);
    ~Player() override;

    Player(const Player&) = delete;
    Player& operator=(const Player&) = delete;

    // Opens the device. False if it can't be opened.
    bool start();

    // Playable
    bool replace(const model::Track& track) override;
    void seek(Duration position) override;
    [[nodiscard]] std::optional<Duration> elapsed() const override { return elapsed_; }
    [[nodiscard]] std::optional<Duration> duration() const override { return duration_; }
    [[nodiscard]] bool done() const override { return done_; }

    // Load track paused at position (session restore)
    void revive(const model::Track& track, Duration at);

    void toggle();
    void pause(bool paused);

    void mute();
    void unmute();
    void toggle_mute();

    // 0..100, clamped. Remembered while muted.
    void set_volume(int volume);
    void volume_up(int step);
    void volume_down(int step);

    [[nodiscard]] int volume() const { return volume_; }
    [[nodiscard]] bool paused() const { return status_ == audio::PlaybackStatus::Paused; }
    [[nodiscard]] bool muted() const { return muted_; }

    // Drain engine reports into the cached state
    void update();

    // Amplitude the engine multiplies samples by
    [[nodiscard]] float effective_amplitude() const;
    [[nodiscard]] bool resampling() const { return resampling_; }
    [[nodiscard]] const model::Track& track() const { return track_; }
    [[nodiscard]] int output_rate() const { return engine_.output_rate(); }

    // One-shot user-facing message (e.g. a file that wouldn't open)
    std::optional<std::string> take_alert();

private:
    bool load(const model::Track& track, Duration start, audio::PlaybackStatus status);
    bool send(audio::ToProcess&& message);
    void send_gain();

    // Declaration order is destruction order in reverse: the output stops
    // calling the engine before the engine and channels go away
    util::Channel<audio::ToProcess> commands_{COMMAND_CAPACITY};
    util::Channel<audio::FromProcess> reports_{REPORT_CAPACITY};
    util::Channel<audio::ToProcess>::Producer to_engine_;
    util::Channel<audio::FromProcess>::Consumer from_engine_;
    audio::AudioEngine engine_;
    std::unique_ptr<audio::AudioOutput> output_;

    audio::PlaybackStatus status_ = audio::PlaybackStatus::Paused;
    int volume_ = 50;
    bool muted_ = false;
    std::optional<Duration> elapsed_;
    std::optional<Duration> duration_;
    bool done_ = false;
    bool resampling_ = false;
    model::Track track_;
    std::optional<std::string> alert_;

    uint64_t generation_ = 0;
    size_t voices_in_flight_ = 0;
};

}  // namespace lyre::backend

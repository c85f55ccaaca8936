#include "backend/Player.hpp"
#include "audio/Resampler.hpp"
#include "audio/StreamSource.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <utility>
#include <variant>

namespace lyre::backend {

Player::Player(std::unique_ptr<audio::AudioOutput> output)
    : to_engine_(commands_.producer()),
      from_engine_(reports_.consumer()),
      engine_(commands_.consumer(), reports_.producer(), output->sample_rate()),
      output_(std::move(output)) {
    send_gain();
}

Player::~Player() {
    if (output_) {
        output_->stop();
    }
    util::Logger::debug("Player: Shut down");
}

bool Player::start() {
    util::Logger::info("Player: Opening output at " + std::to_string(engine_.output_rate()) + "Hz");
    bool ok = output_->start([this](float* data, size_t frames) {
        engine_.process(data, frames);
    });
    if (!ok) {
        util::Logger::error("Player: Could not open the audio device");
    }
    return ok;
}

bool Player::send(audio::ToProcess&& message) {
    if (!to_engine_.push(std::move(message))) {
        util::Logger::debug("Player: Command channel full, dropping message");
        return false;
    }
    return true;
}

void Player::send_gain() {
    const float gain = muted_ ? 0.0f : static_cast<float>(volume_) / 100.0f;
    send(audio::SetVolume{gain});
}

bool Player::load(const model::Track& track, Duration start, audio::PlaybackStatus status) {
    if (!track) {
        return false;
    }

    if (voices_in_flight_ >= MAX_VOICES) {
        update();
        if (voices_in_flight_ >= MAX_VOICES) {
            util::Logger::warn("Player: Engine hasn't released old streams yet, ignoring load");
            alert_ = "busy, try again";
            return false;
        }
    }

    auto source = audio::StreamSource::open(track.path(), start.count());
    if (!source) {
        alert_ = "couldn't play \"" + track.path() + "\"";
        return false;
    }

    std::unique_ptr<audio::Resampler> resampler;
    if (source->sample_rate() != engine_.output_rate()) {
        resampler = audio::Resampler::create(source->sample_rate(), engine_.output_rate(),
                                             audio::StreamSource::BLOCK_FRAMES);
        if (!resampler) {
            alert_ = "can't resample \"" + track.path() + "\"";
            return false;
        }
    }

    const double total = source->duration_seconds();
    const bool resampled = resampler != nullptr;

    auto voice = audio::Voice::make(std::move(source), std::move(resampler));
    voice->generation = ++generation_;

    if (!send(audio::UseStream{std::move(voice), status})) {
        alert_ = "player busy, try again";
        return false;
    }

    ++voices_in_flight_;
    track_ = track;
    status_ = status;
    elapsed_ = start;
    duration_ = total > 0.0 ? std::optional<Duration>(Duration(total)) : std::nullopt;
    done_ = false;
    resampling_ = resampled;

    util::Logger::info("Player: Loaded " + track.path() + (resampled ? " (resampled)" : ""));
    return true;
}

bool Player::replace(const model::Track& track) {
    return load(track, Duration::zero(), audio::PlaybackStatus::Play);
}

void Player::revive(const model::Track& track, Duration at) {
    load(track, at, audio::PlaybackStatus::Paused);
}

void Player::seek(Duration position) {
    if (!track_) return;

    position = std::max(position, Duration::zero());
    if (send(audio::SeekTo{position.count()})) {
        elapsed_ = position;
        done_ = false;
    }
}

void Player::toggle() {
    pause(!paused());
}

void Player::pause(bool paused) {
    const auto status = paused ? audio::PlaybackStatus::Paused : audio::PlaybackStatus::Play;
    if (send(audio::SetStatus{status})) {
        status_ = status;
    }
}

void Player::mute() {
    muted_ = true;
    send_gain();
}

void Player::unmute() {
    muted_ = false;
    send_gain();
}

void Player::toggle_mute() {
    if (muted_) {
        unmute();
    } else {
        mute();
    }
}

void Player::set_volume(int volume) {
    volume_ = std::clamp(volume, 0, 100);
    if (!muted_) {
        send_gain();
    }
}

void Player::volume_up(int step) {
    set_volume(volume_ + step);
}

void Player::volume_down(int step) {
    set_volume(volume_ - step);
}

float Player::effective_amplitude() const {
    if (muted_) return 0.0f;
    return audio::AudioEngine::amplitude(static_cast<float>(volume_) / 100.0f);
}

void Player::update() {
    audio::FromProcess report;
    while (from_engine_.pop(report)) {
        if (auto* playhead = std::get_if<audio::Playhead>(&report)) {
            if (playhead->generation == generation_) {
                elapsed_ = Duration(playhead->seconds);
            }
        } else if (auto* is_done = std::get_if<audio::IsDone>(&report)) {
            if (is_done->generation == generation_) {
                done_ = true;
            }
        } else if (auto* retired = std::get_if<audio::Retired>(&report)) {
            // Destroys the stream (and joins its worker) here, not in the callback
            retired->voice.reset();
            if (voices_in_flight_ > 0) {
                --voices_in_flight_;
            }
        }
    }
}

std::optional<std::string> Player::take_alert() {
    return std::exchange(alert_, std::nullopt);
}

}  // namespace lyre::backend

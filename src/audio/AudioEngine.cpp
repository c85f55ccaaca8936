#include "audio/AudioEngine.hpp"
#include <algorithm>
#include <cmath>

namespace lyre::audio {

std::unique_ptr<Voice> Voice::make(std::unique_ptr<StreamSource> source,
                                   std::unique_ptr<Resampler> resampler) {
    auto voice = std::make_unique<Voice>();
    voice->left.resize(StreamSource::BLOCK_FRAMES);
    voice->right.resize(StreamSource::BLOCK_FRAMES);

    size_t fanout_frames = StreamSource::BLOCK_FRAMES;
    if (resampler) {
        fanout_frames = std::max(fanout_frames, resampler->max_output_frames());
    }
    voice->fanout.resize(fanout_frames * AudioEngine::CHANNELS);

    voice->source = std::move(source);
    voice->resampler = std::move(resampler);
    return voice;
}

AudioEngine::AudioEngine(util::Channel<ToProcess>::Consumer commands,
                         util::Channel<FromProcess>::Producer reports,
                         int output_rate)
    : commands_(commands), reports_(reports), output_rate_(output_rate) {}

void AudioEngine::process(float* data, size_t frames) {
    flush_pending();

    // A command retires at most one voice; leave the rest queued until the
    // control thread has drained enough reports to free a backlog slot
    ToProcess message;
    while (has_backlog_room() && commands_.pop(message)) {
        handle(message);
    }
    flush_pending();

    float* out = data;
    size_t remaining = frames;

    if (voice_ && !done_ && status_ == PlaybackStatus::Play) {
        const float amp = amplitude(gain_);
        Voice& v = *voice_;

        while (remaining > 0) {
            if (v.fanout_len == 0) {
                const ReadStatus status = refill();
                if (status == ReadStatus::EndOfStream && v.fanout_len == 0) {
                    done_ = true;
                    done_pending_ = true;
                    done_generation_ = v.generation;
                    flush_pending();
                }
                if (v.fanout_len == 0) {
                    break;  // NotReady or finished: silence the rest
                }
            }

            const size_t n = std::min(remaining, v.fanout_len);
            const float* src = v.fanout.data() + v.fanout_pos * CHANNELS;
            for (size_t i = 0; i < n * CHANNELS; ++i) {
                out[i] = src[i] * amp;
            }
            out += n * CHANNELS;
            remaining -= n;
            v.fanout_pos += n;
            v.fanout_len -= n;
        }
    }

    std::fill(out, out + remaining * CHANNELS, 0.0f);

    if (voice_) {
        report_playhead();
    }
}

void AudioEngine::handle(ToProcess& message) {
    if (auto* use = std::get_if<UseStream>(&message)) {
        adopt(*use);
    } else if (auto* set = std::get_if<SetStatus>(&message)) {
        status_ = set->status;
    } else if (auto* volume = std::get_if<SetVolume>(&message)) {
        gain_ = std::clamp(volume->gain, 0.0f, 1.0f);
    } else if (auto* seek_to = std::get_if<SeekTo>(&message)) {
        seek(seek_to->seconds);
    }
}

void AudioEngine::adopt(UseStream& message) {
    retire(std::move(voice_));
    voice_ = std::move(message.voice);
    status_ = message.status;
    done_ = false;
    done_pending_ = false;
    if (voice_) {
        voice_->fanout_pos = 0;
        voice_->fanout_len = 0;
        report_playhead();
    }
}

void AudioEngine::seek(double seconds) {
    if (!voice_) return;

    StreamSource& source = *voice_->source;
    const long frame = std::lround(std::max(0.0, seconds) * source.sample_rate());
    source.seek(frame);
    voice_->fanout_pos = 0;
    voice_->fanout_len = 0;
    if (voice_->resampler) {
        voice_->resampler->reset();
    }
    done_ = false;
    done_pending_ = false;
    report_playhead();
}

ReadStatus AudioEngine::refill() {
    Voice& v = *voice_;
    v.fanout_pos = 0;
    v.fanout_len = 0;

    const ReadResult result = v.source->read(v.left.data(), v.right.data(), v.left.size());
    if (result.frames == 0) {
        return result.status;
    }

    const float* left = v.left.data();
    const float* right = v.right.data();
    size_t frames = result.frames;
    if (v.resampler) {
        frames = v.resampler->process(left, right, frames);
        left = v.resampler->left();
        right = v.resampler->right();
    }

    float* dst = v.fanout.data();
    for (size_t i = 0; i < frames; ++i) {
        dst[2 * i] = left[i];
        dst[2 * i + 1] = right[i];
    }
    v.fanout_len = frames;
    return result.status;
}

void AudioEngine::retire(VoicePtr voice) {
    if (!voice) return;

    FromProcess message = Retired{std::move(voice)};
    if (reports_.push(std::move(message))) {
        return;
    }

    // try_push leaves the value in place on failure. process() only handles
    // a command while has_backlog_room(), so a free slot exists.
    auto slot = std::find_if(backlog_.begin(), backlog_.end(),
                             [](const VoicePtr& held) { return !held; });
    *slot = std::move(std::get<Retired>(message).voice);
}

bool AudioEngine::has_backlog_room() const {
    return std::any_of(backlog_.begin(), backlog_.end(),
                       [](const VoicePtr& held) { return !held; });
}

void AudioEngine::flush_pending() {
    for (auto& slot : backlog_) {
        if (!slot) continue;
        FromProcess message = Retired{std::move(slot)};
        if (!reports_.push(std::move(message))) {
            slot = std::move(std::get<Retired>(message).voice);
            break;
        }
    }

    if (done_pending_) {
        FromProcess message = IsDone{done_generation_};
        if (reports_.push(std::move(message))) {
            done_pending_ = false;
        }
    }
}

void AudioEngine::report_playhead() {
    const StreamSource& source = *voice_->source;
    const int rate = source.sample_rate();
    if (rate <= 0) return;

    // Frames already pulled from the source but not yet played
    double buffered = static_cast<double>(voice_->fanout_len);
    if (voice_->resampler) {
        buffered = buffered * rate / output_rate_;
    }
    const double seconds = std::max(0.0, (static_cast<double>(source.position()) - buffered) / rate);

    FromProcess message = Playhead{seconds, voice_->generation};
    (void)reports_.push(std::move(message));
}

}  // namespace lyre::audio

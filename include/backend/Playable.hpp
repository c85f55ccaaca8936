#pragma once

#include "model/Track.hpp"
#include <chrono>
#include <optional>

namespace lyre::backend {

using Duration = std::chrono::duration<double>;

/// The part of the player the queue drives. Implemented by Player; tests
/// substitute a recording fake.
class Playable {
public:
    virtual ~Playable() = default;

    // Load track and start playing it. False leaves the current track playing.
    virtual bool replace(const model::Track& track) = 0;
    virtual void seek(Duration position) = 0;

    [[nodiscard]] virtual std::optional<Duration> elapsed() const = 0;
    [[nodiscard]] virtual std::optional<Duration> duration() const = 0;
    [[nodiscard]] virtual bool done() const = 0;
};

}  // namespace lyre::backend
